/**
 * @file ArabicOrdinals.hpp
 * @brief Lookup table from spelled-out Arabic ordinals to article numerals.
 */

#pragma once
#include <optional>
#include <string>
#include <unordered_map>

namespace lexingest::domain {

/**
 * @class ArabicOrdinals
 * @brief Immutable table of the feminine ordinals used to number articles.
 *
 * Covers 1..109 and 200..209: units, teens ("الحادية عشرة"), compound tens
 * ("الثالثة والعشرون"), and the "بعد المائة" / "بعد المائتين" forms.
 * Built once on first use and shared read-only by every caller.
 */
class ArabicOrdinals {
public:
    /** @brief Phrase (words separated by one space) to numeral. */
    static const std::unordered_map<std::string, int>& Table();

    /**
     * @brief Converts an ordinal phrase to its numeral.
     * @param phrase Phrase as found in the text; whitespace runs are collapsed first.
     * @return std::nullopt when the phrase is not in the table.
     */
    static std::optional<int> ToNumber(const std::string& phrase);

    /**
     * @brief Regex (no capture group) matching a whole ordinal phrase.
     *
     * Built from the words of the table rather than its phrases, so combinations
     * missing from the table ("العاشرة بعد المائة") still match in full and reach
     * ToNumber as unknown instead of being read as a shorter known prefix.
     * Spaces inside phrases match any run of whitespace.
     */
    static const std::string& PhrasePattern();
};

} // namespace lexingest::domain
