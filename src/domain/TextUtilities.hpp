/**
 * @file TextUtilities.hpp
 * @brief Interface for generic Arabic text normalization and keyword mining.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace lexingest::domain {

/**
 * @class TextUtilities
 * @brief Abstract collaborator used by the extractors for normalization and generic keywords.
 *
 * Implementations must be safe to call concurrently from several threads.
 */
class TextUtilities {
public:
    virtual ~TextUtilities() = default;

    /**
     * @brief Normalizes whitespace and punctuation of a block of text.
     * @param text UTF-8 input.
     * @return Normalized, trimmed text.
     */
    virtual std::string normalize(const std::string& text) const = 0;

    /**
     * @brief Mines generic keywords from text.
     * @param text UTF-8 input.
     * @param maxKeywords Upper bound on the returned list.
     * @return Unique keywords in order of first appearance.
     */
    virtual std::vector<std::string> extractGenericKeywords(const std::string& text, std::size_t maxKeywords) const = 0;
};

} // namespace lexingest::domain
