/**
 * @file ArabicTextUtilities.hpp
 * @brief Default TextUtilities for Arabic legal prose.
 */

#pragma once
#include "domain/TextUtilities.hpp"

namespace lexingest::infrastructure {

/**
 * @class ArabicTextUtilities
 * @brief Whitespace/punctuation normalization and stop-word filtered keyword mining.
 *
 * Stateless; safe to share between threads.
 */
class ArabicTextUtilities : public domain::TextUtilities {
public:
    std::string normalize(const std::string& text) const override;
    std::vector<std::string> extractGenericKeywords(const std::string& text, std::size_t maxKeywords) const override;

    /** @brief Whether the text contains any code point of the Arabic block (U+0600..U+06FF). */
    static bool ContainsArabic(const std::string& text);
};

} // namespace lexingest::infrastructure
