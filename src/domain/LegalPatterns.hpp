/**
 * @file LegalPatterns.hpp
 * @brief Prioritized pattern tables for Arabic legal text.
 *
 * Every list is scanned in order and the order is part of the behavior:
 * reordering entries silently changes detected output.
 */

#pragma once
#include <regex>
#include <string>
#include <utility>
#include <vector>
#include "LawSource.hpp"

namespace lexingest::domain {

class LegalPatterns {
public:
    /** @brief "نظام|مرسوم|قانون|لائحة|قرار" + name up to رقم/لعام/لسنة. Group 1 is the name. */
    static const std::vector<std::regex>& LawNamePatterns();

    /** @brief Keyword to law type, first match wins. */
    static const std::vector<std::pair<std::regex, LawType>>& LawTypePatterns();

    /** @brief "وزارة|هيئة|مجلس" + name. Group 1 is the authority name. */
    static const std::vector<std::regex>& IssuingAuthorityPatterns();

    /** @brief "لعام|لسنة|عام|سنة" + four digits. Group 1 is the year. */
    static const std::vector<std::regex>& YearPatterns();

    /** @brief Cross-reference patterns; the whole match is the reference. */
    static const std::vector<std::regex>& ReferencePatterns();

    /** @brief "المادة" + ordinal phrase + optional separator. Group 1 is the phrase. */
    static const std::regex& OrdinalArticleMarker();

    /**
     * @brief Numeric article markers in fallback order: المادة, مادة, الفقرة, البند.
     * Group 1 is the number.
     */
    static const std::vector<std::regex>& NumericArticleMarkers();

    /** @brief Dictionary of legal terms looked up as substrings of article content. */
    static const std::vector<std::string>& LegalKeywords();
};

} // namespace lexingest::domain
