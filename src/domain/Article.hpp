/**
 * @file Article.hpp
 * @brief Domain entity for one numbered article of a legal document.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lexingest::domain {

/**
 * @struct Article
 * @brief A segmented article. articleNumber is always in the canonical "المادة {N}" form.
 */
struct Article {
    static constexpr const char* kNumberPrefix = "المادة";

    std::string articleNumber;
    std::optional<std::string> title;            ///< Never populated by extraction.
    std::string content;
    std::vector<std::string> keywords;
    std::vector<std::string> relatedReferences;
};

} // namespace lexingest::domain
