/**
 * @file ReferenceExtractor.hpp
 * @brief Extraction of cross-references to other legal instruments.
 */

#pragma once
#include <string>
#include <vector>

namespace lexingest::domain {

class ReferenceExtractor {
public:
    /**
     * @brief Collects every reference pattern match in the content.
     * @param content Article content.
     * @return Unique references in pattern order, then text order. Empty on internal error.
     */
    static std::vector<std::string> extract(const std::string& content);
};

} // namespace lexingest::domain
