/**
 * @file KeywordExtractor.hpp
 * @brief Extraction of legal keywords from article content.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "TextUtilities.hpp"

namespace lexingest::domain {

/**
 * @class KeywordExtractor
 * @brief Dictionary terms first, then generic keywords from the text utilities.
 */
class KeywordExtractor {
public:
    static constexpr std::size_t kDefaultMaxKeywords = 10;

    explicit KeywordExtractor(std::shared_ptr<const TextUtilities> textUtilities);

    /**
     * @brief Extracts keywords from one article body.
     * @param content Article content.
     * @param maxKeywords Upper bound on the returned list.
     * @return Unique keywords, dictionary terms in dictionary order first. Empty on internal error.
     */
    std::vector<std::string> extract(const std::string& content, std::size_t maxKeywords = kDefaultMaxKeywords) const;

private:
    std::shared_ptr<const TextUtilities> m_textUtilities;
};

} // namespace lexingest::domain
