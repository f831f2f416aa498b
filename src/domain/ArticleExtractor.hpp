/**
 * @file ArticleExtractor.hpp
 * @brief Segmentation of raw Arabic legal text into numbered articles.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "Article.hpp"
#include "KeywordExtractor.hpp"
#include "TextUtilities.hpp"

namespace lexingest::domain {

/**
 * @class ArticleExtractor
 * @brief Two-pass segmenter: spelled-out ordinal markers first, numeric markers as fallback.
 *
 * Bodies shorter than kMinContentLength code points are dropped as noise.
 * The result is sorted ascending by article numeral; unparsable numbers sort as 0.
 */
class ArticleExtractor {
public:
    static constexpr std::size_t kMinContentLength = 11;

    explicit ArticleExtractor(std::shared_ptr<const TextUtilities> textUtilities,
                              std::size_t maxKeywords = KeywordExtractor::kDefaultMaxKeywords);

    /**
     * @brief Segments the text into articles.
     * @param text Raw document text.
     * @return Ordered articles; empty when nothing matched or on internal error. Never throws.
     */
    std::vector<Article> extract(const std::string& text) const;

    /** @brief Integer embedded in a canonical article number, 0 when there is none. */
    static long long SortKey(const std::string& articleNumber);

private:
    struct Marker {
        std::size_t begin;
        std::size_t end;        ///< First byte of the body.
        std::string number;
    };

    std::vector<Article> extractOrdinal(const std::string& text) const;
    std::vector<Article> extractNumeric(const std::string& text) const;

    /** @brief Cuts one article per marker, each body running to the next boundary. */
    void appendArticles(const std::string& text,
                        const std::vector<Marker>& markers,
                        std::vector<std::size_t> boundaries,
                        std::vector<Article>& out) const;

    std::shared_ptr<const TextUtilities> m_textUtilities;
    KeywordExtractor m_keywordExtractor;
    std::size_t m_maxKeywords;
};

} // namespace lexingest::domain
