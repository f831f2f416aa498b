/**
 * @file ArticleExtractor.cpp
 * @brief Implementation of ArticleExtractor.
 */

#include "domain/ArticleExtractor.hpp"
#include "domain/ArabicOrdinals.hpp"
#include "domain/LegalPatterns.hpp"
#include "domain/ReferenceExtractor.hpp"
#include "domain/Utf8Text.hpp"
#include <algorithm>
#include <iostream>
#include <regex>
#include <utility>

namespace lexingest::domain {

namespace {
    std::string CanonicalNumber(const std::string& numeral) {
        return std::string(Article::kNumberPrefix) + " " + numeral;
    }

    bool Overlaps(std::size_t begin, std::size_t end, const std::pair<std::size_t, std::size_t>& range) {
        return begin < range.second && range.first < end;
    }
}

ArticleExtractor::ArticleExtractor(std::shared_ptr<const TextUtilities> textUtilities, std::size_t maxKeywords)
    : m_textUtilities(textUtilities),
      m_keywordExtractor(std::move(textUtilities)),
      m_maxKeywords(maxKeywords) {}

std::vector<Article> ArticleExtractor::extract(const std::string& text) const {
    try {
        std::vector<Article> articles = extractOrdinal(text);
        if (articles.empty()) {
            articles = extractNumeric(text);
        }

        std::stable_sort(articles.begin(), articles.end(), [](const Article& a, const Article& b) {
            return SortKey(a.articleNumber) < SortKey(b.articleNumber);
        });
        return articles;
    } catch (const std::exception& e) {
        std::cerr << "[ArticleExtractor] Failed to extract articles: " << e.what() << std::endl;
        return {};
    }
}

long long ArticleExtractor::SortKey(const std::string& articleNumber) {
    static const std::regex numberPattern(R"(المادة\s+([0-9]+))");
    std::smatch match;
    if (!std::regex_search(articleNumber, match, numberPattern)) return 0;
    try {
        return std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return 0;
    }
}

std::vector<Article> ArticleExtractor::extractOrdinal(const std::string& text) const {
    std::vector<Marker> markers;
    std::vector<std::size_t> boundaries;

    const auto& pattern = LegalPatterns::OrdinalArticleMarker();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        const std::string phrase = utf8::CollapseWhitespace(utf8::Trim(match[1].str()));

        Marker marker;
        marker.begin = static_cast<std::size_t>(match.position(0));
        marker.end = marker.begin + static_cast<std::size_t>(match.length(0));
        if (auto number = ArabicOrdinals::ToNumber(phrase)) {
            marker.number = std::to_string(*number);
        } else {
            // Left as the raw phrase so the article survives; it sorts first.
            std::cerr << "[ArticleExtractor] WARNING: Ordinal not in lookup table, kept as written: " << phrase << std::endl;
            marker.number = phrase;
        }
        boundaries.push_back(marker.begin);
        markers.push_back(std::move(marker));
    }

    std::vector<Article> articles;
    appendArticles(text, markers, std::move(boundaries), articles);
    return articles;
}

std::vector<Article> ArticleExtractor::extractNumeric(const std::string& text) const {
    std::vector<Article> articles;
    std::vector<std::pair<std::size_t, std::size_t>> claimed;

    for (const auto& pattern : LegalPatterns::NumericArticleMarkers()) {
        std::vector<Marker> markers;
        std::vector<std::size_t> boundaries;

        for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it) {
            const auto& match = *it;
            std::size_t begin = static_cast<std::size_t>(match.position(0));
            std::size_t end = begin + static_cast<std::size_t>(match.length(0));

            // "مادة 5" inside an already read "المادة 5" still ends the previous body but is not re-read.
            auto owner = std::find_if(claimed.begin(), claimed.end(), [&](const auto& range) {
                return Overlaps(begin, end, range);
            });
            if (owner != claimed.end()) {
                boundaries.push_back(std::min(begin, owner->first));
                continue;
            }

            boundaries.push_back(begin);
            markers.push_back(Marker{begin, end, utf8::ToAsciiDigits(match[1].str())});
        }

        for (const auto& marker : markers) {
            claimed.emplace_back(marker.begin, marker.end);
        }
        appendArticles(text, markers, std::move(boundaries), articles);
    }

    return articles;
}

void ArticleExtractor::appendArticles(const std::string& text,
                                      const std::vector<Marker>& markers,
                                      std::vector<std::size_t> boundaries,
                                      std::vector<Article>& out) const {
    std::sort(boundaries.begin(), boundaries.end());

    for (const auto& marker : markers) {
        auto next = std::upper_bound(boundaries.begin(), boundaries.end(), marker.begin);
        std::size_t stop = (next == boundaries.end()) ? text.size() : *next;
        if (stop < marker.end) stop = marker.end;

        std::string content = utf8::Trim(text.substr(marker.end, stop - marker.end));
        if (utf8::CodePointCount(content) < kMinContentLength) {
            continue;
        }

        if (m_textUtilities) {
            content = m_textUtilities->normalize(content);
        }

        Article article;
        article.articleNumber = CanonicalNumber(marker.number);
        article.keywords = m_keywordExtractor.extract(content, m_maxKeywords);
        article.relatedReferences = ReferenceExtractor::extract(content);
        article.content = std::move(content);
        out.push_back(std::move(article));
    }
}

} // namespace lexingest::domain
