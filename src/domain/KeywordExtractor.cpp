#include "domain/KeywordExtractor.hpp"
#include "domain/LegalPatterns.hpp"
#include "domain/Utf8Text.hpp"
#include <algorithm>
#include <iostream>

namespace lexingest::domain {

KeywordExtractor::KeywordExtractor(std::shared_ptr<const TextUtilities> textUtilities)
    : m_textUtilities(std::move(textUtilities)) {}

std::vector<std::string> KeywordExtractor::extract(const std::string& content, std::size_t maxKeywords) const {
    try {
        std::vector<std::string> keywords;
        const std::string lowered = utf8::AsciiLower(content);

        for (const auto& term : LegalPatterns::LegalKeywords()) {
            if (lowered.find(term) != std::string::npos) {
                keywords.push_back(term);
            }
        }

        if (m_textUtilities) {
            for (const auto& keyword : m_textUtilities->extractGenericKeywords(content, maxKeywords)) {
                if (std::find(keywords.begin(), keywords.end(), keyword) == keywords.end()) {
                    keywords.push_back(keyword);
                }
            }
        }

        if (keywords.size() > maxKeywords) keywords.resize(maxKeywords);
        return keywords;
    } catch (const std::exception& e) {
        std::cerr << "[KeywordExtractor] Failed to extract keywords: " << e.what() << std::endl;
        return {};
    }
}

} // namespace lexingest::domain
