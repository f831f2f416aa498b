/**
 * @file ArabicTextUtilities.cpp
 * @brief Implementation of ArabicTextUtilities.
 */

#include "infrastructure/ArabicTextUtilities.hpp"
#include "domain/Utf8Text.hpp"
#include <algorithm>
#include <unordered_set>

namespace lexingest::infrastructure {

namespace {
    const std::unordered_set<std::string>& StopWords() {
        static const std::unordered_set<std::string> words = {
            "في", "من", "إلى", "على", "هذا", "هذه", "ذلك", "تلك", "التي", "الذي",
            "الذين", "اللاتي", "اللائي", "اللذان", "اللتان", "اللذين", "اللتين",
            "هو", "هي", "هم", "هن", "أنت", "أنتم", "أنتن", "أنا", "نحن",
            "كان", "كانت", "كانوا", "كن", "يكون", "تكون", "يكونون", "تكونون",
            "له", "لها", "لهم", "لهن"
        };
        return words;
    }

    // Lead bytes 0xD8..0xDB encode U+0600..U+06FF.
    bool IsArabicLead(unsigned char c) {
        return c >= 0xD8 && c <= 0xDB;
    }

    bool IsContinuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }

    std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
        std::size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
        return text;
    }

    std::string CollapseDots(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        std::size_t i = 0;
        while (i < text.size()) {
            if (text[i] != '.') {
                out.push_back(text[i++]);
                continue;
            }
            std::size_t run = 0;
            while (i < text.size() && text[i] == '.') { ++run; ++i; }
            out += (run >= 2) ? "..." : ".";
        }
        return out;
    }

    std::vector<std::string> ArabicTokens(const std::string& text) {
        std::vector<std::string> tokens;
        std::string current;
        for (std::size_t i = 0; i < text.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (IsArabicLead(c) && i + 1 < text.size() && IsContinuation(static_cast<unsigned char>(text[i + 1]))) {
                current.push_back(text[i]);
                current.push_back(text[i + 1]);
                ++i;
                continue;
            }
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        }
        if (!current.empty()) tokens.push_back(current);
        return tokens;
    }
}

std::string ArabicTextUtilities::normalize(const std::string& text) const {
    if (text.empty()) return text;

    std::string out = domain::utf8::CollapseWhitespace(text);
    out = ReplaceAll(out, "،", ",");
    out = ReplaceAll(out, "“", "\"");
    out = ReplaceAll(out, "”", "\"");
    out = ReplaceAll(out, "‘", "'");
    out = ReplaceAll(out, "’", "'");
    out = CollapseDots(out);
    return domain::utf8::Trim(out);
}

std::vector<std::string> ArabicTextUtilities::extractGenericKeywords(const std::string& text, std::size_t maxKeywords) const {
    std::vector<std::string> keywords;
    if (text.empty() || !ContainsArabic(text)) return keywords;

    const auto& stopWords = StopWords();
    for (const auto& token : ArabicTokens(normalize(text))) {
        if (keywords.size() >= maxKeywords) break;
        if (domain::utf8::CodePointCount(token) < 3) continue;
        if (stopWords.count(token)) continue;
        if (std::find(keywords.begin(), keywords.end(), token) != keywords.end()) continue;
        keywords.push_back(token);
    }
    return keywords;
}

bool ArabicTextUtilities::ContainsArabic(const std::string& text) {
    for (std::size_t i = 0; i + 1 < text.size(); ++i) {
        if (IsArabicLead(static_cast<unsigned char>(text[i])) && IsContinuation(static_cast<unsigned char>(text[i + 1]))) {
            return true;
        }
    }
    return false;
}

} // namespace lexingest::infrastructure
