/**
 * @file ArabicOrdinals.cpp
 * @brief Implementation of ArabicOrdinals.
 */

#include "domain/ArabicOrdinals.hpp"
#include "domain/Utf8Text.hpp"
#include <algorithm>
#include <array>
#include <vector>

namespace lexingest::domain {

namespace {
    // Index i holds the ordinal of i + 1.
    const std::array<const char*, 10> kUnits = {
        "الأولى", "الثانية", "الثالثة", "الرابعة", "الخامسة",
        "السادسة", "السابعة", "الثامنة", "التاسعة", "العاشرة"
    };

    // Form of the unit when it is the first word of a compound (11, 21, 101...).
    const std::array<const char*, 9> kCompoundUnits = {
        "الحادية", "الثانية", "الثالثة", "الرابعة", "الخامسة",
        "السادسة", "السابعة", "الثامنة", "التاسعة"
    };

    // Index i holds the tens word of (i + 2) * 10, with and without the definite article.
    const std::array<const char*, 8> kTens = {
        "العشرون", "الثلاثون", "الأربعون", "الخمسون",
        "الستون", "السبعون", "الثمانون", "التسعون"
    };
    const std::array<const char*, 8> kJoinedTens = {
        "والعشرون", "والثلاثون", "والأربعون", "والخمسون",
        "والستون", "والسبعون", "والثمانون", "والتسعون"
    };

    std::unordered_map<std::string, int> BuildTable() {
        std::unordered_map<std::string, int> table;

        for (std::size_t i = 0; i < kUnits.size(); ++i) {
            table.emplace(kUnits[i], static_cast<int>(i) + 1);
        }
        for (std::size_t i = 0; i < kCompoundUnits.size(); ++i) {
            table.emplace(std::string(kCompoundUnits[i]) + " عشرة", 11 + static_cast<int>(i));
        }
        for (std::size_t t = 0; t < kTens.size(); ++t) {
            int tens = (static_cast<int>(t) + 2) * 10;
            table.emplace(kTens[t], tens);
            for (std::size_t i = 0; i < kCompoundUnits.size(); ++i) {
                table.emplace(std::string(kCompoundUnits[i]) + " " + kJoinedTens[t], tens + static_cast<int>(i) + 1);
            }
        }

        table.emplace("المائة", 100);
        table.emplace("المائتان", 200);
        for (std::size_t i = 0; i < kCompoundUnits.size(); ++i) {
            table.emplace(std::string(kCompoundUnits[i]) + " بعد المائة", 101 + static_cast<int>(i));
            table.emplace(std::string(kCompoundUnits[i]) + " بعد المائتين", 201 + static_cast<int>(i));
        }
        return table;
    }

    // Alternation of literal words, longest first so a word is never cut at a shorter one.
    template <typename Words>
    std::string WordAlternation(const Words& words) {
        std::vector<std::string> sorted(words.begin(), words.end());
        std::sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
            if (a.size() != b.size()) return a.size() > b.size();
            return a < b;
        });
        sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

        std::string alternation = "(?:";
        for (std::size_t i = 0; i < sorted.size(); ++i) {
            if (i > 0) alternation += '|';
            alternation += sorted[i];
        }
        return alternation + ")";
    }

    std::string BuildPhrasePattern() {
        std::vector<std::string> heads(kUnits.begin(), kUnits.end());
        heads.insert(heads.end(), kCompoundUnits.begin(), kCompoundUnits.end());
        heads.insert(heads.end(), kTens.begin(), kTens.end());
        heads.push_back("المائة");
        heads.push_back("المائتان");

        // Head word, then the optional teen, joined-tens and hundreds parts in that order.
        // The whole phrase has to end at whitespace, a separator or the end of the text.
        // "،" is two bytes and stays outside the bracket class.
        return WordAlternation(heads)
            + R"((?:\s+عشرة)?)"
            + R"((?:\s+)" + WordAlternation(kJoinedTens) + ")?"
            + R"((?:\s+بعد\s+(?:المائتين|المائة))?)"
            + R"((?=\s|[:\.]|،|$))";
    }
}

const std::unordered_map<std::string, int>& ArabicOrdinals::Table() {
    static const std::unordered_map<std::string, int> table = BuildTable();
    return table;
}

std::optional<int> ArabicOrdinals::ToNumber(const std::string& phrase) {
    const auto& table = Table();
    auto it = table.find(utf8::CollapseWhitespace(utf8::Trim(phrase)));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

const std::string& ArabicOrdinals::PhrasePattern() {
    static const std::string pattern = BuildPhrasePattern();
    return pattern;
}

} // namespace lexingest::domain
