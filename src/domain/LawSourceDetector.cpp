/**
 * @file LawSourceDetector.cpp
 * @brief Implementation of LawSourceDetector.
 */

#include "domain/LawSourceDetector.hpp"
#include "domain/LegalPatterns.hpp"
#include "domain/Utf8Text.hpp"
#include <iostream>
#include <optional>
#include <regex>

namespace lexingest::domain {

namespace {
    std::optional<std::string> FirstCapture(const std::vector<std::regex>& patterns, const std::string& text) {
        for (const auto& pattern : patterns) {
            std::smatch match;
            if (std::regex_search(text, match, pattern)) {
                return utf8::Trim(match[1].str());
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> FirstSentence(const std::string& text) {
        std::string window = utf8::PrefixCodePoints(text, LawSourceDetector::kDescriptionWindow);
        std::string sentence = window.substr(0, window.find_first_of(".!?"));
        sentence = utf8::Trim(sentence);
        if (sentence.empty()) return std::nullopt;
        return sentence;
    }
}

LawSourceMetadata LawSourceDetector::detect(const std::string& text) {
    LawSourceMetadata detected;

    try {
        if (auto name = FirstCapture(LegalPatterns::LawNamePatterns(), text)) {
            detected.name = *name;
        }

        for (const auto& [pattern, type] : LegalPatterns::LawTypePatterns()) {
            if (std::regex_search(text, pattern)) {
                detected.type = type;
                break;
            }
        }

        detected.issuingAuthority = FirstCapture(LegalPatterns::IssuingAuthorityPatterns(), text);

        if (auto year = FirstCapture(LegalPatterns::YearPatterns(), text)) {
            detected.issueDate = utf8::ToAsciiDigits(*year) + "-01-01";
        }

        detected.description = FirstSentence(text);
    } catch (const std::exception& e) {
        std::cerr << "[LawSourceDetector] Failed to detect law source: " << e.what() << std::endl;
        return LawSourceMetadata{};
    }

    return detected;
}

LawSourceMetadata LawSourceDetector::merge(const LawSourceMetadata& detected, const LawSourceOverrides& provided) {
    LawSourceMetadata merged = detected;
    if (provided.name) merged.name = *provided.name;
    if (provided.type) merged.type = *provided.type;
    if (provided.jurisdiction) merged.jurisdiction = *provided.jurisdiction;
    if (provided.issuingAuthority) merged.issuingAuthority = provided.issuingAuthority;
    if (provided.issueDate) merged.issueDate = provided.issueDate;
    if (provided.lastUpdate) merged.lastUpdate = provided.lastUpdate;
    if (provided.description) merged.description = provided.description;
    if (provided.sourceUrl) merged.sourceUrl = provided.sourceUrl;
    return merged;
}

} // namespace lexingest::domain
