#include "domain/ReferenceExtractor.hpp"
#include "domain/LegalPatterns.hpp"
#include "domain/Utf8Text.hpp"
#include <algorithm>
#include <iostream>
#include <regex>

namespace lexingest::domain {

std::vector<std::string> ReferenceExtractor::extract(const std::string& content) {
    try {
        std::vector<std::string> references;
        for (const auto& pattern : LegalPatterns::ReferencePatterns()) {
            auto begin = std::sregex_iterator(content.begin(), content.end(), pattern);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                std::string reference = utf8::Trim(it->str());
                if (std::find(references.begin(), references.end(), reference) == references.end()) {
                    references.push_back(std::move(reference));
                }
            }
        }
        return references;
    } catch (const std::exception& e) {
        std::cerr << "[ReferenceExtractor] Failed to extract references: " << e.what() << std::endl;
        return {};
    }
}

} // namespace lexingest::domain
