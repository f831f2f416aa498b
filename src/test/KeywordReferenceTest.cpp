#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>

#include "domain/KeywordExtractor.hpp"
#include "domain/ReferenceExtractor.hpp"
#include "infrastructure/ArabicTextUtilities.hpp"

using namespace lexingest::domain;
using lexingest::infrastructure::ArabicTextUtilities;

namespace {
    bool Contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }
}

int main() {
    std::cout << "[Test] Starting Keyword/Reference Test..." << std::endl;

    auto utilities = std::make_shared<ArabicTextUtilities>();

    std::cout << "[Test] Dictionary keywords..." << std::endl;
    {
        KeywordExtractor extractor(utilities);
        auto keywords = extractor.extract("يبرم عقد العمل كتابة بين الطرفين.");
        assert(Contains(keywords, "عقد"));
        assert(keywords.size() <= KeywordExtractor::kDefaultMaxKeywords);

        std::vector<std::string> sorted = keywords;
        std::sort(sorted.begin(), sorted.end());
        assert(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end() && "Keywords are unique.");
    }

    std::cout << "[Test] Generic keywords fill after dictionary hits..." << std::endl;
    {
        KeywordExtractor extractor(utilities);
        auto keywords = extractor.extract("تلتزم المنشأة بتدريب العمال وتأهيلهم في هذه المنشأة", 3);
        assert(keywords.size() == 3);
        assert(keywords[0] == "تلتزم");
        assert(keywords[1] == "المنشأة");
        assert(!Contains(keywords, "هذه") && "Stop words are skipped.");
    }

    std::cout << "[Test] Extractor without text utilities..." << std::endl;
    {
        KeywordExtractor extractor(nullptr);
        auto keywords = extractor.extract("تفرض غرامة على المخالف");
        assert(keywords.size() == 1 && keywords[0] == "غرامة");
        assert(extractor.extract("").empty());
    }

    std::cout << "[Test] References..." << std::endl;
    {
        auto references = ReferenceExtractor::extract("تطبق العقوبات استناداً إلى نظام العمل رقم 51 وتعديلاته");
        assert(!references.empty());
        assert(references[0].rfind("نظام العمل", 0) == 0);

        auto cited = ReferenceExtractor::extract("مع مراعاة المادة 7 من نظام التأمينات رقم 33 ونظام التأمينات رقم 33");
        assert(Contains(cited, "المادة 7 من نظام التأمينات رقم"));
        assert(std::count(cited.begin(), cited.end(), "نظام التأمينات رقم") == 1 && "References are unique.");

        assert(ReferenceExtractor::extract("لا توجد إحالات هنا").empty());
    }

    std::cout << "[Test] References in a very long single line..." << std::endl;
    {
        std::string content = "وفقا لأحكام نظام ";
        while (content.size() < 100 * 1024) {
            content += "العمل والعمال في المنشآت الخاصة ";
        }
        assert(ReferenceExtractor::extract(content).empty());

        content += "ونظام التأمينات الاجتماعية رقم 33";
        auto references = ReferenceExtractor::extract(content);
        assert(references.size() == 1 && references[0] == "نظام التأمينات الاجتماعية رقم");
    }

    std::cout << "[PASS] Keyword/Reference Test passed." << std::endl;
    return 0;
}
