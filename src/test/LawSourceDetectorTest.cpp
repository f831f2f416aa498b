#include <cassert>
#include <iostream>

#include "domain/LawSourceDetector.hpp"

using namespace lexingest::domain;

int main() {
    std::cout << "[Test] Starting LawSourceDetector Test..." << std::endl;

    std::cout << "[Test] Empty text yields defaults..." << std::endl;
    {
        auto source = LawSourceDetector::detect("");
        assert(source.name == LawSourceMetadata::kDefaultName);
        assert(source.type == LawType::Law);
        assert(source.jurisdiction == LawSourceMetadata::kDefaultJurisdiction);
        assert(!source.issuingAuthority && !source.issueDate && !source.description);
    }

    std::cout << "[Test] Detecting a law header..." << std::endl;
    {
        auto source = LawSourceDetector::detect(
            "نظام العمل الصادر بالمرسوم الملكي رقم م/51 لعام 2005 عن وزارة العمل والتنمية الاجتماعية. "
            "المادة الأولى: يسمى هذا النظام نظام العمل.");
        assert(source.name == "العمل الصادر بالمرسوم الملكي");
        assert(source.type == LawType::Law);
        assert(source.issuingAuthority == std::string("العمل"));
        assert(source.issueDate == std::string("2005-01-01"));
        assert(source.description.has_value());
        assert(source.description->rfind("نظام العمل", 0) == 0);
        assert(source.description->find("المادة") == std::string::npos && "Description stops at the first period.");
    }

    std::cout << "[Test] Type priority and Arabic-Indic years..." << std::endl;
    {
        auto decree = LawSourceDetector::detect("مرسوم تنظيم الجمعيات رقم 8 لسنة ١٩٩٩");
        assert(decree.type == LawType::Decree);
        assert(decree.name == "تنظيم الجمعيات");
        assert(decree.issueDate == std::string("1999-01-01"));

        auto regulation = LawSourceDetector::detect("لائحة الجزاءات رقم 3");
        assert(regulation.type == LawType::Regulation);

        auto directive = LawSourceDetector::detect("قرار وزاري بشأن ساعات العمل");
        assert(directive.type == LawType::Directive);
        assert(directive.name == LawSourceMetadata::kDefaultName);
    }

    std::cout << "[Test] Very long single-line text..." << std::endl;
    {
        std::string text = "نظام ";
        while (text.size() < 100 * 1024) {
            text += "العمل والعمال في المنشآت الخاصة ";
        }
        text += "رقم 51 لعام 2005";
        auto source = LawSourceDetector::detect(text);
        assert(source.name == LawSourceMetadata::kDefaultName && "An unbounded name is not a name.");
        assert(source.issueDate == std::string("2005-01-01"));
    }

    std::cout << "[Test] Merging overrides..." << std::endl;
    {
        auto detected = LawSourceDetector::detect("نظام المرور رقم 85");
        assert(detected.name == "المرور");

        LawSourceOverrides named;
        named.name = "X";
        assert(LawSourceDetector::merge(detected, named).name == "X");

        LawSourceOverrides empty;
        auto kept = LawSourceDetector::merge(detected, empty);
        assert(kept.name == "المرور");
        assert(kept.jurisdiction == LawSourceMetadata::kDefaultJurisdiction);

        LawSourceOverrides typed;
        typed.type = LawType::Decree;
        typed.sourceUrl = "https://laws.boe.gov.sa/";
        auto merged = LawSourceDetector::merge(detected, typed);
        assert(merged.type == LawType::Decree);
        assert(merged.sourceUrl == std::string("https://laws.boe.gov.sa/"));
        assert(merged.name == "المرور");
    }

    std::cout << "[PASS] LawSourceDetector Test passed." << std::endl;
    return 0;
}
