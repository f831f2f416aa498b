#include "domain/LegalPatterns.hpp"
#include "domain/ArabicOrdinals.hpp"
#include "domain/Utf8Text.hpp"
#include <string>

namespace lexingest::domain {

namespace {
    std::vector<std::regex> Compile(const std::vector<std::string>& sources) {
        std::vector<std::regex> patterns;
        patterns.reserve(sources.size());
        for (const auto& source : sources) {
            patterns.emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
        }
        return patterns;
    }

    // libstdc++ matches a lazy span with one recursion per byte, so every
    // free-text span is capped. Names and references are far shorter.
    constexpr int kMaxSpanBytes = 300;

    std::string Span() {
        return "(.{1," + std::to_string(kMaxSpanBytes) + "}?)";
    }

    std::string Digits() {
        return std::string(utf8::kDigitPattern) + "+";
    }

    std::string FourDigits() {
        const std::string d = utf8::kDigitPattern;
        return d + d + d + d;
    }
}

const std::vector<std::regex>& LegalPatterns::LawNamePatterns() {
    static const std::vector<std::regex> patterns = Compile({
        R"(نظام\s+)" + Span() + R"((?:\s+رقم|\s+لعام|\s+لسنة))",
        R"(مرسوم\s+)" + Span() + R"((?:\s+رقم|\s+لعام|\s+لسنة))",
        R"(قانون\s+)" + Span() + R"((?:\s+رقم|\s+لعام|\s+لسنة))",
        R"(لائحة\s+)" + Span() + R"((?:\s+رقم|\s+لعام|\s+لسنة))",
        R"(قرار\s+)" + Span() + R"((?:\s+رقم|\s+لعام|\s+لسنة))"
    });
    return patterns;
}

const std::vector<std::pair<std::regex, LawType>>& LegalPatterns::LawTypePatterns() {
    static const std::vector<std::pair<std::regex, LawType>> patterns = {
        {std::regex("نظام"), LawType::Law},
        {std::regex("مرسوم"), LawType::Decree},
        {std::regex("قانون"), LawType::Law},
        {std::regex("لائحة"), LawType::Regulation},
        {std::regex("قرار"), LawType::Directive}
    };
    return patterns;
}

const std::vector<std::regex>& LegalPatterns::IssuingAuthorityPatterns() {
    static const std::vector<std::regex> patterns = Compile({
        R"(وزارة\s+)" + Span() + R"((?:\s+و|\s+،|\s+\.|\s+\n))",
        R"(هيئة\s+)" + Span() + R"((?:\s+و|\s+،|\s+\.|\s+\n))",
        R"(مجلس\s+)" + Span() + R"((?:\s+و|\s+،|\s+\.|\s+\n))"
    });
    return patterns;
}

const std::vector<std::regex>& LegalPatterns::YearPatterns() {
    static const std::vector<std::regex> patterns = Compile({
        R"(لعام\s+()" + FourDigits() + ")",
        R"(لسنة\s+()" + FourDigits() + ")",
        R"(عام\s+()" + FourDigits() + ")",
        R"(سنة\s+()" + FourDigits() + ")"
    });
    return patterns;
}

const std::vector<std::regex>& LegalPatterns::ReferencePatterns() {
    static const std::vector<std::regex> patterns = Compile({
        R"(نظام\s+)" + Span() + R"((?:\s+رقم|\s+لعام))",
        R"(قانون\s+)" + Span() + R"((?:\s+رقم|\s+لعام))",
        R"(مرسوم\s+)" + Span() + R"((?:\s+رقم|\s+لعام))",
        R"(المادة\s+()" + Digits() + R"()\s+من\s+)" + Span() + R"((?:\s+رقم|\s+لعام))",
        R"(الفقرة\s+()" + Digits() + R"()\s+من\s+)" + Span() + R"((?:\s+رقم|\s+لعام))"
    });
    return patterns;
}

const std::regex& LegalPatterns::OrdinalArticleMarker() {
    static const std::regex marker(
        R"(المادة\s+()" + ArabicOrdinals::PhrasePattern() + R"()[:\.]?)",
        std::regex::ECMAScript | std::regex::optimize);
    return marker;
}

const std::vector<std::regex>& LegalPatterns::NumericArticleMarkers() {
    static const std::vector<std::regex> patterns = Compile({
        R"(المادة\s+()" + Digits() + R"()[:\.]?)",
        R"(مادة\s+()" + Digits() + R"()[:\.]?)",
        R"(الفقرة\s+()" + Digits() + R"()[:\.]?)",
        R"(البند\s+()" + Digits() + R"()[:\.]?)"
    });
    return patterns;
}

const std::vector<std::string>& LegalPatterns::LegalKeywords() {
    static const std::vector<std::string> keywords = {
        "حق", "واجب", "مسؤولية", "عقوبة", "غرامة", "سجن", "حظر", "منع",
        "إجازة", "ترخيص", "تصريح", "شهادة", "وثيقة", "عقد", "اتفاقية",
        "نظام", "قانون", "مرسوم", "قرار", "لائحة", "تعليمات", "إجراءات",
        "محكمة", "قاضي", "محامي", "شاهد", "دليل", "إثبات", "براءة",
        "ذنب", "جريمة", "جنحة", "مخالفة", "عقاب", "تعزير", "حد",
        "تعويض", "ضرر", "خسارة", "فائدة", "ربح", "مصلحة", "منفعة"
    };
    return keywords;
}

} // namespace lexingest::domain
