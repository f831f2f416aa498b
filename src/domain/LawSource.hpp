/**
 * @file LawSource.hpp
 * @brief Domain value types describing the legal instrument a document represents.
 */

#pragma once
#include <optional>
#include <string>

namespace lexingest::domain {

/**
 * @enum LawType
 * @brief Category of a legal instrument.
 */
enum class LawType {
    Law,
    Decree,
    Regulation,
    Directive
};

inline std::string LawTypeToString(LawType type) {
    switch (type) {
        case LawType::Law: return "law";
        case LawType::Decree: return "decree";
        case LawType::Regulation: return "regulation";
        case LawType::Directive: return "directive";
    }
    return "law";
}

/**
 * @brief Parses the wire name of a LawType.
 * @return std::nullopt for an unknown name.
 */
inline std::optional<LawType> LawTypeFromString(const std::string& value) {
    if (value == "law") return LawType::Law;
    if (value == "decree") return LawType::Decree;
    if (value == "regulation") return LawType::Regulation;
    if (value == "directive") return LawType::Directive;
    return std::nullopt;
}

/**
 * @struct LawSourceMetadata
 * @brief Metadata of the law source. Name, type and jurisdiction always carry a value.
 */
struct LawSourceMetadata {
    static constexpr const char* kDefaultName = "وثيقة قانونية";
    static constexpr const char* kDefaultJurisdiction = "المملكة العربية السعودية";

    std::string name = kDefaultName;
    LawType type = LawType::Law;
    std::string jurisdiction = kDefaultJurisdiction;
    std::optional<std::string> issuingAuthority;
    std::optional<std::string> issueDate;   ///< ISO date, YYYY-MM-DD.
    std::optional<std::string> lastUpdate;
    std::optional<std::string> description;
    std::optional<std::string> sourceUrl;
};

/**
 * @struct LawSourceOverrides
 * @brief Caller-supplied partial metadata. Every present field wins over detection.
 */
struct LawSourceOverrides {
    std::optional<std::string> name;
    std::optional<LawType> type;
    std::optional<std::string> jurisdiction;
    std::optional<std::string> issuingAuthority;
    std::optional<std::string> issueDate;
    std::optional<std::string> lastUpdate;
    std::optional<std::string> description;
    std::optional<std::string> sourceUrl;
};

} // namespace lexingest::domain
