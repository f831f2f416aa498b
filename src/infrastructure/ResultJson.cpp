/**
 * @file ResultJson.cpp
 * @brief Implementation of ResultJson.
 */

#include "infrastructure/ResultJson.hpp"
#include "domain/LegalDocumentError.hpp"

namespace lexingest::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::LegalDocumentError;

namespace {
    json OptionalToJson(const std::optional<std::string>& value) {
        return value ? json(*value) : json(nullptr);
    }

    std::optional<std::string> ReadOptionalString(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        if (!it->is_string()) {
            throw LegalDocumentError(ErrorKind::InvalidInput,
                                     std::string("Override field must be a string: ") + key,
                                     {}, std::string(key), {{"value", it->dump()}});
        }
        return it->get<std::string>();
    }
}

json ResultJson::ToJson(const domain::LawSourceMetadata& source) {
    return {
        {"name", source.name},
        {"type", domain::LawTypeToString(source.type)},
        {"jurisdiction", source.jurisdiction},
        {"issuing_authority", OptionalToJson(source.issuingAuthority)},
        {"issue_date", OptionalToJson(source.issueDate)},
        {"last_update", OptionalToJson(source.lastUpdate)},
        {"description", OptionalToJson(source.description)},
        {"source_url", OptionalToJson(source.sourceUrl)}
    };
}

json ResultJson::ToJson(const domain::Article& article) {
    return {
        {"article_number", article.articleNumber},
        {"title", OptionalToJson(article.title)},
        {"content", article.content},
        {"keywords", article.keywords},
        {"related_references", article.relatedReferences}
    };
}

json ResultJson::ToJson(const domain::ProcessingResult& result) {
    json articles = json::array();
    for (const auto& article : result.articles) {
        articles.push_back(ToJson(article));
    }

    return {
        {"law_source", ToJson(result.lawSource)},
        {"articles", articles},
        {"statistics", {
            {"total_articles", result.statistics.totalArticles},
            {"total_characters", result.statistics.totalCharacters},
            {"processing_time", result.statistics.processingTime},
            {"file_path", result.statistics.filePath}
        }}
    };
}

json ResultJson::ToJson(const domain::BatchResult& batch) {
    json entries = json::array();
    for (const auto& entry : batch.results) {
        entries.push_back({
            {"file_path", entry.filePath},
            {"success", entry.success},
            {"data", entry.data ? ToJson(*entry.data) : json(nullptr)},
            {"error", OptionalToJson(entry.error)}
        });
    }

    return {
        {"results", entries},
        {"statistics", {
            {"total_files", batch.totalFiles},
            {"successful", batch.successful},
            {"failed", batch.failed}
        }}
    };
}

domain::LawSourceOverrides ResultJson::OverridesFromJson(const json& j) {
    if (!j.is_object()) {
        throw LegalDocumentError(ErrorKind::InvalidInput, "Law source overrides must be a JSON object");
    }

    domain::LawSourceOverrides overrides;
    overrides.name = ReadOptionalString(j, "name");
    overrides.jurisdiction = ReadOptionalString(j, "jurisdiction");
    overrides.issuingAuthority = ReadOptionalString(j, "issuing_authority");
    overrides.issueDate = ReadOptionalString(j, "issue_date");
    overrides.lastUpdate = ReadOptionalString(j, "last_update");
    overrides.description = ReadOptionalString(j, "description");
    overrides.sourceUrl = ReadOptionalString(j, "source_url");

    if (auto typeName = ReadOptionalString(j, "type")) {
        overrides.type = domain::LawTypeFromString(*typeName);
        if (!overrides.type) {
            throw LegalDocumentError(ErrorKind::InvalidInput, "Unknown law type: " + *typeName,
                                     {}, std::string("type"), {{"value", *typeName}});
        }
    }
    return overrides;
}

domain::LawSourceOverrides ResultJson::OverridesFromString(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw LegalDocumentError(ErrorKind::InvalidInput,
                                 std::string("Malformed law source overrides: ") + e.what());
    }
    return OverridesFromJson(j);
}

} // namespace lexingest::infrastructure
