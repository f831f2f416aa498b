/**
 * @file ResultJson.hpp
 * @brief JSON encoding of pipeline results and decoding of caller overrides.
 */

#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "domain/LawSource.hpp"
#include "domain/ProcessingResult.hpp"

namespace lexingest::infrastructure {

/**
 * @class ResultJson
 * @brief Maps domain records to snake_case JSON objects. Absent optionals become null.
 */
class ResultJson {
public:
    static nlohmann::json ToJson(const domain::LawSourceMetadata& source);
    static nlohmann::json ToJson(const domain::Article& article);
    static nlohmann::json ToJson(const domain::ProcessingResult& result);
    static nlohmann::json ToJson(const domain::BatchResult& batch);

    /**
     * @brief Decodes overrides from a JSON object.
     *
     * Unknown keys are ignored and null means absent.
     * @throws domain::LegalDocumentError (InvalidInput) when the value is not an
     *         object, a field is not a string, or `type` names no known LawType.
     */
    static domain::LawSourceOverrides OverridesFromJson(const nlohmann::json& j);

    /** @brief Parses text first; a syntax error is reported as InvalidInput. */
    static domain::LawSourceOverrides OverridesFromString(const std::string& text);
};

} // namespace lexingest::infrastructure
