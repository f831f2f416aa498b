/**
 * @file LegalDocumentError.hpp
 * @brief The single exception type raised by the legal document pipeline.
 */

#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace lexingest::domain {

/**
 * @enum ErrorKind
 * @brief Context of a LegalDocumentError. Callers handle one type and branch on this if needed.
 */
enum class ErrorKind {
    Extraction,    ///< Unsupported extension, missing backend, unreadable or corrupt file.
    EmptyText,     ///< Extraction succeeded but produced no usable text.
    InvalidInput,  ///< Malformed caller input (e.g. overrides JSON).
    Unexpected     ///< Any other internal fault, wrapped.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Extraction: return "extraction";
        case ErrorKind::EmptyText: return "empty_text";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::Unexpected: return "unexpected";
    }
    return "unexpected";
}

/**
 * @class LegalDocumentError
 * @brief Carries {message, field, document_path, details} for the caller's error-reporting layer.
 */
class LegalDocumentError : public std::runtime_error {
public:
    static constexpr const char* kErrorCode = "ARABIC_LEGAL_DOCUMENT_ERROR";

    LegalDocumentError(ErrorKind kind,
                       const std::string& message,
                       std::string documentPath = {},
                       std::optional<std::string> field = std::nullopt,
                       std::map<std::string, std::string> details = {})
        : std::runtime_error(message),
          m_kind(kind),
          m_documentPath(std::move(documentPath)),
          m_field(std::move(field)),
          m_details(std::move(details)) {}

    ErrorKind kind() const { return m_kind; }
    const std::string& documentPath() const { return m_documentPath; }
    const std::optional<std::string>& field() const { return m_field; }
    const std::map<std::string, std::string>& details() const { return m_details; }
    std::string errorCode() const { return kErrorCode; }

private:
    ErrorKind m_kind;
    std::string m_documentPath;
    std::optional<std::string> m_field;
    std::map<std::string, std::string> m_details;
};

} // namespace lexingest::domain
