/**
 * @file DocumentTextExtractor.hpp
 * @brief Extension-dispatched text extraction over ordered backend lists.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/TextExtractionBackend.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace lexingest::infrastructure {

/**
 * @class DocumentTextExtractor
 * @brief Reads the text of .pdf and .docx/.doc files.
 *
 * Backends are probed once at construction; unavailable ones are dropped and
 * never re-probed. Every failure is a domain::LegalDocumentError of kind
 * Extraction carrying the document path.
 */
class DocumentTextExtractor {
public:
    using BackendList = std::vector<std::unique_ptr<domain::TextExtractionBackend>>;

    DocumentTextExtractor(BackendList pdfBackends, BackendList docxBackends);

    /** @brief Builds the standard backend set in the order the config names. */
    static std::unique_ptr<DocumentTextExtractor> CreateDefault(const ProcessorConfig& config);

    /**
     * @brief Extracts trimmed text from a document.
     * @param path Path to a .pdf, .docx or .doc file.
     * @throws domain::LegalDocumentError on unsupported extension, missing file,
     *         missing backend, or when every backend fails.
     */
    std::string extractText(const std::string& path) const;

    /** @brief Names of the selected backends, PDF first, for diagnostics. */
    std::vector<std::string> availableBackends() const;

private:
    static BackendList SelectAvailable(BackendList candidates, const char* format);
    std::string extractWith(const BackendList& backends, const std::string& format, const std::string& path) const;

    BackendList m_pdfBackends;
    BackendList m_docxBackends;
};

} // namespace lexingest::infrastructure
