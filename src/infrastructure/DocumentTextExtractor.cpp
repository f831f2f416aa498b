/**
 * @file DocumentTextExtractor.cpp
 * @brief Implementation of DocumentTextExtractor.
 */

#include "infrastructure/DocumentTextExtractor.hpp"
#include "domain/LegalDocumentError.hpp"
#include "domain/Utf8Text.hpp"
#include "infrastructure/DocxBackend.hpp"
#include "infrastructure/PdfBackends.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace lexingest::infrastructure {

using domain::ErrorKind;
using domain::LegalDocumentError;

DocumentTextExtractor::DocumentTextExtractor(BackendList pdfBackends, BackendList docxBackends)
    : m_pdfBackends(SelectAvailable(std::move(pdfBackends), "PDF")),
      m_docxBackends(SelectAvailable(std::move(docxBackends), "DOCX")) {}

std::unique_ptr<DocumentTextExtractor> DocumentTextExtractor::CreateDefault(const ProcessorConfig& config) {
    BackendList pdf;
    for (const auto& name : config.pdfBackends) {
        if (name == "mutool") {
            pdf.push_back(std::make_unique<MutoolPdfBackend>(config.extractionTimeoutSeconds));
        } else if (name == "pdftotext") {
            pdf.push_back(std::make_unique<PdftotextBackend>(config.extractionTimeoutSeconds));
        } else {
            std::cerr << "[DocumentTextExtractor] Unknown PDF backend in settings: " << name << std::endl;
        }
    }

    BackendList docx;
    docx.push_back(std::make_unique<DocxBackend>(config.extractionTimeoutSeconds));

    return std::make_unique<DocumentTextExtractor>(std::move(pdf), std::move(docx));
}

DocumentTextExtractor::BackendList DocumentTextExtractor::SelectAvailable(BackendList candidates, const char* format) {
    BackendList selected;
    for (auto& backend : candidates) {
        if (backend && backend->isAvailable()) {
            selected.push_back(std::move(backend));
        } else if (backend) {
            std::cerr << "[DocumentTextExtractor] " << format << " backend unavailable: " << backend->name() << std::endl;
        }
    }
    return selected;
}

std::string DocumentTextExtractor::extractText(const std::string& path) const {
    std::filesystem::path p(path);
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    const BackendList* backends = nullptr;
    std::string format;
    if (ext == ".pdf") {
        backends = &m_pdfBackends;
        format = "PDF";
    } else if (ext == ".docx" || ext == ".doc") {
        backends = &m_docxBackends;
        format = "DOCX";
    } else {
        throw LegalDocumentError(ErrorKind::Extraction,
                                 "Unsupported file format: " + (ext.empty() ? std::string("(none)") : ext),
                                 path, "file_extension", {{"extension", ext}});
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec)) {
        throw LegalDocumentError(ErrorKind::Extraction, "Document not found: " + path, path, "file_path");
    }

    if (backends->empty()) {
        throw LegalDocumentError(ErrorKind::Extraction,
                                 "Required " + format + " processing backend not available",
                                 path, std::nullopt, {{"format", format}});
    }

    return extractWith(*backends, format, path);
}

std::string DocumentTextExtractor::extractWith(const BackendList& backends, const std::string& format, const std::string& path) const {
    std::string lastError;
    std::string lastBackend;
    for (const auto& backend : backends) {
        try {
            return domain::utf8::Trim(backend->extract(path));
        } catch (const std::exception& e) {
            lastError = e.what();
            lastBackend = backend->name();
            std::cerr << "[DocumentTextExtractor] " << lastBackend << " failed on " << path << ": " << lastError << std::endl;
        }
    }

    throw LegalDocumentError(ErrorKind::Extraction,
                             "Failed to extract text from " + format + ": " + lastError,
                             path, std::nullopt, {{"backend", lastBackend}});
}

std::vector<std::string> DocumentTextExtractor::availableBackends() const {
    std::vector<std::string> names;
    for (const auto& backend : m_pdfBackends) names.push_back(backend->name());
    for (const auto& backend : m_docxBackends) names.push_back(backend->name());
    return names;
}

} // namespace lexingest::infrastructure
