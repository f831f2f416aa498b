/**
 * @file PdfBackends.hpp
 * @brief PDF text extraction backends driving the MuPDF and poppler command-line tools.
 */

#pragma once
#include <string>
#include "domain/TextExtractionBackend.hpp"

namespace lexingest::infrastructure {

/**
 * @class MutoolPdfBackend
 * @brief Primary PDF backend: `mutool draw -F txt` (MuPDF).
 */
class MutoolPdfBackend : public domain::TextExtractionBackend {
public:
    explicit MutoolPdfBackend(int timeoutSeconds = 0) : m_timeoutSeconds(timeoutSeconds) {}

    std::string name() const override { return "mutool"; }
    bool isAvailable() const override;
    std::string extract(const std::string& path) const override;

private:
    int m_timeoutSeconds;
};

/**
 * @class PdftotextBackend
 * @brief Secondary PDF backend: `pdftotext` (poppler-utils).
 */
class PdftotextBackend : public domain::TextExtractionBackend {
public:
    explicit PdftotextBackend(int timeoutSeconds = 0) : m_timeoutSeconds(timeoutSeconds) {}

    std::string name() const override { return "pdftotext"; }
    bool isAvailable() const override;
    std::string extract(const std::string& path) const override;

private:
    int m_timeoutSeconds;
};

} // namespace lexingest::infrastructure
