/**
 * @file DocxBackend.hpp
 * @brief DOCX text extraction: `unzip` reads word/document.xml, pugixml walks the paragraphs.
 */

#pragma once
#include <string>
#include "domain/TextExtractionBackend.hpp"

namespace lexingest::infrastructure {

class DocxBackend : public domain::TextExtractionBackend {
public:
    explicit DocxBackend(int timeoutSeconds = 0) : m_timeoutSeconds(timeoutSeconds) {}

    std::string name() const override { return "docx"; }
    bool isAvailable() const override;
    std::string extract(const std::string& path) const override;

    /**
     * @brief Paragraph text of a WordprocessingML body, one paragraph per line.
     * @throws std::runtime_error when the XML does not parse.
     */
    static std::string ParagraphsFromXml(const std::string& documentXml);

private:
    int m_timeoutSeconds;
};

} // namespace lexingest::infrastructure
