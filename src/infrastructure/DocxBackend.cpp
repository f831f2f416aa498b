/**
 * @file DocxBackend.cpp
 * @brief Implementation of DocxBackend.
 */

#include "infrastructure/DocxBackend.hpp"
#include "infrastructure/CommandRunner.hpp"
#include <cstring>
#include <pugixml.hpp>
#include <sstream>
#include <stdexcept>

namespace lexingest::infrastructure {

namespace {
    void WalkParagraphs(const pugi::xml_node& node, std::ostringstream& out) {
        for (pugi::xml_node child : node.children()) {
            const char* name = child.name();

            if (std::strcmp(name, "w:p") == 0) {
                WalkParagraphs(child, out);
                out << "\n";
                continue;
            }
            if (std::strcmp(name, "w:tab") == 0) {
                out << "\t";
                continue;
            }
            if (std::strcmp(name, "w:br") == 0 || std::strcmp(name, "w:cr") == 0) {
                out << "\n";
                continue;
            }
            if (std::strcmp(name, "w:t") == 0) {
                out << child.child_value();
                continue;
            }
            WalkParagraphs(child, out);
        }
    }
}

bool DocxBackend::isAvailable() const {
    return CommandRunner::HasTool("unzip");
}

std::string DocxBackend::extract(const std::string& path) const {
    std::string cmd = "unzip -p " + CommandRunner::Quote(path) + " word/document.xml 2>/dev/null";
    auto result = CommandRunner::Run(CommandRunner::WithTimeout(cmd, m_timeoutSeconds));
    if (result.exitCode != 0 || result.output.empty()) {
        throw std::runtime_error("Not a readable DOCX package (word/document.xml missing)");
    }
    return ParagraphsFromXml(result.output);
}

std::string DocxBackend::ParagraphsFromXml(const std::string& documentXml) {
    pugi::xml_document doc;
    // Keep <w:t xml:space="preserve"> </w:t>, the only separator between some runs.
    pugi::xml_parse_result parsed = doc.load_buffer(documentXml.data(), documentXml.size(),
                                                    pugi::parse_default | pugi::parse_ws_pcdata_single);
    if (!parsed) {
        throw std::runtime_error(std::string("Failed to parse document.xml: ") + parsed.description());
    }

    std::ostringstream out;
    WalkParagraphs(doc.document_element(), out);
    return out.str();
}

} // namespace lexingest::infrastructure
