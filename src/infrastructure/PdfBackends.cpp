/**
 * @file PdfBackends.cpp
 * @brief Implementation of the PDF backends.
 */

#include "infrastructure/PdfBackends.hpp"
#include "infrastructure/CommandRunner.hpp"
#include <stdexcept>

namespace lexingest::infrastructure {

namespace {
    // Both tools end every page with a form feed.
    std::string JoinPages(const std::string& raw) {
        std::string text;
        text.reserve(raw.size());
        std::size_t start = 0;
        while (start <= raw.size()) {
            std::size_t end = raw.find('\f', start);
            if (end == std::string::npos) end = raw.size();
            std::string page = raw.substr(start, end - start);
            if (!page.empty()) {
                if (!text.empty() && text.back() != '\n') text += '\n';
                text += page;
            }
            start = end + 1;
        }
        return text;
    }

    std::string RunPdfTool(const std::string& tool, const std::string& cmd, int timeoutSeconds) {
        auto result = CommandRunner::Run(CommandRunner::WithTimeout(cmd, timeoutSeconds));
        if (result.exitCode != 0) {
            throw std::runtime_error(tool + " failed with exit code " + std::to_string(result.exitCode));
        }
        return JoinPages(result.output);
    }
}

bool MutoolPdfBackend::isAvailable() const {
    return CommandRunner::HasTool("mutool");
}

std::string MutoolPdfBackend::extract(const std::string& path) const {
    std::string cmd = "mutool draw -q -F txt -o - " + CommandRunner::Quote(path) + " 2>/dev/null";
    return RunPdfTool(name(), cmd, m_timeoutSeconds);
}

bool PdftotextBackend::isAvailable() const {
    return CommandRunner::HasTool("pdftotext");
}

std::string PdftotextBackend::extract(const std::string& path) const {
    std::string cmd = "pdftotext -enc UTF-8 " + CommandRunner::Quote(path) + " - 2>/dev/null";
    return RunPdfTool(name(), cmd, m_timeoutSeconds);
}

} // namespace lexingest::infrastructure
