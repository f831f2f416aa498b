/**
 * @file TextExtractionBackend.hpp
 * @brief Capability interface for one document-to-text backend.
 */

#pragma once
#include <string>

namespace lexingest::domain {

/**
 * @class TextExtractionBackend
 * @brief A single way of turning a document file into plain text.
 *
 * Availability is probed once, when the extractor selecting backends is built.
 */
class TextExtractionBackend {
public:
    virtual ~TextExtractionBackend() = default;

    /** @brief Short identifier used in logs and configuration (e.g. "pdftotext"). */
    virtual std::string name() const = 0;

    /** @brief Whether the backend can run on this machine. */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Extracts the text of a document.
     * @param path Path to an existing file.
     * @return Extracted text.
     * @throws std::runtime_error when the file cannot be read or parsed.
     */
    virtual std::string extract(const std::string& path) const = 0;
};

} // namespace lexingest::domain
