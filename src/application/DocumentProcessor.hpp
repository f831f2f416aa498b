/**
 * @file DocumentProcessor.hpp
 * @brief Orchestrates extraction, law source detection and article segmentation.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/ArticleExtractor.hpp"
#include "domain/LawSource.hpp"
#include "domain/ProcessingResult.hpp"
#include "domain/TextUtilities.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocumentTextExtractor.hpp"

namespace lexingest::application {

/**
 * @class DocumentProcessor
 * @brief Runs the legal document pipeline for one file or a batch of files.
 *
 * Holds no per-call state, so one instance may serve concurrent callers.
 */
class DocumentProcessor {
public:
    using StatusCallback = std::function<void(std::string)>;

    DocumentProcessor(std::unique_ptr<infrastructure::DocumentTextExtractor> extractor,
                      std::shared_ptr<const domain::TextUtilities> textUtilities,
                      infrastructure::ProcessorConfig config = {});

    /** @brief Wires the system backends and ArabicTextUtilities together. */
    static std::unique_ptr<DocumentProcessor> CreateDefault(const infrastructure::ProcessorConfig& config);

    /**
     * @brief Processes one document.
     * @param filePath .pdf, .docx or .doc path.
     * @param overrides Caller metadata; present fields win over detection.
     * @throws domain::LegalDocumentError for every failure, with documentPath set.
     */
    domain::ProcessingResult process(const std::string& filePath,
                                     const std::optional<domain::LawSourceOverrides>& overrides = std::nullopt,
                                     StatusCallback statusCallback = nullptr) const;

    /**
     * @brief Processes each path independently. Failures become entries, never exceptions.
     *
     * Entries keep input order. With batch_workers > 1 files run on a bounded pool.
     */
    domain::BatchResult processBatch(const std::vector<std::string>& filePaths,
                                     const std::optional<domain::LawSourceOverrides>& overrides = std::nullopt,
                                     StatusCallback statusCallback = nullptr) const;

    const infrastructure::ProcessorConfig& config() const { return m_config; }

private:
    domain::BatchEntry processEntry(const std::string& filePath,
                                    const std::optional<domain::LawSourceOverrides>& overrides) const;

    std::unique_ptr<infrastructure::DocumentTextExtractor> m_extractor;
    std::shared_ptr<const domain::TextUtilities> m_textUtilities;
    infrastructure::ProcessorConfig m_config;
    domain::ArticleExtractor m_articleExtractor;
};

} // namespace lexingest::application
