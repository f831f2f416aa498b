/**
 * @file DocumentProcessor.cpp
 * @brief Implementation of DocumentProcessor.
 */

#include "application/DocumentProcessor.hpp"
#include "domain/LawSourceDetector.hpp"
#include "domain/LegalDocumentError.hpp"
#include "domain/Utf8Text.hpp"
#include "infrastructure/ArabicTextUtilities.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace lexingest::application {

using domain::ErrorKind;
using domain::LegalDocumentError;

namespace {
    std::string ToIsoTimestamp(const std::chrono::system_clock::time_point& tp) {
        std::time_t tt = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = {};
        gmtime_r(&tt, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }
}

DocumentProcessor::DocumentProcessor(std::unique_ptr<infrastructure::DocumentTextExtractor> extractor,
                                     std::shared_ptr<const domain::TextUtilities> textUtilities,
                                     infrastructure::ProcessorConfig config)
    : m_extractor(std::move(extractor)),
      m_textUtilities(std::move(textUtilities)),
      m_config(std::move(config)),
      m_articleExtractor(m_textUtilities, m_config.maxKeywords) {
    if (!m_extractor) {
        throw std::invalid_argument("DocumentProcessor requires a text extractor");
    }
}

std::unique_ptr<DocumentProcessor> DocumentProcessor::CreateDefault(const infrastructure::ProcessorConfig& config) {
    return std::make_unique<DocumentProcessor>(infrastructure::DocumentTextExtractor::CreateDefault(config),
                                               std::make_shared<infrastructure::ArabicTextUtilities>(),
                                               config);
}

domain::ProcessingResult DocumentProcessor::process(const std::string& filePath,
                                                    const std::optional<domain::LawSourceOverrides>& overrides,
                                                    StatusCallback statusCallback) const {
    try {
        if (statusCallback) statusCallback("Extracting text: " + filePath);
        std::string text = m_extractor->extractText(filePath);
        if (domain::utf8::Trim(text).empty()) {
            throw LegalDocumentError(ErrorKind::EmptyText, "No text extracted from document", filePath);
        }

        if (statusCallback) statusCallback("Detecting law source: " + filePath);
        domain::ProcessingResult result;
        result.lawSource = domain::LawSourceDetector::detect(text);
        if (overrides) {
            result.lawSource = domain::LawSourceDetector::merge(result.lawSource, *overrides);
        }

        if (statusCallback) statusCallback("Extracting articles: " + filePath);
        result.articles = m_articleExtractor.extract(text);

        result.statistics.totalArticles = result.articles.size();
        for (const auto& article : result.articles) {
            result.statistics.totalCharacters += domain::utf8::CodePointCount(article.content);
        }
        result.statistics.processingTime = ToIsoTimestamp(std::chrono::system_clock::now());
        result.statistics.filePath = filePath;
        return result;
    } catch (const LegalDocumentError&) {
        throw;
    } catch (const std::exception& e) {
        throw LegalDocumentError(ErrorKind::Unexpected,
                                 std::string("Failed to process document: ") + e.what(),
                                 filePath);
    }
}

domain::BatchEntry DocumentProcessor::processEntry(const std::string& filePath,
                                                   const std::optional<domain::LawSourceOverrides>& overrides) const {
    domain::BatchEntry entry;
    entry.filePath = filePath;
    try {
        entry.data = process(filePath, overrides);
        entry.success = true;
    } catch (const std::exception& e) {
        std::cerr << "[DocumentProcessor] Failed to process " << filePath << ": " << e.what() << std::endl;
        entry.error = e.what();
    }
    return entry;
}

domain::BatchResult DocumentProcessor::processBatch(const std::vector<std::string>& filePaths,
                                                    const std::optional<domain::LawSourceOverrides>& overrides,
                                                    StatusCallback statusCallback) const {
    domain::BatchResult batch;
    batch.results.resize(filePaths.size());

    std::mutex callbackMutex;
    // A failing callback must not abort the batch or escape a worker thread.
    auto report = [&](const std::string& message) {
        if (!statusCallback) return;
        std::lock_guard<std::mutex> lock(callbackMutex);
        try {
            statusCallback(message);
        } catch (const std::exception& e) {
            std::cerr << "[DocumentProcessor] Status callback failed: " << e.what() << std::endl;
        }
    };

    std::size_t workers = std::min(std::max<std::size_t>(1, m_config.batchWorkers), filePaths.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < filePaths.size(); ++i) {
            report("Processing: " + filePaths[i]);
            batch.results[i] = processEntry(filePaths[i], overrides);
        }
    } else {
        std::atomic<std::size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                for (std::size_t i = next++; i < filePaths.size(); i = next++) {
                    report("Processing: " + filePaths[i]);
                    batch.results[i] = processEntry(filePaths[i], overrides);
                }
            });
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    batch.totalFiles = filePaths.size();
    for (const auto& entry : batch.results) {
        if (entry.success) {
            batch.successful++;
        } else {
            batch.failed++;
        }
    }
    return batch;
}

} // namespace lexingest::application
