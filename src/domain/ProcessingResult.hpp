/**
 * @file ProcessingResult.hpp
 * @brief Output records of the document pipeline, single file and batch.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "Article.hpp"
#include "LawSource.hpp"

namespace lexingest::domain {

struct ProcessingStatistics {
    std::size_t totalArticles = 0;
    std::size_t totalCharacters = 0;   ///< Sum of article content lengths in code points.
    std::string processingTime;        ///< UTC ISO-8601 completion timestamp.
    std::string filePath;
};

/**
 * @struct ProcessingResult
 * @brief Law source metadata plus the ordered articles of one document.
 */
struct ProcessingResult {
    LawSourceMetadata lawSource;
    std::vector<Article> articles;
    ProcessingStatistics statistics;
};

/**
 * @struct BatchEntry
 * @brief Outcome for one path of a batch. Exactly one of data/error is set.
 */
struct BatchEntry {
    std::string filePath;
    bool success = false;
    std::optional<ProcessingResult> data;
    std::optional<std::string> error;
};

struct BatchResult {
    std::vector<BatchEntry> results;   ///< Same order as the input paths.
    std::size_t totalFiles = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
};

} // namespace lexingest::domain
