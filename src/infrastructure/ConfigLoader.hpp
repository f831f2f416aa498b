/**
 * @file ConfigLoader.hpp
 * @brief Loading of processor settings (settings.json).
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lexingest::infrastructure {

/**
 * @struct ProcessorConfig
 * @brief Tunables of the document pipeline. Defaults match the behavior with no settings file.
 */
struct ProcessorConfig {
    std::size_t maxKeywords = 10;                                     ///< Per-article keyword cap.
    std::vector<std::string> pdfBackends = {"mutool", "pdftotext"};   ///< PDF backends in priority order.
    std::size_t batchWorkers = 1;                                     ///< 1 processes a batch sequentially.
    int extractionTimeoutSeconds = 0;                                 ///< Per-tool wall-clock limit, 0 for none.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Parsed settings; defaults for a missing file, a parse error, or absent keys.
     */
    static ProcessorConfig Load(const std::string& configPath);

    /**
     * @brief Reads settings from the user's config home (lexingest/settings.json).
     */
    static ProcessorConfig LoadDefault();

    /** @brief Default settings path under the XDG config home. */
    static std::string DefaultConfigPath();
};

} // namespace lexingest::infrastructure
