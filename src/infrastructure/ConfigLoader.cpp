/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace lexingest::infrastructure {

namespace fs = std::filesystem;

namespace {
    constexpr std::size_t kMaxBatchWorkers = 64;

    fs::path ConfigHome() {
        const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
        if (xdgConfigHome && *xdgConfigHome) return fs::path(xdgConfigHome);
        const char* home = std::getenv("HOME");
        if (home && *home) return fs::path(home) / ".config";
        return fs::current_path();
    }
}

ProcessorConfig ConfigLoader::Load(const std::string& configPath) {
    ProcessorConfig config;
    if (!fs::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("max_keywords")) {
            int value = j["max_keywords"].get<int>();
            config.maxKeywords = static_cast<std::size_t>(std::max(0, value));
        }
        if (j.contains("pdf_backends")) {
            auto backends = j["pdf_backends"].get<std::vector<std::string>>();
            if (!backends.empty()) config.pdfBackends = backends;
        }
        if (j.contains("batch_workers")) {
            int value = j["batch_workers"].get<int>();
            config.batchWorkers = std::clamp<std::size_t>(static_cast<std::size_t>(std::max(1, value)), 1, kMaxBatchWorkers);
        }
        if (j.contains("extraction_timeout_seconds")) {
            config.extractionTimeoutSeconds = std::max(0, j["extraction_timeout_seconds"].get<int>());
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return ProcessorConfig{};
    }

    return config;
}

ProcessorConfig ConfigLoader::LoadDefault() {
    return Load(DefaultConfigPath());
}

std::string ConfigLoader::DefaultConfigPath() {
    return (ConfigHome() / "lexingest" / "settings.json").string();
}

} // namespace lexingest::infrastructure
