#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using lexingest::infrastructure::ConfigLoader;
using lexingest::infrastructure::ProcessorConfig;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_root_config";
    std::filesystem::create_directories(testRoot);

    std::cout << "[Test] Missing file..." << std::endl;
    {
        auto config = ConfigLoader::Load(testRoot + "/absent.json");
        assert(config.maxKeywords == 10);
        assert(config.pdfBackends.size() == 2 && config.pdfBackends[0] == "mutool");
        assert(config.batchWorkers == 1);
        assert(config.extractionTimeoutSeconds == 0);
    }

    std::cout << "[Test] Valid settings..." << std::endl;
    {
        std::string path = testRoot + "/settings.json";
        std::ofstream(path) << R"({"max_keywords": 5, "pdf_backends": ["pdftotext"], "batch_workers": 4,
                                   "extraction_timeout_seconds": 30, "unknown": true})";
        auto config = ConfigLoader::Load(path);
        assert(config.maxKeywords == 5);
        assert(config.pdfBackends.size() == 1 && config.pdfBackends[0] == "pdftotext");
        assert(config.batchWorkers == 4);
        assert(config.extractionTimeoutSeconds == 30);
    }

    std::cout << "[Test] Out-of-range values are clamped..." << std::endl;
    {
        std::string path = testRoot + "/clamped.json";
        std::ofstream(path) << R"({"batch_workers": 1000, "extraction_timeout_seconds": -5, "pdf_backends": []})";
        auto config = ConfigLoader::Load(path);
        assert(config.batchWorkers == 64);
        assert(config.extractionTimeoutSeconds == 0);
        assert(config.pdfBackends.size() == 2);
    }

    std::cout << "[Test] Malformed file falls back to defaults..." << std::endl;
    {
        std::string path = testRoot + "/broken.json";
        std::ofstream(path) << R"({"max_keywords": 3, )";
        auto config = ConfigLoader::Load(path);
        assert(config.maxKeywords == 10);
        assert(config.batchWorkers == 1);
    }

    std::cout << "[Test] Default path honours XDG_CONFIG_HOME..." << std::endl;
    setenv("XDG_CONFIG_HOME", "/tmp/lexingest-xdg", 1);
    assert(ConfigLoader::DefaultConfigPath() == "/tmp/lexingest-xdg/lexingest/settings.json");

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test passed." << std::endl;
    return 0;
}
