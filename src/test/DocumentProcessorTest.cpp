#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "application/DocumentProcessor.hpp"
#include "domain/LegalDocumentError.hpp"
#include "infrastructure/ArabicTextUtilities.hpp"

using namespace lexingest::domain;
using lexingest::application::DocumentProcessor;
using lexingest::infrastructure::ArabicTextUtilities;
using lexingest::infrastructure::DocumentTextExtractor;
using lexingest::infrastructure::ProcessorConfig;

// Fixture backend: the "document" is a plain UTF-8 text file.
class PlainTextBackend : public TextExtractionBackend {
public:
    explicit PlainTextBackend(std::shared_ptr<std::atomic<int>> calls) : m_calls(std::move(calls)) {}

    std::string name() const override { return "plain-text"; }
    bool isAvailable() const override { return true; }
    std::string extract(const std::string& path) const override {
        (*m_calls)++;
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string content = buffer.str();
        if (content.rfind("CORRUPT", 0) == 0) {
            throw std::runtime_error("damaged cross-reference table");
        }
        return content;
    }

private:
    std::shared_ptr<std::atomic<int>> m_calls;
};

namespace {
    const std::string kLaborLaw =
        "نظام العمل رقم م/51 لعام 2005. "
        "المادة الأولى: يحق للعامل الحصول على إجازة سنوية مدتها ثلاثون يوماً. "
        "المادة الثانية: يجب على صاحب العمل دفع الأجر في الموعد المحدد.";

    const std::string kTrafficLaw =
        "نظام المرور رقم 85 لعام 2007. "
        "المادة 1: يلتزم قائد المركبة بحمل رخصة القيادة سارية المفعول. "
        "المادة 2: يعاقب بغرامة مالية كل من يخالف أحكام هذه المادة.";

    std::unique_ptr<DocumentProcessor> MakeProcessor(std::shared_ptr<std::atomic<int>> calls, std::size_t workers = 1) {
        DocumentTextExtractor::BackendList pdf;
        pdf.push_back(std::make_unique<PlainTextBackend>(calls));
        DocumentTextExtractor::BackendList docx;
        docx.push_back(std::make_unique<PlainTextBackend>(calls));

        ProcessorConfig config;
        config.batchWorkers = workers;
        return std::make_unique<DocumentProcessor>(
            std::make_unique<DocumentTextExtractor>(std::move(pdf), std::move(docx)),
            std::make_shared<ArabicTextUtilities>(),
            config);
    }

    void WriteFixture(const std::string& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
}

int main() {
    std::cout << "[Test] Starting DocumentProcessor Test..." << std::endl;

    std::string testRoot = "test_root_processor";
    std::filesystem::create_directories(testRoot);
    const std::string labor = testRoot + "/labor.pdf";
    const std::string traffic = testRoot + "/traffic.docx";
    const std::string corrupt = testRoot + "/corrupt.pdf";
    const std::string blank = testRoot + "/blank.pdf";
    WriteFixture(labor, kLaborLaw);
    WriteFixture(traffic, kTrafficLaw);
    WriteFixture(corrupt, "CORRUPT");
    WriteFixture(blank, "   \n\t  ");

    auto calls = std::make_shared<std::atomic<int>>(0);
    auto processor = MakeProcessor(calls);

    std::cout << "[Test] Processing a single document..." << std::endl;
    {
        std::vector<std::string> statuses;
        auto result = processor->process(labor, std::nullopt, [&](const std::string& s) { statuses.push_back(s); });
        assert(!statuses.empty());
        assert(result.lawSource.name == "العمل");
        assert(result.lawSource.issueDate == std::string("2005-01-01"));
        assert(result.articles.size() == 2);
        assert(result.articles[0].articleNumber == "المادة 1");
        assert(result.articles[1].articleNumber == "المادة 2");
        assert(result.statistics.totalArticles == 2);
        assert(result.statistics.filePath == labor);
        assert(result.statistics.totalCharacters > 0);
        assert(result.statistics.processingTime.size() == 20 && result.statistics.processingTime.back() == 'Z');
    }

    std::cout << "[Test] Overrides win over detection..." << std::endl;
    {
        LawSourceOverrides overrides;
        overrides.name = "نظام العمل السعودي";
        overrides.type = LawType::Regulation;
        auto result = processor->process(traffic, overrides);
        assert(result.lawSource.name == "نظام العمل السعودي");
        assert(result.lawSource.type == LawType::Regulation);
        assert(result.lawSource.issueDate == std::string("2007-01-01"));
        assert(result.articles.size() == 2);
    }

    std::cout << "[Test] Unsupported extension never reaches a backend..." << std::endl;
    {
        int before = *calls;
        try {
            processor->process("file.xlsx");
            assert(false && "Should have thrown.");
        } catch (const LegalDocumentError& e) {
            assert(e.kind() == ErrorKind::Extraction);
            assert(std::string(e.what()).find(".xlsx") != std::string::npos);
            assert(e.documentPath() == "file.xlsx");
        }
        assert(*calls == before);
    }

    std::cout << "[Test] Whitespace-only text..." << std::endl;
    try {
        processor->process(blank);
        assert(false && "Should have thrown.");
    } catch (const LegalDocumentError& e) {
        assert(e.kind() == ErrorKind::EmptyText);
        assert(e.documentPath() == blank);
    }

    std::cout << "[Test] Batch isolates failures..." << std::endl;
    {
        auto batch = processor->processBatch({labor, traffic, corrupt});
        assert(batch.results.size() == 3);
        assert(batch.totalFiles == 3 && batch.successful == 2 && batch.failed == 1);
        assert(batch.results[0].success && batch.results[0].data && !batch.results[0].error);
        assert(batch.results[1].success && batch.results[1].filePath == traffic);
        assert(!batch.results[2].success && !batch.results[2].data);
        assert(batch.results[2].error->find("damaged") != std::string::npos);
    }

    std::cout << "[Test] Parallel batch keeps input order..." << std::endl;
    {
        auto parallel = MakeProcessor(std::make_shared<std::atomic<int>>(0), 4);
        std::vector<std::string> paths;
        for (int i = 0; i < 12; ++i) {
            paths.push_back(i % 3 == 0 ? corrupt : (i % 3 == 1 ? labor : traffic));
        }
        auto batch = parallel->processBatch(paths);
        assert(batch.results.size() == paths.size());
        assert(batch.successful == 8 && batch.failed == 4);
        for (std::size_t i = 0; i < paths.size(); ++i) {
            assert(batch.results[i].filePath == paths[i]);
            assert(batch.results[i].success == (i % 3 != 0));
        }
    }

    std::cout << "[Test] Throwing status callback..." << std::endl;
    {
        std::atomic<int> notified{0};
        DocumentProcessor::StatusCallback failing = [&notified](std::string message) {
            notified++;
            throw std::runtime_error("status sink closed: " + message);
        };

        auto sequential = processor->processBatch({labor, traffic, corrupt}, std::nullopt, failing);
        assert(sequential.results.size() == 3);
        assert(sequential.successful == 2 && sequential.failed == 1);
        assert(notified == 3);

        auto parallel = MakeProcessor(std::make_shared<std::atomic<int>>(0), 4);
        auto batch = parallel->processBatch({labor, traffic, corrupt, labor}, std::nullopt, failing);
        assert(batch.results.size() == 4);
        assert(batch.successful == 3 && batch.failed == 1);
        assert(batch.results[2].filePath == corrupt && !batch.results[2].success);
        assert(notified == 7);
    }

    assert(processor->processBatch({}).totalFiles == 0);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] DocumentProcessor Test passed." << std::endl;
    return 0;
}
