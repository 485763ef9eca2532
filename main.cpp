#include <csignal>
#include <cstdio>
#include <string>
#include <vector>
#include <filesystem>
#include <iostream>
#include <atomic>
#include <memory>
#include <chrono>
#include <algorithm>

#include "application/DocumentBatchService.hpp"
#include "application/EmbeddingService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/JsonResultRepository.hpp"
#include "infrastructure/JsonTreeProvider.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace docweave;

namespace {

std::atomic<bool> g_cancel{false};

void HandleInterrupt(int) {
    g_cancel = true;
}

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <inboxDir> <outputDir> [settings.json]" << std::endl;
}

void PrintSummary(const domain::DocumentResult& result) {
    std::cout << "== " << result.documentId
              << (result.complete() ? " [complete]" : " [partial]") << std::endl;
    std::cout << "   pages=" << result.pageCount
              << " elements=" << result.elementCount
              << " images=" << result.imageCount
              << " entities=" << result.candidates.size()
              << " chunks=" << result.chunks.size()
              << " associations=" << result.associations.size() << std::endl;
    for (const auto& s : result.stages) {
        if (s.state == domain::StageState::Succeeded) continue;
        std::cout << "   " << s.stage << ": " << domain::StageStateToString(s.state)
                  << " (" << s.message << ")" << std::endl;
    }
    char overall[16];
    std::snprintf(overall, sizeof(overall), "%.3f", result.quality.overall);
    std::cout << "   quality=" << overall << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 1;
    }

    const std::string inboxDir = argv[1];
    const std::string outputDir = argv[2];
    const std::string settingsPath = argc > 3 ? argv[3] : (fs::path(inboxDir) / "settings.json").string();

    if (!fs::is_directory(inboxDir)) {
        std::cerr << "[Main] Inbox directory not found: " << inboxDir << std::endl;
        return 1;
    }
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "[Main] Cannot create output directory " << outputDir << ": " << ec.message() << std::endl;
        return 1;
    }

    std::signal(SIGINT, HandleInterrupt);

    application::PipelineConfig config = infrastructure::ConfigLoader::Load(settingsPath);

    std::unique_ptr<infrastructure::EmbeddingCache> cache;
    std::unique_ptr<application::EmbeddingService> embeddings;
    if (config.embedding.enabled) {
        auto provider = std::make_shared<infrastructure::OllamaEmbeddingProvider>(
            config.embedding.host, config.embedding.port, config.embedding.model);
        if (!provider->isModelAvailable()) {
            std::cerr << "[Main] Embedding model '" << config.embedding.model
                      << "' not listed by the server; continuing with lexical fallbacks" << std::endl;
        }
        cache = std::make_unique<infrastructure::EmbeddingCache>(
            outputDir, std::chrono::seconds(config.embedding.cacheTtlSeconds));
        cache->load();
        embeddings = std::make_unique<application::EmbeddingService>(
            provider, cache.get(), static_cast<size_t>(std::max(1, config.embedding.workers)));
    }

    infrastructure::PersistenceService persistence;
    auto repository = std::make_shared<infrastructure::JsonResultRepository>(outputDir, persistence);

    application::DocumentBatchService batch(
        std::make_unique<infrastructure::FileSystemArtifactScanner>(inboxDir),
        [](const domain::SourceArtifact& artifact) -> std::unique_ptr<domain::ParsedTreeProvider> {
            return std::make_unique<infrastructure::JsonTreeProvider>(artifact.path);
        },
        config,
        embeddings.get(),
        repository);

    auto outcome = batch.processPending(
        [](const std::string& status) { std::cout << "[Batch] " << status << std::endl; },
        &g_cancel);

    for (const auto& result : outcome.results) {
        PrintSummary(result);
    }
    for (const auto& error : outcome.errors) {
        std::cerr << "[Main] " << error << std::endl;
    }

    persistence.flush();
    persistence.stop();
    if (cache) {
        cache->evictExpired();
        if (!cache->persist()) {
            std::cerr << "[Main] Failed to persist embedding cache" << std::endl;
        }
    }
    if (embeddings) {
        std::cout << "[Main] Embeddings: " << embeddings->providerCalls() << " calls, "
                  << embeddings->cacheHits() << " cache hits, "
                  << embeddings->failureCount() << " failures" << std::endl;
    }

    std::cout << "[Main] Documents: " << outcome.documentsDetected << " detected, "
              << outcome.documentsCompleted << " complete, "
              << outcome.documentsPartial << " partial; "
              << persistence.writtenCount() << " results written" << std::endl;

    if (persistence.failedCount() > 0 || !outcome.errors.empty()) {
        return 2;
    }
    return 0;
}
