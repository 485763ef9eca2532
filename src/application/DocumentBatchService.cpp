/**
 * @file DocumentBatchService.cpp
 * @brief Implementation of DocumentBatchService.
 */

#include "application/DocumentBatchService.hpp"
#include "application/DocumentPipeline.hpp"
#include "application/TaskPool.hpp"
#include <future>
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <iostream>

namespace docweave::application {

DocumentBatchService::DocumentBatchService(std::unique_ptr<infrastructure::FileSystemArtifactScanner> scanner,
                                           ProviderFactory providerFactory,
                                           PipelineConfig config,
                                           EmbeddingService* embeddings,
                                           std::shared_ptr<domain::ResultRepository> repository)
    : m_scanner(std::move(scanner)),
      m_providerFactory(std::move(providerFactory)),
      m_config(config),
      m_embeddings(embeddings),
      m_repository(std::move(repository)) {}

DocumentBatchService::BatchResult DocumentBatchService::processPending(std::function<void(std::string)> statusCallback,
                                                                       const std::atomic<bool>* cancelFlag) {
    if (statusCallback) statusCallback("Scanning inbox...");
    if (!m_scanner) {
        BatchResult empty;
        empty.errors.push_back("No scanner configured");
        return empty;
    }
    return processArtifacts(m_scanner->scan(), std::move(statusCallback), cancelFlag);
}

DocumentBatchService::BatchResult DocumentBatchService::processArtifacts(const std::vector<domain::SourceArtifact>& artifacts,
                                                                         std::function<void(std::string)> statusCallback,
                                                                         const std::atomic<bool>* cancelFlag) {
    BatchResult result;
    result.documentsDetected = static_cast<int>(artifacts.size());
    if (artifacts.empty()) return result;

    std::mutex callbackMutex;
    auto report = [&](const std::string& message) {
        if (!statusCallback) return;
        std::lock_guard<std::mutex> lock(callbackMutex);
        statusCallback(message);
    };

    std::vector<std::future<domain::DocumentResult>> futures;
    {
        TaskPool pool(static_cast<size_t>(std::max(1, m_config.batch.workers)));
        for (const auto& artifact : artifacts) {
            auto submitted = pool.Submit(TaskType::Document, "process " + artifact.filename, [this, artifact, cancelFlag, &report]() {
                report("Processing: " + artifact.filename);
                if (!m_providerFactory) {
                    throw std::runtime_error("no tree provider for " + artifact.filename);
                }
                auto provider = m_providerFactory(artifact);
                if (!provider) {
                    throw std::runtime_error("no tree provider for " + artifact.filename);
                }
                DocumentPipeline pipeline(m_config, m_embeddings, m_repository);
                auto docResult = pipeline.run(artifact.documentId, *provider, cancelFlag);
                report("Finished: " + artifact.filename);
                return docResult;
            });
            futures.push_back(std::move(submitted.first));
        }

        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                auto docResult = futures[i].get();
                if (docResult.complete()) {
                    result.documentsCompleted++;
                } else {
                    result.documentsPartial++;
                    for (const auto& stage : docResult.stages) {
                        if (stage.state == domain::StageState::Failed) {
                            result.errors.push_back(docResult.documentId + ": " + stage.stage + " failed: " + stage.message);
                        }
                    }
                }
                result.results.push_back(std::move(docResult));
            } catch (const std::exception& e) {
                std::cerr << "[DocumentBatchService] " << artifacts[i].filename << ": " << e.what() << std::endl;
                result.errors.push_back(artifacts[i].filename + ": " + e.what());
            }
        }
    }

    report("Batch finished: " + std::to_string(result.documentsCompleted) + " complete, " +
           std::to_string(result.documentsPartial) + " partial");
    return result;
}

} // namespace docweave::application
