/**
 * @file DocumentBatchService.hpp
 * @brief Runs the pipeline over every parsed-tree document in an inbox, in parallel.
 */

#pragma once
#include <memory>
#include <vector>
#include <string>
#include <atomic>
#include <functional>
#include "domain/SourceArtifact.hpp"
#include "domain/ParsedNode.hpp"
#include "domain/DocumentResult.hpp"
#include "domain/ResultRepository.hpp"
#include "application/PipelineConfig.hpp"
#include "application/EmbeddingService.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"

namespace docweave::application {

/**
 * @class DocumentBatchService
 * @brief Orchestrates batch processing from inbox scan to persisted results.
 *
 * Each document runs in its own DocumentPipeline on the batch pool. Embedding
 * fan-out happens on the EmbeddingService pool, so document tasks never wait
 * on their own pool.
 */
class DocumentBatchService {
public:
    using ProviderFactory = std::function<std::unique_ptr<domain::ParsedTreeProvider>(const domain::SourceArtifact&)>;

    DocumentBatchService(std::unique_ptr<infrastructure::FileSystemArtifactScanner> scanner,
                         ProviderFactory providerFactory,
                         PipelineConfig config,
                         EmbeddingService* embeddings,
                         std::shared_ptr<domain::ResultRepository> repository);

    /**
     * @brief Result of a batch run.
     */
    struct BatchResult {
        int documentsDetected = 0;
        int documentsCompleted = 0;   ///< Every stage succeeded.
        int documentsPartial = 0;     ///< At least one stage failed or was skipped.
        std::vector<domain::DocumentResult> results;   ///< In artifact order.
        std::vector<std::string> errors;
    };

    /**
     * @brief Scans and processes all documents in the inbox.
     * @param statusCallback Progress feedback; may be called from worker threads, never concurrently.
     * @param cancelFlag Forwarded to each pipeline.
     */
    BatchResult processPending(std::function<void(std::string)> statusCallback = nullptr,
                               const std::atomic<bool>* cancelFlag = nullptr);

    BatchResult processArtifacts(const std::vector<domain::SourceArtifact>& artifacts,
                                 std::function<void(std::string)> statusCallback = nullptr,
                                 const std::atomic<bool>* cancelFlag = nullptr);

private:
    std::unique_ptr<infrastructure::FileSystemArtifactScanner> m_scanner;
    ProviderFactory m_providerFactory;
    PipelineConfig m_config;
    EmbeddingService* m_embeddings;
    std::shared_ptr<domain::ResultRepository> m_repository;
};

} // namespace docweave::application
