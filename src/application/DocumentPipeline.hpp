/**
 * @file DocumentPipeline.hpp
 * @brief Runs layout, classification, boundaries, chunking and association for one document.
 */

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <functional>
#include "domain/ParsedNode.hpp"
#include "domain/LayoutModel.hpp"
#include "domain/DocumentResult.hpp"
#include "domain/ResultRepository.hpp"
#include "application/PipelineConfig.hpp"
#include "application/LayoutModelBuilder.hpp"
#include "application/ContentClassifier.hpp"
#include "application/BoundaryDetector.hpp"
#include "application/LayoutAwareChunker.hpp"
#include "application/AssociationEngine.hpp"
#include "application/EmbeddingService.hpp"

namespace docweave::application {

/**
 * @class DocumentPipeline
 * @brief Single-document orchestrator with per-stage failure isolation.
 *
 * One instance processes one document at a time and owns every intermediate
 * collection. Parallel documents use separate instances; only the embedding
 * service and the repository may be shared.
 */
class DocumentPipeline {
public:
    static constexpr const char* kStageLayout = "layout";
    static constexpr const char* kStageClassification = "classification";
    static constexpr const char* kStageBoundaries = "boundaries";
    static constexpr const char* kStageChunking = "chunking";
    static constexpr const char* kStageAssociation = "association";
    static constexpr const char* kStagePersistence = "persistence";

    /**
     * @param config Stage parameters.
     * @param embeddings Optional shared embedding service; nullptr runs on fallbacks only.
     * @param repository Optional persistence collaborator; nullptr leaves the persistence stage out.
     */
    DocumentPipeline(PipelineConfig config,
                     EmbeddingService* embeddings = nullptr,
                     std::shared_ptr<domain::ResultRepository> repository = nullptr);

    /**
     * @brief Processes one document.
     *
     * Never throws for stage failures; the returned result records which stages
     * succeeded, failed or were skipped and keeps every output produced before
     * the failure.
     * @param cancelFlag Checked between stages; once set, remaining stages are skipped.
     */
    domain::DocumentResult run(const std::string& documentId,
                               domain::ParsedTreeProvider& provider,
                               const std::atomic<bool>* cancelFlag = nullptr);

    /** @brief Layout model of the last run. */
    const domain::LayoutModel& layout() const { return m_layout; }

    /** @brief max(0, 1 - variance/mean^2) over chunk sizes; 0 without chunks. */
    static double chunkSizeQuality(const std::vector<domain::Chunk>& chunks);

private:
    bool runStage(domain::DocumentResult& result, const std::string& stage, const std::function<std::string()>& body);
    void skipStage(domain::DocumentResult& result, const std::string& stage, const std::string& reason);
    std::vector<domain::AssociationTarget> buildTargets(const domain::DocumentResult& result, bool chunksAvailable);
    void computeQuality(domain::DocumentResult& result, bool layoutOk, bool chunkingOk, bool associationOk) const;

    PipelineConfig m_config;
    EmbeddingService* m_embeddings;
    std::shared_ptr<domain::ResultRepository> m_repository;

    LayoutModelBuilder m_layoutBuilder;
    ContentClassifier m_classifier;
    BoundaryDetector m_boundaryDetector;
    LayoutAwareChunker m_chunker;
    AssociationEngine m_associationEngine;

    domain::LayoutModel m_layout;
    std::vector<domain::TextUnit> m_units;
};

} // namespace docweave::application
