/**
 * @file DocumentPipeline.cpp
 * @brief Implementation of DocumentPipeline.
 */

#include "application/DocumentPipeline.hpp"
#include "domain/VectorMath.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

namespace docweave::application {

DocumentPipeline::DocumentPipeline(PipelineConfig config,
                                   EmbeddingService* embeddings,
                                   std::shared_ptr<domain::ResultRepository> repository)
    : m_config(config),
      m_embeddings(embeddings),
      m_repository(std::move(repository)),
      m_classifier(config.classifier),
      m_boundaryDetector(config.boundaries),
      m_chunker(config.chunking),
      m_associationEngine(config.association) {}

bool DocumentPipeline::runStage(domain::DocumentResult& result, const std::string& stage,
                                const std::function<std::string()>& body) {
    domain::StageStatus status;
    status.stage = stage;
    try {
        status.message = body();
        status.state = domain::StageState::Succeeded;
        std::cout << "[DocumentPipeline] " << result.documentId << ": " << stage << " ok (" << status.message << ")" << std::endl;
    } catch (const std::exception& e) {
        status.state = domain::StageState::Failed;
        status.message = e.what();
        std::cerr << "[DocumentPipeline] " << result.documentId << ": stage '" << stage << "' failed: " << e.what() << std::endl;
    }
    result.stages.push_back(status);
    return status.state == domain::StageState::Succeeded;
}

void DocumentPipeline::skipStage(domain::DocumentResult& result, const std::string& stage, const std::string& reason) {
    domain::StageStatus status;
    status.stage = stage;
    status.state = domain::StageState::Skipped;
    status.message = reason;
    result.stages.push_back(status);
}

double DocumentPipeline::chunkSizeQuality(const std::vector<domain::Chunk>& chunks) {
    if (chunks.empty()) return 0.0;
    std::vector<double> sizes;
    sizes.reserve(chunks.size());
    for (const auto& c : chunks) sizes.push_back(static_cast<double>(c.characterCount));
    const double m = domain::mean(sizes);
    if (m <= 0.0) return 0.0;
    return std::max(0.0, 1.0 - domain::variance(sizes) / (m * m));
}

std::vector<domain::AssociationTarget> DocumentPipeline::buildTargets(const domain::DocumentResult& result, bool chunksAvailable) {
    std::map<std::string, const domain::TextUnit*> unitsById;
    for (const auto& u : m_units) unitsById[u.id] = &u;

    const std::vector<float> kNoEmbedding;
    std::vector<domain::AssociationTarget> entities;
    for (const auto& candidate : result.candidates) {
        if (!m_classifier.isAssociable(candidate)) continue;
        auto it = unitsById.find(candidate.unitId);
        entities.push_back(AssociationEngine::toTarget(candidate, it != unitsById.end() ? it->second->embedding : kNoEmbedding));
    }

    const auto mode = m_config.association.target;
    const bool useEntities = mode == AssociationTargetMode::Entities ||
                             (mode == AssociationTargetMode::Auto && !entities.empty());
    if (useEntities) return entities;

    std::vector<domain::AssociationTarget> chunkTargets;
    if (!chunksAvailable) return chunkTargets;
    for (const auto& chunk : result.chunks) chunkTargets.push_back(AssociationEngine::toTarget(chunk));
    return chunkTargets;
}

void DocumentPipeline::computeQuality(domain::DocumentResult& result, bool layoutOk, bool chunkingOk, bool associationOk) const {
    auto& q = result.quality;
    std::vector<double> metrics;
    if (layoutOk) {
        q.layoutConfidence = m_layout.meanConfidence();
        metrics.push_back(*q.layoutConfidence);
    }
    if (chunkingOk) {
        q.chunkingQuality = chunkSizeQuality(result.chunks);
        metrics.push_back(*q.chunkingQuality);
    }
    if (associationOk) {
        q.associationConfidence = result.associations.empty() ? 0.8 : result.associationStats.averageConfidence;
        metrics.push_back(*q.associationConfidence);
    }
    q.overall = domain::mean(metrics);
}

domain::DocumentResult DocumentPipeline::run(const std::string& documentId,
                                             domain::ParsedTreeProvider& provider,
                                             const std::atomic<bool>* cancelFlag) {
    domain::DocumentResult result;
    result.documentId = documentId;
    m_layout = domain::LayoutModel();
    m_units.clear();

    const std::vector<std::string> order = {
        kStageLayout, kStageClassification, kStageBoundaries, kStageChunking, kStageAssociation, kStagePersistence
    };
    auto skipFrom = [&](size_t first, const std::string& reason) {
        for (size_t i = first; i < order.size(); ++i) skipStage(result, order[i], reason);
    };
    auto cancelled = [&]() { return cancelFlag && cancelFlag->load(); };

    if (cancelled()) {
        skipFrom(0, "cancelled");
        return result;
    }

    const bool layoutOk = runStage(result, kStageLayout, [&]() {
        domain::ParsedNode tree = provider.loadTree();
        m_layout = m_layoutBuilder.build(tree);
        m_units = LayoutModelBuilder::extractTextUnits(m_layout);
        result.pageCount = m_layout.pageCount();
        result.elementCount = m_layout.elements().size();
        result.imageCount = m_layout.images().size();
        return std::to_string(result.elementCount) + " elements, " + std::to_string(m_layout.sections().size()) +
               " sections, " + std::to_string(result.imageCount) + " images";
    });
    if (!layoutOk) {
        skipFrom(1, "layout unavailable");
        computeQuality(result, false, false, false);
        return result;
    }

    if (cancelled()) {
        skipFrom(1, "cancelled");
        computeQuality(result, true, false, false);
        return result;
    }
    runStage(result, kStageClassification, [&]() {
        size_t embedded = 0;
        if (m_embeddings) {
            embedded += m_embeddings->embedUnits(m_units);
            embedded += m_embeddings->embedImages(m_layout.images());
        }
        result.candidates = m_classifier.classifyAll(m_units);
        size_t associable = 0;
        for (const auto& c : result.candidates) {
            if (m_classifier.isAssociable(c)) ++associable;
        }
        return std::to_string(result.candidates.size()) + " candidates, " + std::to_string(associable) +
               " associable, " + std::to_string(embedded) + " embeddings";
    });

    if (cancelled()) {
        skipFrom(2, "cancelled");
        computeQuality(result, true, false, false);
        return result;
    }
    const bool boundariesOk = runStage(result, kStageBoundaries, [&]() {
        result.boundaries = m_boundaryDetector.score(m_units);
        size_t entityBreaks = 0;
        for (const auto& b : result.boundaries) {
            if (b.entityBoundary) ++entityBreaks;
        }
        result.clusters = m_boundaryDetector.cluster(m_units);
        return std::to_string(result.boundaries.size()) + " boundaries, " + std::to_string(entityBreaks) +
               " entity breaks, " + std::to_string(result.clusters.size()) + " clusters";
    });
    if (!boundariesOk) {
        result.boundaries.clear();
        result.clusters.clear();
    }

    if (cancelled()) {
        skipFrom(3, "cancelled");
        computeQuality(result, true, false, false);
        return result;
    }
    const bool chunkingOk = runStage(result, kStageChunking, [&]() {
        result.chunks = m_chunker.chunk(m_layout, boundariesOk ? &result.boundaries : nullptr, documentId);
        size_t flagged = 0;
        for (const auto& c : result.chunks) {
            if (c.sizeFlag != domain::SizeFlag::Ok) ++flagged;
        }
        return std::to_string(result.chunks.size()) + " chunks, " + std::to_string(flagged) + " flagged";
    });
    if (!chunkingOk) result.chunks.clear();

    if (cancelled()) {
        skipFrom(4, "cancelled");
        computeQuality(result, true, chunkingOk, false);
        return result;
    }
    const bool associationOk = runStage(result, kStageAssociation, [&]() {
        auto targets = buildTargets(result, chunkingOk);
        bool chunkTargets = !targets.empty() && targets.front().kind == domain::TargetKind::Chunk;
        if (chunkTargets && m_embeddings) {
            m_embeddings->embedChunks(result.chunks);
            targets = buildTargets(result, chunkingOk);
        }
        auto outcome = m_associationEngine.associate(m_layout.images(), targets);
        result.associations = std::move(outcome.associations);
        result.associationStats = outcome.stats;
        return std::to_string(result.associations.size()) + " associations from " +
               std::to_string(outcome.stats.pairsEvaluated) + " pairs";
    });
    if (!associationOk) result.associations.clear();

    computeQuality(result, true, chunkingOk, associationOk);

    if (cancelled()) {
        skipFrom(5, "cancelled");
        return result;
    }
    if (!m_repository) return result;
    runStage(result, kStagePersistence, [&]() -> std::string {
        if (!m_repository->saveResult(result)) {
            throw std::runtime_error("repository rejected result for " + documentId);
        }
        return m_repository->writesDeferred() ? "queued" : "saved";
    });
    return result;
}

} // namespace docweave::application
