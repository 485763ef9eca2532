/**
 * @file DocumentResult.hpp
 * @brief Per-document output of the pipeline, including partial-failure status.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Chunk.hpp"
#include "Association.hpp"
#include "BoundaryScore.hpp"
#include "EntityCandidate.hpp"

namespace docweave::domain {

enum class StageState {
    Succeeded,
    Failed,
    Skipped
};

inline std::string StageStateToString(StageState state) {
    switch (state) {
        case StageState::Succeeded: return "succeeded";
        case StageState::Failed: return "failed";
        case StageState::Skipped: return "skipped";
    }
    return "skipped";
}

struct StageStatus {
    std::string stage;
    StageState state = StageState::Skipped;
    std::string message;
};

/**
 * @struct QualityMetrics
 * @brief Aggregate quality of one run; unset members belong to stages that did not succeed.
 */
struct QualityMetrics {
    std::optional<double> layoutConfidence;
    std::optional<double> chunkingQuality;
    std::optional<double> associationConfidence;
    double overall = 0.0;
};

/**
 * @struct AssociationStats
 * @brief Counters reported by the association engine.
 */
struct AssociationStats {
    size_t pairsEvaluated = 0;
    size_t pairsAboveThreshold = 0;
    size_t associationsAssigned = 0;
    double averageConfidence = 0.0;
    size_t high = 0;       ///< overall >= 0.8
    size_t good = 0;       ///< [0.6, 0.8)
    size_t moderate = 0;   ///< [0.4, 0.6)
    size_t low = 0;        ///< < 0.4
};

struct DocumentResult {
    std::string documentId;
    int pageCount = 0;
    size_t elementCount = 0;
    size_t imageCount = 0;
    std::vector<EntityCandidate> candidates;
    std::vector<BoundaryScore> boundaries;
    std::vector<UnitCluster> clusters;   ///< Empty unless at least two units carry embeddings.
    std::vector<Chunk> chunks;
    std::vector<Association> associations;
    AssociationStats associationStats;
    QualityMetrics quality;
    std::vector<StageStatus> stages;

    /** @brief True when every stage that ran succeeded. */
    bool complete() const {
        for (const auto& s : stages) {
            if (s.state != StageState::Succeeded) return false;
        }
        return !stages.empty();
    }

    const StageStatus* stage(const std::string& name) const {
        for (const auto& s : stages) {
            if (s.stage == name) return &s;
        }
        return nullptr;
    }
};

} // namespace docweave::domain
