/**
 * @file PipelineConfig.hpp
 * @brief Tunable parameters for every pipeline stage.
 *
 * Loaded from settings.json by infrastructure::ConfigLoader; every field has a
 * usable default so an absent file still yields a working pipeline.
 */

#pragma once
#include <string>
#include <optional>

namespace docweave::application {

struct ChunkingConfig {
    size_t targetSize = 1000;
    size_t minSize = 300;
    size_t maxSize = 2000;
    size_t overlap = 200;
    bool respectHierarchy = true;
    bool splitOnEntityBoundaries = true;
};

struct BoundaryConfig {
    double entityStrengthThreshold = 0.6;
    double entitySimilarityThreshold = 0.6;
    size_t headingMaxLength = 60;       ///< Longest all-caps line still read as a heading.
    int kmeansIterations = 10;
};

struct ClassifierConfig {
    size_t minLength = 50;
    double qualityFloor = 0.5;          ///< Catalog entries must score above this to be associable.
};

/**
 * @enum AssociationTargetMode
 * @brief Which text side images are matched against.
 */
enum class AssociationTargetMode {
    Auto,       ///< Entities when any qualify, chunks otherwise.
    Entities,
    Chunks
};

inline std::string AssociationTargetModeToString(AssociationTargetMode mode) {
    switch (mode) {
        case AssociationTargetMode::Auto: return "auto";
        case AssociationTargetMode::Entities: return "entities";
        case AssociationTargetMode::Chunks: return "chunks";
    }
    return "auto";
}

inline std::optional<AssociationTargetMode> AssociationTargetModeFromString(const std::string& value) {
    if (value == "auto") return AssociationTargetMode::Auto;
    if (value == "entities") return AssociationTargetMode::Entities;
    if (value == "chunks") return AssociationTargetMode::Chunks;
    return std::nullopt;
}

struct AssociationConfig {
    double spatialWeight = 0.4;
    double lexicalWeight = 0.3;
    double visualWeight = 0.3;
    double minSpatial = 0.0;            ///< 0 disables the per-factor filter.
    double minLexical = 0.0;
    double minVisual = 0.0;
    double overallThreshold = 0.6;
    int maxPerImage = 3;
    int maxPerEntity = 5;
    AssociationTargetMode target = AssociationTargetMode::Auto;
};

struct EmbeddingConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 11434;
    std::string model = "nomic-embed-text";
    int workers = 4;
    int cacheTtlSeconds = 3600;
};

struct BatchConfig {
    int workers = 2;
};

struct PipelineConfig {
    ChunkingConfig chunking;
    BoundaryConfig boundaries;
    ClassifierConfig classifier;
    AssociationConfig association;
    EmbeddingConfig embedding;
    BatchConfig batch;
};

} // namespace docweave::application
