/**
 * @file Association.hpp
 * @brief Scored link between an image and a text entity or chunk.
 */

#pragma once
#include <string>
#include <vector>

namespace docweave::domain {

enum class TargetKind {
    Entity,
    Chunk
};

inline std::string TargetKindToString(TargetKind kind) {
    return kind == TargetKind::Entity ? "entity" : "chunk";
}

/**
 * @struct AssociationTarget
 * @brief The text side of an association, built from an EntityCandidate or a Chunk.
 */
struct AssociationTarget {
    std::string id;
    TargetKind kind = TargetKind::Entity;
    std::string name;               ///< Product name; may be empty.
    std::string description;        ///< Text compared against image captions.
    int pageNumber = 1;
    std::vector<float> embedding;   ///< Empty when no embedding is available.
};

/**
 * @struct Association
 * @brief Immutable result of scoring one (image, target) pair.
 */
struct Association {
    std::string imageId;
    std::string targetId;
    TargetKind targetKind = TargetKind::Entity;
    double spatialScore = 0.0;
    double lexicalScore = 0.0;
    double visualScore = 0.0;
    double overallScore = 0.0;
    double confidence = 0.0;
    int pageDifference = 0;
    std::string reasoning;
};

} // namespace docweave::domain
