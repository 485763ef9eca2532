/**
 * @file BoundaryScore.hpp
 * @brief Strength and type of the break between two adjacent TextUnits, and unit clusters.
 */

#pragma once
#include <string>
#include <vector>

namespace docweave::domain {

enum class BoundaryType {
    Sentence,
    Paragraph,
    Section,
    Semantic,
    Weak
};

inline std::string BoundaryTypeToString(BoundaryType type) {
    switch (type) {
        case BoundaryType::Sentence: return "sentence";
        case BoundaryType::Paragraph: return "paragraph";
        case BoundaryType::Section: return "section";
        case BoundaryType::Semantic: return "semantic";
        case BoundaryType::Weak: return "weak";
    }
    return "weak";
}

/**
 * @struct BoundaryScore
 * @brief Score of the boundary after `unitId`, measured against `nextUnitId`.
 */
struct BoundaryScore {
    std::string unitId;
    std::string nextUnitId;
    std::string elementId;              ///< Element of `unitId`.
    double strength = 0.0;              ///< [0,1]
    BoundaryType type = BoundaryType::Weak;
    double semanticSimilarity = 0.0;    ///< [-1,1]
    bool similarityEstimated = false;   ///< True when no embedding pair was available.
    bool entityBoundary = false;
    std::string reasoning;
};

/**
 * @struct UnitCluster
 * @brief One k-means group of text units.
 */
struct UnitCluster {
    int id = 0;
    std::vector<std::string> unitIds;
    std::vector<float> centroid;
    double coherence = 0.0;
    size_t size = 0;
    bool entityCluster = false;   ///< More than two members.
};

} // namespace docweave::domain
