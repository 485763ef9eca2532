/**
 * @file BoundaryDetector.hpp
 * @brief Scores logical breaks between adjacent text units and groups units by embedding.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "domain/TextUnit.hpp"
#include "domain/BoundaryScore.hpp"
#include "application/PipelineConfig.hpp"

namespace docweave::application {

using domain::UnitCluster;

/**
 * @struct Similarity
 * @brief Semantic similarity with a marker for the length/first-token fallback.
 */
struct Similarity {
    double value = 0.0;
    bool estimated = false;
};

/**
 * @class BoundaryDetector
 * @brief Deterministic lexical boundary strength plus embedding similarity.
 */
class BoundaryDetector {
public:
    explicit BoundaryDetector(BoundaryConfig config = {});

    /**
     * @brief Scores the break after each unit that has a successor.
     * @return units.size() - 1 scores (none for fewer than two units).
     */
    std::vector<domain::BoundaryScore> score(const std::vector<domain::TextUnit>& units) const;

    domain::BoundaryScore scorePair(const domain::TextUnit& current, const domain::TextUnit& next) const;

    /** @brief Lexical strength in hundredths, clamped to [0,100]. */
    int strengthHundredths(const std::string& text) const;
    double strength(const std::string& text) const;

    domain::BoundaryType classify(const std::string& text, double strength, double similarity) const;
    bool isEntityBoundary(double strength, double similarity) const;
    bool isHeadingLine(const std::string& line) const;

    static Similarity similarity(const domain::TextUnit& a, const domain::TextUnit& b);

    /**
     * @brief Deterministic k-means over the units that carry embeddings.
     * @param k Cluster count; defaults to min(5, ceil(sqrt(n))).
     */
    std::vector<UnitCluster> cluster(const std::vector<domain::TextUnit>& units, std::optional<int> k = std::nullopt) const;

private:
    static std::string reasoning(double strength, const Similarity& similarity);

    BoundaryConfig m_config;
};

} // namespace docweave::application
