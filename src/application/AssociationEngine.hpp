/**
 * @file AssociationEngine.hpp
 * @brief Scores images against text targets and resolves a bounded association set.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ImageAsset.hpp"
#include "domain/Association.hpp"
#include "domain/EntityCandidate.hpp"
#include "domain/Chunk.hpp"
#include "domain/DocumentResult.hpp"
#include "application/PipelineConfig.hpp"

namespace docweave::application {

/**
 * @struct AssociationOutcome
 * @brief Assigned associations plus the counters of the run that produced them.
 */
struct AssociationOutcome {
    std::vector<domain::Association> associations;
    domain::AssociationStats stats;
};

/**
 * @class AssociationEngine
 * @brief Weighted spatial/lexical/visual scoring followed by greedy fan-out-capped assignment.
 *
 * Assignment is deterministic: candidates are ordered by overall score, then
 * image id, then target id, and accepted while both sides have quota left.
 */
class AssociationEngine {
public:
    explicit AssociationEngine(AssociationConfig config = {});

    AssociationOutcome associate(const std::vector<domain::ImageAsset>& images,
                                 const std::vector<domain::AssociationTarget>& targets) const;

    domain::Association scorePair(const domain::ImageAsset& image, const domain::AssociationTarget& target) const;

    static double spatialScore(int pageDifference);

    /**
     * @brief Word-set Jaccard of image text against the target text, plus a literal-name bonus.
     * @return 0 when either side has no text.
     */
    static double lexicalScore(const std::string& imageText, const domain::AssociationTarget& target);

    static double visualScore(const domain::ImageAsset& image, const domain::AssociationTarget& target, double lexical);

    static std::string reasoning(double spatial, double lexical, double visual, double overall);

    static domain::AssociationTarget toTarget(const domain::EntityCandidate& candidate, const std::vector<float>& embedding);
    static domain::AssociationTarget toTarget(const domain::Chunk& chunk);

private:
    bool passesFactorMinimums(const domain::Association& a) const;

    AssociationConfig m_config;
};

} // namespace docweave::application
