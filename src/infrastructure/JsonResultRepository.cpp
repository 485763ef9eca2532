/**
 * @file JsonResultRepository.cpp
 * @brief Implementation of JsonResultRepository.
 */

#include "infrastructure/JsonResultRepository.hpp"
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace docweave::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json optionalField(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json optionalField(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

json bboxToJson(const domain::BoundingBox& box) {
    return json{{"x", box.x}, {"y", box.y}, {"width", box.width}, {"height", box.height}};
}

struct PayloadWriter {
    json operator()(const domain::CatalogEntryData& d) const {
        return {
            {"name", optionalField(d.name)},
            {"dimensions", d.dimensions},
            {"attribution", optionalField(d.attribution)},
            {"colors", d.colors},
            {"materials", d.materials},
            {"hasDescription", d.hasDescription}
        };
    }
    json operator()(const domain::IndexData& d) const { return {{"pageReferences", d.pageReferences}}; }
    json operator()(const domain::SustainabilityData& d) const { return {{"certifications", d.certifications}}; }
    json operator()(const domain::TechnicalData& d) const { return {{"measurements", d.measurements}}; }
    json operator()(const domain::MoodboardData& d) const { return {{"colors", d.colors}}; }
    json operator()(const domain::UnknownData&) const { return json::object(); }
};

} // namespace

JsonResultRepository::JsonResultRepository(const std::string& outputDir, PersistenceService& persistence)
    : m_outputDir(outputDir), m_persistence(persistence) {}

std::string JsonResultRepository::resultPath(const std::string& documentId) const {
    return (fs::path(m_outputDir) / (documentId + ".result.json")).string();
}

std::string JsonResultRepository::serialize(const domain::DocumentResult& result) {
    json j;
    j["documentId"] = result.documentId;
    j["pageCount"] = result.pageCount;
    j["elementCount"] = result.elementCount;
    j["imageCount"] = result.imageCount;
    j["complete"] = result.complete();

    json stages = json::array();
    for (const auto& s : result.stages) {
        stages.push_back({{"stage", s.stage}, {"state", domain::StageStateToString(s.state)}, {"message", s.message}});
    }
    j["stages"] = stages;

    j["quality"] = {
        {"layoutConfidence", optionalField(result.quality.layoutConfidence)},
        {"chunkingQuality", optionalField(result.quality.chunkingQuality)},
        {"associationConfidence", optionalField(result.quality.associationConfidence)},
        {"overall", result.quality.overall}
    };

    json candidates = json::array();
    for (const auto& c : result.candidates) {
        candidates.push_back({
            {"id", c.id},
            {"elementId", c.elementId},
            {"contentType", domain::ContentTypeToString(c.contentType())},
            {"confidence", c.confidence},
            {"qualityScore", c.qualityScore},
            {"pageNumber", c.pageNumber},
            {"fields", std::visit(PayloadWriter{}, c.payload)}
        });
    }
    j["candidates"] = candidates;

    json chunks = json::array();
    for (const auto& c : result.chunks) {
        chunks.push_back({
            {"id", c.id},
            {"index", c.index},
            {"sectionId", c.sectionId},
            {"elementIds", c.elementIds},
            {"type", domain::ChunkTypeToString(c.type)},
            {"hierarchyLevel", c.hierarchyLevel},
            {"pageNumber", c.pageNumber},
            {"bbox", bboxToJson(c.bbox)},
            {"semanticTags", c.semanticTags},
            {"confidence", c.confidence},
            {"characterCount", c.characterCount},
            {"overlapLength", c.overlapLength},
            {"wordCount", c.wordCount},
            {"readingTimeSeconds", c.readingTimeSeconds},
            {"complexity", c.complexity},
            {"finalInSection", c.finalInSection},
            {"sizeFlag", domain::SizeFlagToString(c.sizeFlag)},
            {"hasEmbedding", !c.embedding.empty()},
            {"text", c.text}
        });
    }
    j["chunks"] = chunks;

    json associations = json::array();
    for (const auto& a : result.associations) {
        associations.push_back({
            {"imageId", a.imageId},
            {"targetId", a.targetId},
            {"targetKind", domain::TargetKindToString(a.targetKind)},
            {"spatialScore", a.spatialScore},
            {"lexicalScore", a.lexicalScore},
            {"visualScore", a.visualScore},
            {"overallScore", a.overallScore},
            {"confidence", a.confidence},
            {"pageDifference", a.pageDifference},
            {"reasoning", a.reasoning}
        });
    }
    j["associations"] = associations;

    const auto& st = result.associationStats;
    j["associationStats"] = {
        {"pairsEvaluated", st.pairsEvaluated},
        {"pairsAboveThreshold", st.pairsAboveThreshold},
        {"associationsAssigned", st.associationsAssigned},
        {"averageConfidence", st.averageConfidence},
        {"distribution", {{"high", st.high}, {"good", st.good}, {"moderate", st.moderate}, {"low", st.low}}}
    };

    // Boundary details are bulky; only the entity breaks are kept.
    json breaks = json::array();
    for (const auto& b : result.boundaries) {
        if (b.entityBoundary) breaks.push_back({{"after", b.unitId}, {"strength", b.strength}});
    }
    j["entityBoundaries"] = breaks;

    json clusters = json::array();
    for (const auto& c : result.clusters) {
        clusters.push_back({
            {"id", c.id},
            {"unitIds", c.unitIds},
            {"size", c.size},
            {"coherence", c.coherence},
            {"entityCluster", c.entityCluster}
        });
    }
    j["clusters"] = clusters;

    return j.dump(2);
}

bool JsonResultRepository::saveResult(const domain::DocumentResult& result) {
    if (result.documentId.empty()) {
        std::cerr << "[JsonResultRepository] Refusing to save result without document id" << std::endl;
        return false;
    }
    return m_persistence.saveTextAsync(resultPath(result.documentId), serialize(result));
}

} // namespace docweave::infrastructure
