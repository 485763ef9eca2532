/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace docweave::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (root.contains(name) && root[name].is_object()) return root[name];
    return kEmpty;
}

} // namespace

application::PipelineConfig ConfigLoader::Load(const std::string& path) {
    application::PipelineConfig config;
    if (!std::filesystem::exists(path)) {
        return config;
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;

        const json& chunking = sectionOf(j, "chunking");
        readField(chunking, "targetSize", config.chunking.targetSize);
        readField(chunking, "minSize", config.chunking.minSize);
        readField(chunking, "maxSize", config.chunking.maxSize);
        readField(chunking, "overlap", config.chunking.overlap);
        readField(chunking, "respectHierarchy", config.chunking.respectHierarchy);
        readField(chunking, "splitOnEntityBoundaries", config.chunking.splitOnEntityBoundaries);

        const json& boundaries = sectionOf(j, "boundaries");
        readField(boundaries, "entityStrengthThreshold", config.boundaries.entityStrengthThreshold);
        readField(boundaries, "entitySimilarityThreshold", config.boundaries.entitySimilarityThreshold);
        readField(boundaries, "headingMaxLength", config.boundaries.headingMaxLength);

        const json& classifier = sectionOf(j, "classifier");
        readField(classifier, "minLength", config.classifier.minLength);
        readField(classifier, "qualityFloor", config.classifier.qualityFloor);

        const json& association = sectionOf(j, "association");
        readField(association, "spatialWeight", config.association.spatialWeight);
        readField(association, "lexicalWeight", config.association.lexicalWeight);
        readField(association, "visualWeight", config.association.visualWeight);
        readField(association, "minSpatial", config.association.minSpatial);
        readField(association, "minLexical", config.association.minLexical);
        readField(association, "minVisual", config.association.minVisual);
        readField(association, "overallThreshold", config.association.overallThreshold);
        readField(association, "maxPerImage", config.association.maxPerImage);
        readField(association, "maxPerEntity", config.association.maxPerEntity);
        if (association.contains("target") && association["target"].is_string()) {
            auto mode = application::AssociationTargetModeFromString(association["target"].get<std::string>());
            if (mode) {
                config.association.target = *mode;
            } else {
                std::cerr << "[ConfigLoader] Unknown association target '"
                          << association["target"].get<std::string>() << "', keeping auto" << std::endl;
            }
        }

        const json& embedding = sectionOf(j, "embedding");
        readField(embedding, "enabled", config.embedding.enabled);
        readField(embedding, "host", config.embedding.host);
        readField(embedding, "port", config.embedding.port);
        readField(embedding, "model", config.embedding.model);
        readField(embedding, "workers", config.embedding.workers);
        readField(embedding, "cacheTtlSeconds", config.embedding.cacheTtlSeconds);

        readField(sectionOf(j, "batch"), "workers", config.batch.workers);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return application::PipelineConfig{};
    }

    return config;
}

bool ConfigLoader::Save(const std::string& path, const application::PipelineConfig& config) {
    json j = json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            f >> j;
            if (!j.is_object()) j = json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << path << ": " << e.what() << std::endl;
            j = json::object();
        }
    }

    for (const char* name : {"chunking", "boundaries", "classifier", "association", "embedding", "batch"}) {
        if (!j.contains(name) || !j[name].is_object()) j[name] = json::object();
    }

    j["chunking"]["targetSize"] = config.chunking.targetSize;
    j["chunking"]["minSize"] = config.chunking.minSize;
    j["chunking"]["maxSize"] = config.chunking.maxSize;
    j["chunking"]["overlap"] = config.chunking.overlap;
    j["chunking"]["respectHierarchy"] = config.chunking.respectHierarchy;
    j["chunking"]["splitOnEntityBoundaries"] = config.chunking.splitOnEntityBoundaries;

    j["boundaries"]["entityStrengthThreshold"] = config.boundaries.entityStrengthThreshold;
    j["boundaries"]["entitySimilarityThreshold"] = config.boundaries.entitySimilarityThreshold;
    j["boundaries"]["headingMaxLength"] = config.boundaries.headingMaxLength;

    j["classifier"]["minLength"] = config.classifier.minLength;
    j["classifier"]["qualityFloor"] = config.classifier.qualityFloor;

    j["association"]["spatialWeight"] = config.association.spatialWeight;
    j["association"]["lexicalWeight"] = config.association.lexicalWeight;
    j["association"]["visualWeight"] = config.association.visualWeight;
    j["association"]["minSpatial"] = config.association.minSpatial;
    j["association"]["minLexical"] = config.association.minLexical;
    j["association"]["minVisual"] = config.association.minVisual;
    j["association"]["overallThreshold"] = config.association.overallThreshold;
    j["association"]["maxPerImage"] = config.association.maxPerImage;
    j["association"]["maxPerEntity"] = config.association.maxPerEntity;
    j["association"]["target"] = application::AssociationTargetModeToString(config.association.target);

    j["embedding"]["enabled"] = config.embedding.enabled;
    j["embedding"]["host"] = config.embedding.host;
    j["embedding"]["port"] = config.embedding.port;
    j["embedding"]["model"] = config.embedding.model;
    j["embedding"]["workers"] = config.embedding.workers;
    j["embedding"]["cacheTtlSeconds"] = config.embedding.cacheTtlSeconds;

    j["batch"]["workers"] = config.batch.workers;

    std::ofstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << path << std::endl;
        return false;
    }
    f << j.dump(4);
    return !f.fail();
}

} // namespace docweave::infrastructure
