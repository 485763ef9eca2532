/**
 * @file JsonTreeProvider.cpp
 * @brief Implementation of JsonTreeProvider.
 */

#include "infrastructure/JsonTreeProvider.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace docweave::infrastructure {

namespace {

std::string stringField(const json& node, const char* key) {
    if (!node.contains(key) || node[key].is_null()) return {};
    if (node[key].is_string()) return node[key].get<std::string>();
    return node[key].dump();
}

domain::ParsedNode fromJson(const json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("tree node is not an object");
    }

    domain::ParsedNode out;
    out.tag = stringField(node, "tag");
    out.className = node.contains("class") ? stringField(node, "class") : stringField(node, "className");
    out.text = stringField(node, "text");

    if (node.contains("attributes") && node["attributes"].is_object()) {
        for (auto it = node["attributes"].begin(); it != node["attributes"].end(); ++it) {
            out.attributes[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }
    if (node.contains("embedding") && node["embedding"].is_array()) {
        out.embedding = node["embedding"].get<std::vector<float>>();
    }
    if (node.contains("children") && node["children"].is_array()) {
        for (const auto& child : node["children"]) {
            out.children.push_back(fromJson(child));
        }
    }
    return out;
}

} // namespace

JsonTreeProvider::JsonTreeProvider(const std::string& path) : m_path(path) {}

domain::ParsedNode JsonTreeProvider::parseTree(const std::string& jsonText) {
    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("malformed tree JSON: ") + e.what());
    }
    try {
        return fromJson(root);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid tree node: ") + e.what());
    }
}

domain::ParsedNode JsonTreeProvider::loadTree() {
    if (!fs::exists(m_path)) {
        throw std::runtime_error("tree file not found: " + m_path);
    }
    std::ifstream file(m_path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open tree file: " + m_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseTree(buffer.str());
}

} // namespace docweave::infrastructure
