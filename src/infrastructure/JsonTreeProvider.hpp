/**
 * @file JsonTreeProvider.hpp
 * @brief Reads the parsed element tree from a JSON file.
 */

#pragma once
#include <string>
#include "domain/ParsedNode.hpp"

namespace docweave::infrastructure {

/**
 * @class JsonTreeProvider
 * @brief ParsedTreeProvider over a JSON document.
 *
 * Node layout: {"tag", "class", "text", "attributes": {}, "embedding": [], "children": []}.
 * Every field is optional; non-string attribute values are stored as their JSON text.
 */
class JsonTreeProvider : public domain::ParsedTreeProvider {
public:
    explicit JsonTreeProvider(const std::string& path);

    /** @throws std::runtime_error when the file is missing or not a valid tree. */
    domain::ParsedNode loadTree() override;

    /** @brief Parses a tree from JSON text. @throws std::runtime_error on malformed input. */
    static domain::ParsedNode parseTree(const std::string& jsonText);

private:
    std::string m_path;
};

} // namespace docweave::infrastructure
