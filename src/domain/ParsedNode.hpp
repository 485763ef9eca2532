/**
 * @file ParsedNode.hpp
 * @brief Input tree supplied by the parsed-tree provider.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace docweave::domain {

/**
 * @struct ParsedNode
 * @brief A node of the HTML-like tree produced by the PDF conversion step.
 *
 * The pipeline never parses markup itself; it consumes this tree as given.
 */
struct ParsedNode {
    std::string tag;                                ///< Lower-case tag name ("h1", "p", "div"...).
    std::string className;
    std::string text;                               ///< Text content of the node and its descendants.
    std::map<std::string, std::string> attributes;  ///< data-page, data-bbox, alt, src...
    std::vector<float> embedding;                   ///< Optional caller-supplied embedding.
    std::vector<ParsedNode> children;

    std::optional<std::string> attribute(const std::string& name) const {
        auto it = attributes.find(name);
        if (it == attributes.end()) return std::nullopt;
        return it->second;
    }

    bool hasAttribute(const std::string& name) const {
        return attributes.find(name) != attributes.end();
    }

    bool hasClass(const std::string& fragment) const {
        return className.find(fragment) != std::string::npos;
    }
};

/**
 * @class ParsedTreeProvider
 * @brief Abstract source of the parsed element tree for one document.
 */
class ParsedTreeProvider {
public:
    virtual ~ParsedTreeProvider() = default;

    /**
     * @brief Loads the document tree.
     * @return Root node of the tree.
     * @throws std::exception when the tree cannot be produced at all.
     */
    virtual ParsedNode loadTree() = 0;
};

} // namespace docweave::domain
