/**
 * @file LayoutModelBuilder.hpp
 * @brief Turns a parsed element tree into a typed, sectioned layout model.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <map>
#include "domain/ParsedNode.hpp"
#include "domain/LayoutModel.hpp"
#include "domain/TextUnit.hpp"

namespace docweave::application {

/**
 * @class LayoutModelBuilder
 * @brief Flattens the tree in reading order, types each node and rebuilds the heading hierarchy.
 *
 * Missing page or geometry metadata is estimated deterministically, so an
 * input without any data-* attributes still yields a complete model.
 */
class LayoutModelBuilder {
public:
    LayoutModelBuilder() = default;

    /**
     * @brief Builds the layout model for one document.
     * @param root Root of the parsed tree. An empty tree gives an empty model.
     */
    domain::LayoutModel build(const domain::ParsedNode& root);

    /**
     * @brief One normalized TextUnit per text-bearing, non-image element, in reading order.
     */
    static std::vector<domain::TextUnit> extractTextUnits(const domain::LayoutModel& model);

    static domain::ElementKind classifyNode(const domain::ParsedNode& node);
    static int headingLevel(const domain::ParsedNode& node);

    /** @brief Parses "x1,y1,x2,y2"; nullopt when malformed. */
    static std::optional<domain::BoundingBox> parseBoundingBox(const std::string& value);

private:
    struct Inherited {
        std::optional<int> page;
        std::optional<domain::BoundingBox> bbox;
    };

    void walk(const domain::ParsedNode& node, const domain::ParsedNode* parent, Inherited inherited);
    void emit(const domain::ParsedNode& node, const domain::ParsedNode* parent, domain::ElementKind kind, const Inherited& inherited);
    void addImage(const domain::ParsedNode& node, const domain::ParsedNode* parent, const domain::Element& element);
    void buildSections();

    domain::BoundingBox estimateBox(const domain::Element& element);
    double computeConfidence(const domain::ParsedNode& node, domain::ElementKind kind) const;
    std::vector<std::string> semanticTags(const domain::ParsedNode& node, domain::ElementKind kind, const std::string& text) const;
    static std::string collectText(const domain::ParsedNode& node);
    static domain::ImageType classifyImage(const domain::ParsedNode& node);

    domain::LayoutModel m_model;
    std::map<int, double> m_pageCursor;
    int m_lastPage = 1;
    int m_maxPage = 1;
    int m_currentHeadingLevel = 0;
};

} // namespace docweave::application
