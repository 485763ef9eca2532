/**
 * @file LayoutModelBuilder.cpp
 * @brief Implementation of LayoutModelBuilder.
 */

#include "application/LayoutModelBuilder.hpp"
#include "domain/TextNormalizer.hpp"
#include <algorithm>
#include <sstream>
#include <cctype>
#include <functional>

namespace docweave::application {

namespace {

constexpr double kDefaultWidth = 500.0;
constexpr double kLeftMargin = 50.0;
constexpr double kTopMargin = 100.0;

const char* const kContentKeywords[] = {
    "specification", "property", "material", "technical",
    "standard", "performance", "installation", "maintenance"
};

std::optional<int> parsePage(const std::string& value) {
    std::istringstream ss(value);
    int page = 0;
    if (!(ss >> page) || page < 1) return std::nullopt;
    return page;
}

bool isHeadingTag(const std::string& tag) {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

} // namespace

domain::ElementKind LayoutModelBuilder::classifyNode(const domain::ParsedNode& node) {
    const std::string tag = domain::toLower(node.tag);
    if (isHeadingTag(tag) || node.hasClass("heading")) return domain::ElementKind::Heading;
    if (tag == "p" || node.hasClass("paragraph")) return domain::ElementKind::Paragraph;
    if (tag == "table") return domain::ElementKind::Table;
    if (tag == "ul" || tag == "ol" || node.hasClass("list")) return domain::ElementKind::List;
    if (tag == "img" || node.hasClass("image")) return domain::ElementKind::Image;
    if (tag == "span") return domain::ElementKind::Span;
    return domain::ElementKind::Container;
}

int LayoutModelBuilder::headingLevel(const domain::ParsedNode& node) {
    const std::string tag = domain::toLower(node.tag);
    if (isHeadingTag(tag)) return tag[1] - '0';

    auto pos = node.className.find("heading-");
    if (pos != std::string::npos) {
        size_t digit = pos + 8;
        if (digit < node.className.size() && node.className[digit] >= '1' && node.className[digit] <= '6') {
            return node.className[digit] - '0';
        }
    }
    return 1;
}

std::optional<domain::BoundingBox> LayoutModelBuilder::parseBoundingBox(const std::string& value) {
    std::vector<double> coords;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) {
        std::istringstream num(domain::trim(part));
        double v = 0.0;
        if (!(num >> v)) return std::nullopt;
        coords.push_back(v);
    }
    if (coords.size() != 4) return std::nullopt;

    domain::BoundingBox box;
    box.x = coords[0];
    box.y = coords[1];
    box.width = coords[2] - coords[0];
    box.height = coords[3] - coords[1];
    if (box.width < 0 || box.height < 0) return std::nullopt;
    return box;
}

domain::LayoutModel LayoutModelBuilder::build(const domain::ParsedNode& root) {
    m_model = domain::LayoutModel();
    m_pageCursor.clear();
    m_lastPage = 1;
    m_maxPage = 1;
    m_currentHeadingLevel = 0;

    walk(root, nullptr, Inherited{});
    buildSections();

    m_model.setPageCount(std::max(m_maxPage, 1));
    for (const auto& el : m_model.elements()) {
        if (el.isHeading()) {
            m_model.setTitle(domain::trim(el.text));
            break;
        }
    }
    return std::move(m_model);
}

void LayoutModelBuilder::walk(const domain::ParsedNode& node, const domain::ParsedNode* parent, Inherited inherited) {
    if (auto page = node.attribute("data-page")) {
        if (auto parsed = parsePage(*page)) inherited.page = parsed;
    }

    domain::ElementKind kind = classifyNode(node);

    if (kind == domain::ElementKind::Container) {
        if (!node.children.empty()) {
            if (auto bbox = node.attribute("data-bbox")) {
                if (auto parsed = parseBoundingBox(*bbox)) inherited.bbox = parsed;
            }
            for (const auto& child : node.children) {
                walk(child, &node, inherited);
            }
            return;
        }
        if (domain::trim(node.text).empty()) return;
    }

    if (kind == domain::ElementKind::Span && domain::trim(collectText(node)).empty()) return;

    emit(node, parent, kind, inherited);
}

void LayoutModelBuilder::emit(const domain::ParsedNode& node, const domain::ParsedNode* parent,
                              domain::ElementKind kind, const Inherited& inherited) {
    domain::Element el;
    el.id = "el_" + std::to_string(m_model.elements().size());
    el.tagName = domain::toLower(node.tag);
    el.className = node.className;
    el.kind = kind;
    el.text = kind == domain::ElementKind::Image ? std::string() : collectText(node);
    el.attributes = node.attributes;
    el.embedding = node.embedding;

    el.pageNumber = inherited.page.value_or(m_lastPage);
    m_lastPage = el.pageNumber;
    m_maxPage = std::max(m_maxPage, el.pageNumber);

    if (kind == domain::ElementKind::Heading) {
        el.headingLevel = headingLevel(node);
        el.hierarchy = el.headingLevel;
        m_currentHeadingLevel = el.headingLevel;
    } else {
        el.hierarchy = m_currentHeadingLevel + 1;
    }

    std::optional<domain::BoundingBox> box;
    if (auto raw = node.attribute("data-bbox")) box = parseBoundingBox(*raw);
    if (!box) box = inherited.bbox;
    if (box) {
        el.bbox = *box;
        el.hasExplicitBox = true;
    } else {
        el.bbox = estimateBox(el);
    }

    el.confidence = computeConfidence(node, kind);
    el.semanticTags = semanticTags(node, kind, el.text);

    if (kind == domain::ElementKind::Image) {
        addImage(node, parent, el);
    }
    m_model.addElement(std::move(el));
}

domain::BoundingBox LayoutModelBuilder::estimateBox(const domain::Element& element) {
    double height = 30.0;
    double width = kDefaultWidth;
    switch (element.kind) {
        case domain::ElementKind::Heading:
            height = 40.0 + (6 - element.headingLevel) * 5.0;
            break;
        case domain::ElementKind::Paragraph:
            height = std::max(30.0, static_cast<double>(element.text.size()) / 80.0 * 20.0);
            break;
        case domain::ElementKind::Table:
            height = 150.0;
            break;
        case domain::ElementKind::Image:
            width = 200.0;
            height = 150.0;
            break;
        default:
            break;
    }

    double& cursor = m_pageCursor[element.pageNumber];
    domain::BoundingBox box;
    box.x = kLeftMargin;
    box.y = kTopMargin + cursor;
    box.width = width;
    box.height = height;
    cursor += height;
    return box;
}

double LayoutModelBuilder::computeConfidence(const domain::ParsedNode& node, domain::ElementKind kind) const {
    double confidence = 0.8;
    if (node.hasAttribute("data-type")) confidence += 0.1;
    if (node.hasAttribute("data-bbox")) confidence += 0.05;
    if (node.hasClass("layout-element")) confidence += 0.05;
    if (kind == domain::ElementKind::Container && node.className.empty()) confidence -= 0.2;
    return std::clamp(confidence, 0.5, 1.0);
}

std::vector<std::string> LayoutModelBuilder::semanticTags(const domain::ParsedNode& node, domain::ElementKind kind,
                                                          const std::string& text) const {
    std::vector<std::string> tags;
    auto add = [&tags](const std::string& tag) {
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(tag);
    };

    add(domain::ElementKindToString(kind));
    for (const auto& cls : domain::splitWords(node.className)) {
        if (cls.size() > 2) add(cls);
    }
    const std::string lower = domain::toLower(text);
    for (const char* keyword : kContentKeywords) {
        if (lower.find(keyword) != std::string::npos) add(keyword);
    }
    return tags;
}

std::string LayoutModelBuilder::collectText(const domain::ParsedNode& node) {
    if (!node.text.empty()) return node.text;
    std::string out;
    for (const auto& child : node.children) {
        std::string part = collectText(child);
        if (part.empty()) continue;
        if (!out.empty()) out += ' ';
        out += part;
    }
    return out;
}

domain::ImageType LayoutModelBuilder::classifyImage(const domain::ParsedNode& node) {
    std::string cues = domain::toLower(node.className + " " + node.attribute("alt").value_or("") + " " +
                                       node.attribute("src").value_or(""));
    auto has = [&cues](const char* word) { return cues.find(word) != std::string::npos; };

    if (has("sample") || has("swatch") || has("texture") || has("material")) return domain::ImageType::MaterialSample;
    if (has("diagram") || has("drawing") || has("schematic") || has("technical")) return domain::ImageType::Diagram;
    if (has("chart") || has("graph")) return domain::ImageType::Chart;
    if (has("photo") || has(".jpg") || has(".jpeg")) return domain::ImageType::Photo;
    return domain::ImageType::Illustration;
}

void LayoutModelBuilder::addImage(const domain::ParsedNode& node, const domain::ParsedNode* parent,
                                  const domain::Element& element) {
    domain::ImageAsset image;
    image.id = "img_" + std::to_string(m_model.images().size());
    image.source = node.attribute("src").value_or("");
    image.pageNumber = element.pageNumber;
    image.bbox = element.bbox;
    image.type = classifyImage(node);
    image.embedding = node.embedding;

    if (auto alt = node.attribute("alt")) {
        if (!domain::trim(*alt).empty()) image.altText = domain::trim(*alt);
    }

    if (auto caption = node.attribute("data-caption")) {
        if (!domain::trim(*caption).empty()) image.caption = domain::trim(*caption);
    }
    if (!image.caption && parent) {
        for (const auto& sibling : parent->children) {
            if (&sibling == &node) continue;
            if (domain::toLower(sibling.tag) == "figcaption" || sibling.hasClass("caption")) {
                std::string text = domain::trim(collectText(sibling));
                if (!text.empty()) {
                    image.caption = text;
                    break;
                }
            }
        }
    }

    m_model.images().push_back(std::move(image));
}

void LayoutModelBuilder::buildSections() {
    const auto& elements = m_model.elements();

    domain::Section preamble;
    preamble.id = "sec_preamble";
    preamble.level = 0;

    std::vector<domain::Section> flat;
    for (const auto& el : elements) {
        if (el.isHeading()) {
            domain::Section s;
            s.id = "sec_" + std::to_string(flat.size());
            s.title = domain::trim(el.text);
            s.level = el.headingLevel;
            s.pageNumber = el.pageNumber;
            s.elementIds.push_back(el.id);
            flat.push_back(std::move(s));
        } else if (flat.empty()) {
            if (preamble.elementIds.empty()) preamble.pageNumber = el.pageNumber;
            preamble.elementIds.push_back(el.id);
        } else {
            flat.back().elementIds.push_back(el.id);
        }
    }

    // A section adopts the following sections of greater level until one of equal or lower level appears.
    size_t pos = 0;
    std::function<std::vector<domain::Section>(int)> nest = [&](int parentLevel) {
        std::vector<domain::Section> out;
        while (pos < flat.size() && flat[pos].level > parentLevel) {
            domain::Section s = std::move(flat[pos++]);
            s.subsections = nest(s.level);
            out.push_back(std::move(s));
        }
        return out;
    };

    auto& sections = m_model.sections();
    sections.clear();
    if (!preamble.elementIds.empty()) sections.push_back(std::move(preamble));
    auto roots = nest(0);
    for (auto& s : roots) sections.push_back(std::move(s));
}

std::vector<domain::TextUnit> LayoutModelBuilder::extractTextUnits(const domain::LayoutModel& model) {
    std::vector<domain::TextUnit> units;
    for (const auto& el : model.elements()) {
        if (el.kind == domain::ElementKind::Image) continue;
        std::string text = domain::normalizeWhitespace(el.text);
        if (domain::trim(text).empty()) continue;

        domain::TextUnit unit;
        unit.id = "tu_" + std::to_string(units.size());
        unit.elementId = el.id;
        unit.kind = el.kind;
        unit.text = std::move(text);
        unit.pageNumber = el.pageNumber;
        unit.bbox = el.bbox;
        unit.embedding = el.embedding;
        units.push_back(std::move(unit));
    }
    return units;
}

} // namespace docweave::application
