/**
 * @file LayoutModel.hpp
 * @brief Hierarchical layout model: elements, sections, images and page metadata.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <functional>
#include "LayoutElement.hpp"
#include "ImageAsset.hpp"

namespace docweave::domain {

/**
 * @struct Section
 * @brief A heading and its direct content; deeper headings open subsections.
 *
 * Invariant: every subsection has a strictly greater level than its parent.
 * Level 0 is reserved for the untitled preamble, which never has children.
 */
struct Section {
    std::string id;
    std::string title;
    int level = 1;
    int pageNumber = 1;
    std::vector<std::string> elementIds;   ///< Heading first, then its direct content.
    std::vector<Section> subsections;
};

/**
 * @class LayoutModel
 * @brief Owns the elements of one document and indexes them by id.
 */
class LayoutModel {
public:
    LayoutModel() = default;

    /** @brief Appends an element; ids must be unique. */
    void addElement(Element element) {
        m_index[element.id] = m_elements.size();
        m_elements.push_back(std::move(element));
    }

    const std::vector<Element>& elements() const { return m_elements; }

    /** @brief Finds an element by id, nullptr when unknown. */
    const Element* findElement(const std::string& id) const {
        auto it = m_index.find(id);
        if (it == m_index.end()) return nullptr;
        return &m_elements[it->second];
    }

    std::vector<Section>& sections() { return m_sections; }
    const std::vector<Section>& sections() const { return m_sections; }

    std::vector<ImageAsset>& images() { return m_images; }
    const std::vector<ImageAsset>& images() const { return m_images; }

    int pageCount() const { return m_pageCount; }
    void setPageCount(int count) { m_pageCount = count; }

    std::string title() const { return m_title; }
    void setTitle(const std::string& title) { m_title = title; }

    bool empty() const { return m_elements.empty(); }

    /** @brief Mean element confidence, 0 for an empty model. */
    double meanConfidence() const {
        if (m_elements.empty()) return 0.0;
        double sum = 0.0;
        for (const auto& el : m_elements) sum += el.confidence;
        return sum / static_cast<double>(m_elements.size());
    }

    /** @brief Number of elements per kind name. */
    std::map<std::string, int> elementKindCounts() const {
        std::map<std::string, int> counts;
        for (const auto& el : m_elements) counts[ElementKindToString(el.kind)]++;
        return counts;
    }

    /** @brief Visits sections depth-first in document order. */
    void forEachSection(const std::function<void(const Section&)>& visitor) const {
        std::function<void(const Section&)> walk = [&](const Section& s) {
            visitor(s);
            for (const auto& sub : s.subsections) walk(sub);
        };
        for (const auto& s : m_sections) walk(s);
    }

private:
    std::vector<Element> m_elements;
    std::unordered_map<std::string, size_t> m_index;
    std::vector<Section> m_sections;
    std::vector<ImageAsset> m_images;
    int m_pageCount = 1;
    std::string m_title;
};

} // namespace docweave::domain
