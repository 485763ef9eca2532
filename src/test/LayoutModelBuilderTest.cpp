#include <iostream>
#include <string>
#include <vector>
#include <cmath>
#include <cassert>
#include "application/LayoutModelBuilder.hpp"

using namespace docweave;

namespace {

domain::ParsedNode Node(const std::string& tag, const std::string& text,
                        std::map<std::string, std::string> attrs = {},
                        std::vector<domain::ParsedNode> children = {}) {
    domain::ParsedNode n;
    n.tag = tag;
    n.text = text;
    n.attributes = std::move(attrs);
    n.children = std::move(children);
    return n;
}

domain::ParsedNode SampleCatalog() {
    return Node("div", "", {{"data-page", "1"}}, {
        Node("p", "Intro text."),
        Node("h1", "Catalog"),
        Node("p", "Our oak collection."),
        Node("h2", "Chairs"),
        Node("p", "Lounge chair specification follows.", {{"data-bbox", "10, 20, 110, 70"}}),
        Node("div", "", {{"data-page", "2"}}, {
            Node("img", "", {{"src", "chair.jpg"}, {"alt", "Chair photo"}}),
            Node("figcaption", "Lounge chair in oak")
        }),
        Node("h1", "Index"),
        Node("p", "Chairs ... 4")
    });
}

} // namespace

int main() {
    application::LayoutModelBuilder builder;

    std::cout << "[Test] Element extraction..." << std::endl;
    auto model = builder.build(SampleCatalog());
    const auto& els = model.elements();
    assert(els.size() == 9);
    assert(els[0].id == "el_0" && els[0].kind == domain::ElementKind::Paragraph);
    assert(els[1].isHeading() && els[1].headingLevel == 1);
    assert(els[3].headingLevel == 2);
    assert(els[4].hierarchy == 3);
    assert(els[5].kind == domain::ElementKind::Image && els[5].text.empty());
    assert(els[5].pageNumber == 2);
    assert(els[6].kind == domain::ElementKind::Container);
    assert(model.pageCount() == 2);
    assert(model.title() == "Catalog");
    assert(model.findElement("el_4") == &els[4]);
    assert(model.findElement("missing") == nullptr);
    std::cout << "[PASS] Elements." << std::endl;

    std::cout << "[Test] Bounding boxes and confidence..." << std::endl;
    assert(els[4].hasExplicitBox);
    assert(els[4].bbox.x == 10 && els[4].bbox.width == 100 && els[4].bbox.height == 50);
    assert(std::fabs(els[4].confidence - 0.85) < 1e-9);
    assert(!els[0].hasExplicitBox && els[0].bbox.x == 50 && els[0].bbox.y == 100);
    assert(els[1].bbox.y == 130);
    assert(std::fabs(els[0].confidence - 0.8) < 1e-9);
    assert(std::fabs(els[6].confidence - 0.6) < 1e-9);
    bool tagged = false;
    for (const auto& t : els[4].semanticTags) {
        if (t == "specification") tagged = true;
    }
    assert(tagged);
    std::cout << "[PASS] Boxes." << std::endl;

    std::cout << "[Test] Image assets..." << std::endl;
    assert(model.images().size() == 1);
    const auto& img = model.images()[0];
    assert(img.id == "img_0" && img.source == "chair.jpg");
    assert(img.caption && *img.caption == "Lounge chair in oak");
    assert(img.altText && *img.altText == "Chair photo");
    assert(img.type == domain::ImageType::Photo);
    std::cout << "[PASS] Images." << std::endl;

    std::cout << "[Test] Section hierarchy..." << std::endl;
    const auto& sections = model.sections();
    assert(sections.size() == 3);
    assert(sections[0].id == "sec_preamble" && sections[0].level == 0 && sections[0].elementIds.size() == 1);
    assert(sections[1].title == "Catalog" && sections[1].subsections.size() == 1);
    assert(sections[1].subsections[0].title == "Chairs");
    assert(sections[1].subsections[0].elementIds.size() == 4);
    assert(sections[2].title == "Index" && sections[2].subsections.empty());
    int visited = 0;
    model.forEachSection([&visited](const domain::Section&) { visited++; });
    assert(visited == 4);
    std::cout << "[PASS] Sections." << std::endl;

    std::cout << "[Test] Text units skip images..." << std::endl;
    auto units = application::LayoutModelBuilder::extractTextUnits(model);
    assert(units.size() == 8);
    assert(units[0].id == "tu_0");
    assert(units[5].elementId == "el_6");
    std::cout << "[PASS] Text units." << std::endl;

    std::cout << "[Test] Helpers..." << std::endl;
    assert(!application::LayoutModelBuilder::parseBoundingBox("1,2,3"));
    assert(!application::LayoutModelBuilder::parseBoundingBox("10,10,5,5"));
    assert(!application::LayoutModelBuilder::parseBoundingBox("a,b,c,d"));
    auto heading = Node("div", "Materials", {});
    heading.className = "heading-3";
    assert(application::LayoutModelBuilder::classifyNode(heading) == domain::ElementKind::Heading);
    assert(application::LayoutModelBuilder::headingLevel(heading) == 3);
    assert(application::LayoutModelBuilder::classifyNode(Node("ul", "")) == domain::ElementKind::List);
    std::cout << "[PASS] Helpers." << std::endl;

    std::cout << "[Test] Empty tree yields empty model..." << std::endl;
    auto empty = builder.build(domain::ParsedNode{});
    assert(empty.empty() && empty.sections().empty() && empty.images().empty());
    assert(empty.pageCount() == 1);
    assert(application::LayoutModelBuilder::extractTextUnits(empty).empty());
    std::cout << "[PASS] Empty tree." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
