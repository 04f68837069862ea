#pragma once
#include <hotview/markup/tag_reader.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hotview::markup {

// One parsed markup element. Children are held by value, so a tree is
// acyclic by construction and can be shared immutably once built.
struct Element {
    std::string tag;
    std::optional<std::string> text;
    std::vector<Attribute> attributes;  // document order, keys may repeat
    std::vector<Element> children;      // document order

    // Last occurrence wins.
    std::optional<std::string> attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;

    // This element plus all descendants.
    std::size_t node_count() const;

    // Depth-first, document order, including this element.
    const Element* find_first(std::string_view tag_name) const;

    bool is_placeholder() const;

    // Stand-in for a document that produced no element at all.
    static Element placeholder();
};

} // namespace hotview::markup
