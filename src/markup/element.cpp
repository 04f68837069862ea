#include <hotview/markup/element.h>

namespace hotview::markup {

std::optional<std::string> Element::attribute(std::string_view name) const {
    for (auto it = attributes.rbegin(); it != attributes.rend(); ++it) {
        if (it->name == name) {
            return it->value;
        }
    }
    return std::nullopt;
}

bool Element::has_attribute(std::string_view name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) return true;
    }
    return false;
}

std::size_t Element::node_count() const {
    std::size_t count = 1;
    for (const auto& child : children) {
        count += child.node_count();
    }
    return count;
}

const Element* Element::find_first(std::string_view tag_name) const {
    if (tag == tag_name) return this;
    for (const auto& child : children) {
        if (auto* found = child.find_first(tag_name)) return found;
    }
    return nullptr;
}

bool Element::is_placeholder() const {
    return tag == "error" && text && *text == "error" && children.empty();
}

Element Element::placeholder() {
    Element e;
    e.tag = "error";
    e.text = "error";
    return e;
}

} // namespace hotview::markup
