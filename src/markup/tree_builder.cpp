#include <hotview/markup/tree_builder.h>
#include <hotview/core/errors.h>
#include <utility>

namespace hotview::markup {

namespace {

Element make_element(const TagEvent& event) {
    Element e;
    e.tag = event.name;
    e.attributes = event.attributes;
    return e;
}

std::string at_offset(const TagEvent& event) {
    return " at offset " + std::to_string(event.offset);
}

} // anonymous namespace

void TreeBuilder::process(const TagEvent& event) {
    switch (event.type) {
        case TagEvent::Start:
            open_element(event);
            break;
        case TagEvent::Empty:
            append_empty(event);
            break;
        case TagEvent::End:
            close_element(event);
            break;
        case TagEvent::Text:
            set_text(event);
            break;
        case TagEvent::EndOfStream:
            break;
    }
}

void TreeBuilder::open_element(const TagEvent& event) {
    if (root_closed_) {
        throw MalformedMarkupError("second root element <" + event.name + ">" + at_offset(event));
    }
    open_elements_.push_back(make_element(event));
}

void TreeBuilder::append_empty(const TagEvent& event) {
    if (root_closed_) {
        throw MalformedMarkupError("second root element <" + event.name + "/>" + at_offset(event));
    }
    if (open_elements_.empty()) {
        // A self-closing element as the whole document.
        open_elements_.push_back(make_element(event));
        root_closed_ = true;
        return;
    }
    open_elements_.back().children.push_back(make_element(event));
}

void TreeBuilder::close_element(const TagEvent& event) {
    if (open_elements_.empty() || root_closed_) {
        throw MalformedMarkupError("unexpected end tag </" + event.name + ">" + at_offset(event));
    }
    const auto& current = open_elements_.back();
    if (current.tag != event.name) {
        throw MalformedMarkupError("end tag </" + event.name + "> does not match <" +
                                   current.tag + ">" + at_offset(event));
    }

    // The root stays on the stack once closed; it has no parent to join.
    if (open_elements_.size() == 1) {
        root_closed_ = true;
        return;
    }

    Element finished = std::move(open_elements_.back());
    open_elements_.pop_back();
    open_elements_.back().children.push_back(std::move(finished));
}

void TreeBuilder::set_text(const TagEvent& event) {
    // Text outside the root element is not part of the document.
    if (open_elements_.empty() || root_closed_) return;
    // Only one text run per element; a later run replaces an earlier one.
    open_elements_.back().text = event.data;
}

Element TreeBuilder::finish() {
    if (open_elements_.empty()) {
        return Element::placeholder();
    }
    if (!root_closed_) {
        throw MalformedMarkupError("unclosed element <" + open_elements_.back().tag +
                                   "> at end of input");
    }
    Element root = std::move(open_elements_.front());
    open_elements_.clear();
    root_closed_ = false;
    return root;
}

Element build(const std::vector<TagEvent>& events) {
    TreeBuilder builder;
    for (const auto& event : events) {
        if (event.type == TagEvent::EndOfStream) break;
        builder.process(event);
    }
    return builder.finish();
}

Element parse_markup(std::string_view markup) {
    TagReader reader(markup);
    TreeBuilder builder;
    while (true) {
        TagEvent event = reader.next();
        if (event.type == TagEvent::EndOfStream) break;
        builder.process(event);
    }
    return builder.finish();
}

} // namespace hotview::markup
