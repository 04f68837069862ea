#pragma once
#include <hotview/markup/element.h>
#include <hotview/markup/tag_reader.h>
#include <string_view>
#include <vector>

namespace hotview::markup {

// Stack-based builder over a tag event stream. process() and finish() throw
// MalformedMarkupError on structural errors.
class TreeBuilder {
public:
    void process(const TagEvent& event);

    // Returns the root, or Element::placeholder() when no element was seen.
    Element finish();

    bool root_closed() const { return root_closed_; }
    size_t depth() const { return open_elements_.size(); }

private:
    std::vector<Element> open_elements_;
    bool root_closed_ = false;

    void open_element(const TagEvent& event);
    void append_empty(const TagEvent& event);
    void close_element(const TagEvent& event);
    void set_text(const TagEvent& event);
};

// Builds a tree from a complete event sequence. Events after EndOfStream are
// ignored.
Element build(const std::vector<TagEvent>& events);

// Reads and builds in one pass. Throws StreamReadError or MalformedMarkupError.
Element parse_markup(std::string_view markup);

} // namespace hotview::markup
