#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hotview::markup {

struct Attribute {
    std::string name;
    std::string value;
};

struct TagEvent {
    enum Type { Start, End, Empty, Text, EndOfStream };
    Type type = EndOfStream;
    std::string name;                  // local name for Start/End/Empty
    std::vector<Attribute> attributes; // Start/Empty only
    std::string data;                  // Text only
    std::size_t offset = 0;            // byte offset of the construct
};

const char* tag_event_type_name(TagEvent::Type type);

// Splits markup text into start/end/empty/text events. Comments, processing
// instructions and DOCTYPE declarations are skipped, CDATA sections become text,
// character references are decoded and namespace prefixes are dropped.
// Throws StreamReadError on malformed input.
class TagReader {
public:
    explicit TagReader(std::string_view input);

    TagEvent next();

    std::size_t position() const { return pos_; }

private:
    std::string_view input_;
    size_t pos_ = 0;

    char consume();
    char peek(size_t ahead = 0) const;
    bool at_end() const;
    bool starts_with(std::string_view s) const;
    void skip_whitespace();

    void skip_until(std::string_view terminator, const char* what);
    void skip_declaration();
    TagEvent read_end_tag(size_t start);
    TagEvent read_start_tag(size_t start);
    std::string read_name();
    std::string read_attribute_value(size_t tag_start);
    std::string read_text();

    // Tries to consume a character reference after '&'. Returns the decoded
    // text, or "&" when the reference is not recognised.
    std::string try_consume_entity();
};

// Reads every event up to and including EndOfStream.
std::vector<TagEvent> read_all(std::string_view input);

} // namespace hotview::markup
