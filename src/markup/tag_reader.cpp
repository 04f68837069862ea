#include <hotview/markup/tag_reader.h>
#include <hotview/core/errors.h>
#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace hotview::markup {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == ':' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_name_char(char c) {
    return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-' || c == '.';
}

std::string local_name(const std::string& name) {
    auto colon = name.rfind(':');
    if (colon == std::string::npos || colon + 1 >= name.size()) return name;
    return name.substr(colon + 1);
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f");
    return s.substr(start, end - start + 1);
}

void append_utf8(std::string& out, unsigned long codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

const std::unordered_map<std::string, std::string>& named_entities() {
    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", "\xC2\xA0"}, {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"},
        {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
        {"hellip", "\xE2\x80\xA6"}, {"middot", "\xC2\xB7"},
    };
    return entities;
}

} // anonymous namespace

const char* tag_event_type_name(TagEvent::Type type) {
    switch (type) {
        case TagEvent::Start:       return "start";
        case TagEvent::End:         return "end";
        case TagEvent::Empty:       return "empty";
        case TagEvent::Text:        return "text";
        case TagEvent::EndOfStream: return "eof";
    }
    return "unknown";
}

TagReader::TagReader(std::string_view input) : input_(input) {
    // UTF-8 byte order mark
    if (input_.size() >= 3 && input_.substr(0, 3) == "\xEF\xBB\xBF") {
        pos_ = 3;
    }
}

char TagReader::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char TagReader::peek(size_t ahead) const {
    if (pos_ + ahead < input_.size()) {
        return input_[pos_ + ahead];
    }
    return '\0';
}

bool TagReader::at_end() const {
    return pos_ >= input_.size();
}

bool TagReader::starts_with(std::string_view s) const {
    return input_.substr(pos_, s.size()) == s;
}

void TagReader::skip_whitespace() {
    while (!at_end() && is_space(peek())) {
        ++pos_;
    }
}

void TagReader::skip_until(std::string_view terminator, const char* what) {
    size_t start = pos_;
    auto found = input_.find(terminator, pos_);
    if (found == std::string_view::npos) {
        throw StreamReadError(std::string("unterminated ") + what, start);
    }
    pos_ = found + terminator.size();
}

void TagReader::skip_declaration() {
    // <!DOCTYPE ...> may carry an internal subset in [...]
    size_t start = pos_;
    int bracket_depth = 0;
    while (!at_end()) {
        char c = consume();
        if (c == '[') {
            ++bracket_depth;
        } else if (c == ']') {
            if (bracket_depth > 0) --bracket_depth;
        } else if (c == '>' && bracket_depth == 0) {
            return;
        }
    }
    throw StreamReadError("unterminated declaration", start);
}

std::string TagReader::read_name() {
    std::string name;
    if (!is_name_start(peek())) return name;
    while (!at_end() && is_name_char(peek())) {
        name += consume();
    }
    return name;
}

std::string TagReader::try_consume_entity() {
    // Called after '&' has been consumed.
    size_t start = pos_;

    if (at_end()) return "&";

    if (peek() == '#') {
        consume(); // '#'
        bool hex = false;
        if (peek() == 'x' || peek() == 'X') {
            hex = true;
            consume();
        }

        std::string digits;
        while (!at_end() && (hex ? std::isxdigit(static_cast<unsigned char>(peek()))
                                 : std::isdigit(static_cast<unsigned char>(peek())))) {
            digits += consume();
        }

        if (digits.empty() || peek() != ';') { pos_ = start; return "&"; }
        consume(); // ';'

        unsigned long codepoint = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
        if (codepoint == 0 || codepoint > 0x10FFFF) return "\xEF\xBF\xBD";

        std::string result;
        append_utf8(result, codepoint);
        return result;
    }

    std::string name;
    while (!at_end() && std::isalnum(static_cast<unsigned char>(peek()))) {
        name += consume();
    }
    if (name.empty() || peek() != ';') { pos_ = start; return "&"; }

    auto& entities = named_entities();
    auto it = entities.find(name);
    if (it == entities.end()) { pos_ = start; return "&"; }
    consume(); // ';'
    return it->second;
}

std::string TagReader::read_attribute_value(size_t tag_start) {
    std::string value;
    char quote = peek();
    if (quote == '"' || quote == '\'') {
        size_t value_start = pos_;
        consume();
        while (true) {
            if (at_end()) {
                throw StreamReadError("unterminated attribute value", value_start);
            }
            char c = consume();
            if (c == quote) break;
            if (c == '&') {
                value += try_consume_entity();
            } else {
                value += c;
            }
        }
        return value;
    }

    // Unquoted value runs until whitespace or the end of the tag.
    while (!at_end() && !is_space(peek()) && peek() != '>' &&
           !(peek() == '/' && peek(1) == '>')) {
        char c = consume();
        if (c == '"' || c == '\'' || c == '<' || c == '=') {
            throw StreamReadError("unexpected character in unquoted attribute value", pos_ - 1);
        }
        if (c == '&') {
            value += try_consume_entity();
        } else {
            value += c;
        }
    }
    if (at_end()) {
        throw StreamReadError("unterminated tag", tag_start);
    }
    return value;
}

TagEvent TagReader::read_start_tag(size_t start) {
    TagEvent event;
    event.offset = start;
    event.name = local_name(read_name());

    while (true) {
        skip_whitespace();
        if (at_end()) {
            throw StreamReadError("unterminated tag <" + event.name + ">", start);
        }
        if (peek() == '>') {
            consume();
            event.type = TagEvent::Start;
            return event;
        }
        if (peek() == '/' && peek(1) == '>') {
            pos_ += 2;
            event.type = TagEvent::Empty;
            return event;
        }

        size_t attr_start = pos_;
        std::string name;
        while (!at_end() && !is_space(peek()) && peek() != '=' && peek() != '>' &&
               peek() != '/' && peek() != '"' && peek() != '\'' && peek() != '<') {
            name += consume();
        }
        if (name.empty()) {
            throw StreamReadError("expected attribute name in <" + event.name + ">", attr_start);
        }

        Attribute attr;
        attr.name = local_name(name);

        skip_whitespace();
        if (peek() == '=') {
            consume();
            skip_whitespace();
            if (at_end()) {
                throw StreamReadError("unterminated tag <" + event.name + ">", start);
            }
            attr.value = read_attribute_value(start);
        }
        event.attributes.push_back(std::move(attr));
    }
}

TagEvent TagReader::read_end_tag(size_t start) {
    TagEvent event;
    event.type = TagEvent::End;
    event.offset = start;
    event.name = local_name(read_name());
    if (event.name.empty()) {
        throw StreamReadError("end tag without a name", start);
    }
    skip_whitespace();
    if (at_end()) {
        throw StreamReadError("unterminated end tag </" + event.name + ">", start);
    }
    if (peek() != '>') {
        throw StreamReadError("unexpected content in end tag </" + event.name + ">", pos_);
    }
    consume();
    return event;
}

std::string TagReader::read_text() {
    std::string data;
    while (!at_end() && peek() != '<') {
        char c = consume();
        if (c == '&') {
            data += try_consume_entity();
        } else {
            data += c;
        }
    }
    return data;
}

TagEvent TagReader::next() {
    while (!at_end()) {
        size_t start = pos_;

        if (peek() != '<') {
            std::string text = trim(read_text());
            if (text.empty()) continue;
            TagEvent event;
            event.type = TagEvent::Text;
            event.offset = start;
            event.data = std::move(text);
            return event;
        }

        if (starts_with("<!--")) {
            pos_ += 4;
            skip_until("-->", "comment");
            continue;
        }
        if (starts_with("<![CDATA[")) {
            pos_ += 9;
            size_t content_start = pos_;
            skip_until("]]>", "CDATA section");
            std::string data(input_.substr(content_start, pos_ - 3 - content_start));
            if (trim(data).empty()) continue;
            TagEvent event;
            event.type = TagEvent::Text;
            event.offset = start;
            event.data = std::move(data);
            return event;
        }
        if (starts_with("<!")) {
            pos_ += 2;
            skip_declaration();
            continue;
        }
        if (starts_with("<?")) {
            pos_ += 2;
            skip_until("?>", "processing instruction");
            continue;
        }
        if (starts_with("</")) {
            pos_ += 2;
            return read_end_tag(start);
        }

        consume(); // '<'
        if (!is_name_start(peek())) {
            throw StreamReadError("expected tag name after '<'", start);
        }
        return read_start_tag(start);
    }

    TagEvent eof;
    eof.type = TagEvent::EndOfStream;
    eof.offset = pos_;
    return eof;
}

std::vector<TagEvent> read_all(std::string_view input) {
    TagReader reader(input);
    std::vector<TagEvent> events;
    while (true) {
        events.push_back(reader.next());
        if (events.back().type == TagEvent::EndOfStream) break;
    }
    return events;
}

} // namespace hotview::markup
