#include <hotview/markup/tag_reader.h>
#include <hotview/core/errors.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace hotview::markup;

namespace {

std::vector<TagEvent::Type> types_of(const std::vector<TagEvent>& events) {
    std::vector<TagEvent::Type> types;
    for (const auto& e : events) types.push_back(e.type);
    return types;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Start, text and end events in document order
// ---------------------------------------------------------------------------
TEST(TagReaderTest, StartTextEndInOrder) {
    auto events = read_all("<div>hello</div>");

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, TagEvent::Start);
    EXPECT_EQ(events[0].name, "div");
    EXPECT_EQ(events[1].type, TagEvent::Text);
    EXPECT_EQ(events[1].data, "hello");
    EXPECT_EQ(events[2].type, TagEvent::End);
    EXPECT_EQ(events[2].name, "div");
    EXPECT_EQ(events[3].type, TagEvent::EndOfStream);
}

// ---------------------------------------------------------------------------
// 2. Self-closing tags are Empty events
// ---------------------------------------------------------------------------
TEST(TagReaderTest, SelfClosingTagIsEmptyEvent) {
    auto events = read_all("<img src=\"a.png\"/>");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, TagEvent::Empty);
    EXPECT_EQ(events[0].name, "img");
    ASSERT_EQ(events[0].attributes.size(), 1u);
    EXPECT_EQ(events[0].attributes[0].name, "src");
    EXPECT_EQ(events[0].attributes[0].value, "a.png");
}

// ---------------------------------------------------------------------------
// 3. All attribute syntaxes, in order, duplicates kept
// ---------------------------------------------------------------------------
TEST(TagReaderTest, AttributeSyntaxes) {
    auto events = read_all("<input a=\"1\" b='2' c=3 disabled a=\"4\" />");

    ASSERT_EQ(events[0].type, TagEvent::Empty);
    const auto& attrs = events[0].attributes;
    ASSERT_EQ(attrs.size(), 5u);
    EXPECT_EQ(attrs[0].name, "a");
    EXPECT_EQ(attrs[0].value, "1");
    EXPECT_EQ(attrs[1].value, "2");
    EXPECT_EQ(attrs[2].value, "3");
    EXPECT_EQ(attrs[3].name, "disabled");
    EXPECT_EQ(attrs[3].value, "");
    EXPECT_EQ(attrs[4].name, "a");
    EXPECT_EQ(attrs[4].value, "4");
}

// ---------------------------------------------------------------------------
// 4. Whitespace-only text is dropped and text runs are trimmed
// ---------------------------------------------------------------------------
TEST(TagReaderTest, WhitespaceTextDroppedAndTrimmed) {
    auto events = read_all("<div>\n  <p>  spaced out \n</p>\n</div>");

    EXPECT_EQ(types_of(events),
              (std::vector<TagEvent::Type>{TagEvent::Start, TagEvent::Start, TagEvent::Text,
                                           TagEvent::End, TagEvent::End,
                                           TagEvent::EndOfStream}));
    EXPECT_EQ(events[2].data, "spaced out");
}

// ---------------------------------------------------------------------------
// 5. Comments, processing instructions and DOCTYPE are skipped
// ---------------------------------------------------------------------------
TEST(TagReaderTest, SkipsCommentsDeclarationsAndInstructions) {
    auto events = read_all(
        "<?xml version=\"1.0\"?>\n"
        "<!DOCTYPE ui [ <!ENTITY x \"y\"> ]>\n"
        "<!-- a <div> in a comment -->\n"
        "<root/>");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, TagEvent::Empty);
    EXPECT_EQ(events[0].name, "root");
}

// ---------------------------------------------------------------------------
// 6. CDATA is delivered verbatim as text
// ---------------------------------------------------------------------------
TEST(TagReaderTest, CdataBecomesText) {
    auto events = read_all("<p><![CDATA[a < b && c]]></p>");

    ASSERT_EQ(events[1].type, TagEvent::Text);
    EXPECT_EQ(events[1].data, "a < b && c");
}

// ---------------------------------------------------------------------------
// 7. Entity and numeric references are decoded in text and attributes
// ---------------------------------------------------------------------------
TEST(TagReaderTest, DecodesReferences) {
    auto events = read_all("<p title=\"&quot;x&quot; &amp; y\">&lt;a&gt; &#65;&#x42; &copy;</p>");

    ASSERT_EQ(events[0].attributes.size(), 1u);
    EXPECT_EQ(events[0].attributes[0].value, "\"x\" & y");
    EXPECT_EQ(events[1].data, "<a> AB \xC2\xA9");
}

// ---------------------------------------------------------------------------
// 8. Unknown references are kept literally
// ---------------------------------------------------------------------------
TEST(TagReaderTest, UnknownReferenceKeptLiterally) {
    auto events = read_all("<p>fish &chips; & more</p>");
    EXPECT_EQ(events[1].data, "fish &chips; & more");
}

// ---------------------------------------------------------------------------
// 9. Namespace prefixes are stripped from element and attribute names
// ---------------------------------------------------------------------------
TEST(TagReaderTest, NamespacePrefixesStripped) {
    auto events = read_all("<ui:div xml:lang=\"en\"></ui:div>");

    EXPECT_EQ(events[0].name, "div");
    ASSERT_EQ(events[0].attributes.size(), 1u);
    EXPECT_EQ(events[0].attributes[0].name, "lang");
    EXPECT_EQ(events[1].name, "div");
}

// ---------------------------------------------------------------------------
// 10. Byte order mark is ignored
// ---------------------------------------------------------------------------
TEST(TagReaderTest, ByteOrderMarkIgnored) {
    auto events = read_all("\xEF\xBB\xBF<a/>");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].name, "a");
}

// ---------------------------------------------------------------------------
// 11. Empty input yields only EndOfStream
// ---------------------------------------------------------------------------
TEST(TagReaderTest, EmptyInputIsEndOfStream) {
    auto events = read_all("   \n ");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, TagEvent::EndOfStream);

    TagReader reader("");
    EXPECT_EQ(reader.next().type, TagEvent::EndOfStream);
    EXPECT_EQ(reader.next().type, TagEvent::EndOfStream);
}

// ---------------------------------------------------------------------------
// 12. Offsets point at the construct
// ---------------------------------------------------------------------------
TEST(TagReaderTest, EventOffsets) {
    auto events = read_all("<a>text<b/></a>");
    EXPECT_EQ(events[0].offset, 0u);
    EXPECT_EQ(events[1].offset, 3u);
    EXPECT_EQ(events[2].offset, 7u);
    EXPECT_EQ(events[3].offset, 11u);
}

// ---------------------------------------------------------------------------
// 12b. position() tracks the read cursor and starts past a byte order mark
// ---------------------------------------------------------------------------
TEST(TagReaderTest, PositionFollowsCursor) {
    TagReader reader("<a>text</a>");
    EXPECT_EQ(reader.position(), 0u);
    EXPECT_EQ(reader.next().type, TagEvent::Start);
    EXPECT_EQ(reader.position(), 3u);
    EXPECT_EQ(reader.next().type, TagEvent::Text);
    EXPECT_EQ(reader.position(), 7u);
    EXPECT_EQ(reader.next().type, TagEvent::End);
    EXPECT_EQ(reader.position(), 11u);
    EXPECT_EQ(reader.next().type, TagEvent::EndOfStream);
    EXPECT_EQ(reader.position(), 11u);

    TagReader with_bom("\xEF\xBB\xBF<a/>");
    EXPECT_EQ(with_bom.position(), 3u);
}

// ---------------------------------------------------------------------------
// 13. Unterminated constructs throw StreamReadError
// ---------------------------------------------------------------------------
TEST(TagReaderTest, UnterminatedConstructsThrow) {
    EXPECT_THROW(read_all("<div"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<div class=\"x>"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<!-- never closed"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<p><![CDATA[ open"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<?xml version"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<a></a"), hotview::StreamReadError);
}

// ---------------------------------------------------------------------------
// 14. Malformed tags throw StreamReadError with an offset
// ---------------------------------------------------------------------------
TEST(TagReaderTest, MalformedTagsThrowWithOffset) {
    EXPECT_THROW(read_all("< div>"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<a></>"), hotview::StreamReadError);
    EXPECT_THROW(read_all("<a></a b=\"1\">"), hotview::StreamReadError);

    try {
        read_all("<a>ok</a><1>");
        FAIL() << "expected StreamReadError";
    } catch (const hotview::StreamReadError& e) {
        EXPECT_EQ(e.offset(), 9u);
    }
}

// ---------------------------------------------------------------------------
// 15. Event type names
// ---------------------------------------------------------------------------
TEST(TagReaderTest, EventTypeNames) {
    EXPECT_STREQ(tag_event_type_name(TagEvent::Start), "start");
    EXPECT_STREQ(tag_event_type_name(TagEvent::Empty), "empty");
    EXPECT_STREQ(tag_event_type_name(TagEvent::EndOfStream), "eof");
}
