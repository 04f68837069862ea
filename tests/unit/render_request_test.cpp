#include <hotview/render/render_request.h>
#include <hotview/render/asset_probe.h>
#include <hotview/core/diagnostics.h>
#include <hotview/markup/tree_builder.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace hotview::render;
using hotview::markup::parse_markup;
using hotview::style::Color;
using hotview::style::Keyword;
using hotview::style::Length;
using hotview::style::Slot;
using hotview::style::StyleOp;

namespace {

class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("hotview_render_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter_++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

// Binary PPM: small enough to write by hand, and readable by stb_image.
void write_ppm(const std::filesystem::path& file, int width, int height) {
    std::ofstream out(file, std::ios::binary);
    out << "P6\n" << width << " " << height << "\n255\n";
    out << std::string(static_cast<size_t>(width * height * 3), '\x7f');
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Unknown tags become containers carrying ops, children and text
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, ContainerCarriesOpsChildrenAndText) {
    auto root = parse_markup(
        "<div class=\"flex h-4 h-8\" bg=\"#112233\">"
        "<span>label</span><custom-widget/>caption"
        "</div>");
    auto request = build_request(root);

    ASSERT_TRUE(request.is_container());
    EXPECT_EQ(std::get<ContainerRequest>(request.kind).tag, "div");
    EXPECT_FALSE(request.is_placeholder());
    ASSERT_EQ(request.ops.size(), 3u);
    EXPECT_EQ(request.ops[0], StyleOp::color(Slot::Background, Color{0x11, 0x22, 0x33}));
    EXPECT_EQ(request.ops[1], StyleOp::flag(Slot::Display, Keyword::Flex));
    EXPECT_EQ(request.ops[2], StyleOp::scalar(Slot::Height, Length::rem(2)));
    EXPECT_EQ(request.text.value_or(""), "caption");

    ASSERT_EQ(request.children.size(), 2u);
    EXPECT_EQ(request.children[0].text.value_or(""), "label");
    ASSERT_TRUE(request.children[1].is_container());
    EXPECT_EQ(std::get<ContainerRequest>(request.children[1].kind).tag, "custom-widget");
    EXPECT_EQ(request.node_count(), 3u);
}

// ---------------------------------------------------------------------------
// 2. img and svg map to their kinds
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, ImageAndVectorKinds) {
    auto root = parse_markup(
        "<div>"
        "<img src=\"https://example.com/a.png\" class=\"w-8\"/>"
        "<svg path=\"M0 0 L10 0 L10 20 Z\"/>"
        "</div>");
    RequestContext context;
    context.probe_assets = false;
    auto request = build_request(root, context);

    ASSERT_EQ(request.children.size(), 2u);
    ASSERT_TRUE(request.children[0].is_image());
    const auto& image = std::get<ImageRequest>(request.children[0].kind);
    EXPECT_EQ(image.source, "https://example.com/a.png");
    EXPECT_FALSE(image.natural_size.has_value());
    ASSERT_EQ(request.children[0].ops.size(), 1u);

    ASSERT_TRUE(request.children[1].is_vector());
    const auto& vector = std::get<VectorRequest>(request.children[1].kind);
    EXPECT_EQ(vector.path, "M0 0 L10 0 L10 20 Z");
    EXPECT_FALSE(vector.bounds.has_value());
}

// ---------------------------------------------------------------------------
// 3. Missing required attribute degrades only that element
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, MissingSourceDegradesToPlaceholder) {
    hotview::core::DiagnosticEmitter diagnostics;
    auto root = parse_markup("<div><img class=\"w-4\"/><svg/><span>ok</span></div>");

    RequestContext context;
    context.diagnostics = &diagnostics;
    auto request = build_request(root, context);

    ASSERT_EQ(request.children.size(), 3u);
    EXPECT_TRUE(request.children[0].is_placeholder());
    EXPECT_EQ(request.children[0].text.value_or(""), "error");
    EXPECT_TRUE(request.children[0].ops.empty());
    EXPECT_TRUE(request.children[1].is_placeholder());
    EXPECT_FALSE(request.children[2].is_placeholder());
    EXPECT_EQ(request.children[2].text.value_or(""), "ok");

    auto warnings = diagnostics.events_by_severity(hotview::core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].module, "render");
    EXPECT_NE(warnings[0].message.find("<img>"), std::string::npos);
    EXPECT_NE(warnings[0].message.find("src"), std::string::npos);
    EXPECT_NE(warnings[1].message.find("<svg>"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 4. Empty src counts as missing
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, EmptySourceIsMissing) {
    auto request = build_request(parse_markup("<img src=\"\"/>"));
    EXPECT_TRUE(request.is_placeholder());
}

// ---------------------------------------------------------------------------
// 5. Input kinds
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, InputKinds) {
    auto root = parse_markup(
        "<div>"
        "<input type=\"checkbox\" name=\"agree\" title=\"Agree\"/>"
        "<input type=\"select\" name=\"size\" options=\"small,medium,large\"/>"
        "<input type=\"number\" name=\"count\"/>"
        "<input name=\"plain\"/>"
        "</div>");
    auto request = build_request(root);

    ASSERT_EQ(request.children.size(), 4u);
    for (const auto& child : request.children) {
        ASSERT_TRUE(child.is_input());
    }

    const auto& checkbox = std::get<InputRequest>(request.children[0].kind);
    EXPECT_EQ(checkbox.type, InputRequest::Type::Checkbox);
    EXPECT_EQ(checkbox.name, "agree");
    EXPECT_EQ(checkbox.title, "Agree");

    const auto& select = std::get<InputRequest>(request.children[1].kind);
    EXPECT_EQ(select.type, InputRequest::Type::Select);
    ASSERT_EQ(select.options.size(), 3u);
    EXPECT_EQ(select.options[1], "medium");

    EXPECT_EQ(std::get<InputRequest>(request.children[2].kind).type, InputRequest::Type::Number);
    EXPECT_EQ(std::get<InputRequest>(request.children[3].kind).type, InputRequest::Type::Text);
    EXPECT_STREQ(input_type_name(InputRequest::Type::Select), "select");
}

// ---------------------------------------------------------------------------
// 6. Resolver issues are reported as warnings
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, ResolverIssuesReported) {
    hotview::core::DiagnosticEmitter diagnostics;
    RequestContext context;
    context.diagnostics = &diagnostics;

    auto request = build_request(parse_markup("<div class=\"bg-[zz0000] flex\"/>"), context);

    EXPECT_EQ(request.ops.size(), 1u);
    auto warnings = diagnostics.events_by_module("render");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].stage, "resolve");
    EXPECT_NE(warnings[0].message.find("bg-[zz0000]"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 7. Local images are probed relative to the base directory
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, ProbesLocalImageSize) {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "assets");
    write_ppm(dir.path() / "assets" / "logo.ppm", 4, 3);

    RequestContext context;
    context.base_directory = dir.path().string();
    auto request = build_request(
        parse_markup("<div><img src=\"assets/logo.ppm\"/><img src=\"missing.png\"/></div>"),
        context);

    const auto& found = std::get<ImageRequest>(request.children[0].kind);
    ASSERT_TRUE(found.natural_size.has_value());
    EXPECT_EQ(found.natural_size->width, 4);
    EXPECT_EQ(found.natural_size->height, 3);

    const auto& missing = std::get<ImageRequest>(request.children[1].kind);
    EXPECT_FALSE(missing.natural_size.has_value());
    EXPECT_FALSE(request.children[1].is_placeholder());
}

// ---------------------------------------------------------------------------
// 8. Vector path bounds
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, MeasuresVectorPath) {
    auto bounds = measure_path("M0 0 L10 0 L10 20 Z");
    ASSERT_TRUE(bounds.has_value());
    EXPECT_NEAR(bounds->min_x, 0.0f, 0.01f);
    EXPECT_NEAR(bounds->min_y, 0.0f, 0.01f);
    EXPECT_NEAR(bounds->width(), 10.0f, 0.01f);
    EXPECT_NEAR(bounds->height(), 20.0f, 0.01f);

    auto request = build_request(parse_markup("<svg path=\"M5 5 L15 25\"/>"));
    const auto& vector = std::get<VectorRequest>(request.kind);
    ASSERT_TRUE(vector.bounds.has_value());
    EXPECT_NEAR(vector.bounds->width(), 10.0f, 0.01f);

    EXPECT_FALSE(measure_path("").has_value());
    EXPECT_FALSE(measure_path("M0 0\"/><script/>").has_value());
}

// ---------------------------------------------------------------------------
// 9. Image probing of a non-image file fails quietly
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, ProbeOfNonImageReturnsNothing) {
    TempDir dir;
    auto file = dir.path() / "notes.txt";
    std::ofstream(file) << "not an image";

    EXPECT_FALSE(probe_image_size(file.string()).has_value());
    EXPECT_FALSE(probe_image_size((dir.path() / "absent.png").string()).has_value());
}

// ---------------------------------------------------------------------------
// 10. Tree formatting
// ---------------------------------------------------------------------------
TEST(RenderRequestTest, FormatRequestTree) {
    RequestContext context;
    context.probe_assets = false;
    auto request = build_request(
        parse_markup("<div class=\"flex\"><img src=\"a.png\"/><p>hi</p></div>"), context);

    EXPECT_EQ(format_request_tree(request),
              "container <div> [display=flex]\n"
              "  image src=\"a.png\"\n"
              "  container <p> \"hi\"\n");

    auto placeholder = build_request(parse_markup("<img/>"));
    EXPECT_EQ(format_request_tree(placeholder), "placeholder <error> \"error\"\n");
}
