#pragma once
#include <hotview/markup/element.h>
#include <hotview/style/attribute_resolver.h>
#include <hotview/style/style_op.h>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hotview::core {
class DiagnosticEmitter;
} // namespace hotview::core

namespace hotview::render {

struct Size {
    int width = 0;
    int height = 0;
};

struct Bounds {
    float min_x = 0, min_y = 0, max_x = 0, max_y = 0;

    float width() const { return max_x - min_x; }
    float height() const { return max_y - min_y; }
};

// Generic box; also used for unknown tags and for degraded elements.
struct ContainerRequest {
    std::string tag;
    bool placeholder = false;
};

struct ImageRequest {
    std::string source;
    std::optional<Size> natural_size;
};

struct VectorRequest {
    std::string path;
    std::optional<Bounds> bounds;
};

struct InputRequest {
    enum class Type { Text, Number, Checkbox, Select };
    Type type = Type::Text;
    std::string name;
    std::string title;
    std::vector<std::string> options;  // Select only
};

const char* input_type_name(InputRequest::Type type);

using RenderKind = std::variant<ContainerRequest, ImageRequest, VectorRequest, InputRequest>;

// What the host rendering layer is asked to construct for one element.
struct RenderRequest {
    RenderKind kind;
    std::vector<style::StyleOp> ops;
    std::vector<RenderRequest> children;
    std::optional<std::string> text;  // drawn after the children

    bool is_container() const { return std::holds_alternative<ContainerRequest>(kind); }
    bool is_image() const { return std::holds_alternative<ImageRequest>(kind); }
    bool is_vector() const { return std::holds_alternative<VectorRequest>(kind); }
    bool is_input() const { return std::holds_alternative<InputRequest>(kind); }
    bool is_placeholder() const;

    std::size_t node_count() const;
};

struct RequestContext {
    const style::AttributeResolver* resolver = nullptr;   // default resolver when null
    core::DiagnosticEmitter* diagnostics = nullptr;       // optional
    std::string base_directory;                           // for relative image sources
    bool probe_assets = true;
};

// Builds the request tree for an element and its descendants. An element
// missing a required attribute degrades to a placeholder container on its own;
// the rest of the tree is unaffected.
RenderRequest build_request(const markup::Element& element, const RequestContext& context = {});

// Indented, one line per element, for the command-line host and tests.
std::string format_request_tree(const RenderRequest& request);

} // namespace hotview::render
