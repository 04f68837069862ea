#include <hotview/render/render_request.h>
#include <hotview/render/asset_probe.h>
#include <hotview/core/diagnostics.h>
#include <hotview/core/errors.h>
#include <filesystem>
#include <sstream>
#include <type_traits>

namespace hotview::render {

namespace {

constexpr const char kModule[] = "render";

std::vector<std::string> split_options(const std::string& value) {
    std::vector<std::string> options;
    std::string current;
    for (char c : value) {
        if (c == ',') {
            options.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() || !options.empty()) options.push_back(current);
    return options;
}

std::string require(const markup::Element& element, const char* attribute) {
    auto value = element.attribute(attribute);
    if (!value || value->empty()) {
        throw MissingRequiredAttributeError(element.tag, attribute);
    }
    return *value;
}

std::string resolve_source_path(const std::string& source, const std::string& base_directory) {
    namespace fs = std::filesystem;
    fs::path path(source);
    if (path.is_relative() && !base_directory.empty()) {
        path = fs::path(base_directory) / path;
    }
    return path.string();
}

RenderKind make_kind(const markup::Element& element, const RequestContext& context) {
    if (element.tag == "img") {
        ImageRequest image;
        image.source = require(element, "src");
        if (context.probe_assets && image.source.find("://") == std::string::npos) {
            image.natural_size =
                probe_image_size(resolve_source_path(image.source, context.base_directory));
        }
        return image;
    }

    if (element.tag == "svg") {
        VectorRequest vector;
        vector.path = require(element, "path");
        if (context.probe_assets) {
            vector.bounds = measure_path(vector.path);
        }
        return vector;
    }

    if (element.tag == "input") {
        InputRequest input;
        std::string type = element.attribute("type").value_or("text");
        if (type == "checkbox") {
            input.type = InputRequest::Type::Checkbox;
        } else if (type == "select") {
            input.type = InputRequest::Type::Select;
            input.options = split_options(element.attribute("options").value_or(""));
        } else if (type == "number") {
            input.type = InputRequest::Type::Number;
        }
        input.name = element.attribute("name").value_or("");
        input.title = element.attribute("title").value_or("");
        return input;
    }

    return ContainerRequest{element.tag, false};
}

RenderRequest make_placeholder() {
    RenderRequest request;
    request.kind = ContainerRequest{"error", true};
    request.text = "error";
    return request;
}

void report_issues(const style::Resolution& resolution, const markup::Element& element,
                   core::DiagnosticEmitter* diagnostics) {
    if (!diagnostics) return;
    for (const auto& issue : resolution.issues) {
        diagnostics->warning(kModule, "resolve",
                             "<" + element.tag + "> " + issue.token + ": " + issue.message);
    }
}

void format_into(const RenderRequest& request, int depth, std::ostringstream& out) {
    out << std::string(static_cast<size_t>(depth) * 2, ' ');
    std::visit([&out](const auto& kind) {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, ContainerRequest>) {
            out << (kind.placeholder ? "placeholder" : "container") << " <" << kind.tag << ">";
        } else if constexpr (std::is_same_v<T, ImageRequest>) {
            out << "image src=\"" << kind.source << "\"";
            if (kind.natural_size) {
                out << " " << kind.natural_size->width << "x" << kind.natural_size->height;
            }
        } else if constexpr (std::is_same_v<T, VectorRequest>) {
            out << "vector";
            if (kind.bounds) {
                out << " " << kind.bounds->width() << "x" << kind.bounds->height();
            }
        } else {
            out << "input type=" << input_type_name(kind.type);
            if (!kind.name.empty()) out << " name=\"" << kind.name << "\"";
            if (!kind.options.empty()) out << " options=" << kind.options.size();
        }
    }, request.kind);

    if (!request.ops.empty()) {
        out << " [";
        for (size_t i = 0; i < request.ops.size(); ++i) {
            if (i) out << ' ';
            out << style::describe(request.ops[i]);
        }
        out << "]";
    }
    if (request.text) {
        out << " \"" << *request.text << "\"";
    }
    out << "\n";

    for (const auto& child : request.children) {
        format_into(child, depth + 1, out);
    }
}

} // anonymous namespace

const char* input_type_name(InputRequest::Type type) {
    switch (type) {
        case InputRequest::Type::Text:     return "text";
        case InputRequest::Type::Number:   return "number";
        case InputRequest::Type::Checkbox: return "checkbox";
        case InputRequest::Type::Select:   return "select";
    }
    return "unknown";
}

bool RenderRequest::is_placeholder() const {
    auto* container = std::get_if<ContainerRequest>(&kind);
    return container && container->placeholder;
}

std::size_t RenderRequest::node_count() const {
    std::size_t count = 1;
    for (const auto& child : children) {
        count += child.node_count();
    }
    return count;
}

RenderRequest build_request(const markup::Element& element, const RequestContext& context) {
    RenderRequest request;
    try {
        request.kind = make_kind(element, context);
    } catch (const MissingRequiredAttributeError& e) {
        if (context.diagnostics) {
            context.diagnostics->warning(kModule, "build", e.what());
        }
        return make_placeholder();
    }

    static const style::AttributeResolver default_resolver;
    const auto& resolver = context.resolver ? *context.resolver : default_resolver;
    auto resolution = resolver.resolve(element.attributes);
    report_issues(resolution, element, context.diagnostics);
    request.ops = std::move(resolution.ops);

    request.children.reserve(element.children.size());
    for (const auto& child : element.children) {
        request.children.push_back(build_request(child, context));
    }
    request.text = element.text;
    return request;
}

std::string format_request_tree(const RenderRequest& request) {
    std::ostringstream out;
    format_into(request, 0, out);
    return out.str();
}

} // namespace hotview::render
