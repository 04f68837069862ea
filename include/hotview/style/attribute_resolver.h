#pragma once
#include <hotview/markup/tag_reader.h>
#include <hotview/style/style_op.h>
#include <hotview/style/token_table.h>
#include <string>
#include <string_view>
#include <vector>

namespace hotview::style {

// A token or direct attribute that matched a pattern but carried an unusable
// literal. The fallback (color dropped, zero-pixel length) is already applied.
struct ResolveIssue {
    // InvalidNumericValue covers direct font-weight and opacity values.
    enum class Kind { InvalidColorLiteral, InvalidLengthLiteral, InvalidNumericValue };
    Kind kind;
    std::string token;
    std::string message;
};

const char* resolve_issue_kind_name(ResolveIssue::Kind kind);

struct Resolution {
    std::vector<StyleOp> ops;
    std::vector<ResolveIssue> issues;

    // The operation that takes effect for a slot when ops are applied in order.
    const StyleOp* effective(Slot slot) const;
};

// Keeps only the last operation per slot, preserving the position of the
// survivors.
std::vector<StyleOp> collapse(const std::vector<StyleOp>& ops);

// Splits a class attribute value on whitespace.
std::vector<std::string> split_class_list(std::string_view value);

class AttributeResolver {
public:
    AttributeResolver();
    explicit AttributeResolver(const TokenTable& table);

    // Direct attributes first, then class tokens left to right. Each path is
    // collapsed on its own, so a class token never removes a direct attribute's
    // operation; applied in order the class operation lands last.
    Resolution resolve(const std::vector<markup::Attribute>& attributes) const;

    // Resolves one class token, appending to ops. Unknown tokens append nothing.
    void resolve_token(std::string_view token, std::vector<StyleOp>& ops,
                       std::vector<ResolveIssue>& issues) const;

private:
    const TokenTable& table_;

    void resolve_parameterized(std::string_view token, std::vector<StyleOp>& ops,
                               std::vector<ResolveIssue>& issues) const;
    void resolve_direct(const markup::Attribute& attr, std::vector<StyleOp>& ops,
                        std::vector<ResolveIssue>& issues) const;
};

} // namespace hotview::style
