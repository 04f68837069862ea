#include <hotview/style/attribute_resolver.h>
#include <hotview/style/value_parser.h>
#include <hotview/core/errors.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace hotview::style {

namespace {

constexpr const char kClassAttribute[] = "class";

// Bracketed literal forms such as "bg-[#112233]" or "rounded-tl-[8px]".
struct BracketPattern {
    enum class Literal { Color, Length, ColorOrLength };
    Literal literal;
    std::vector<Slot> length_slots;
    Slot color_slot = Slot::Background;
};

const std::unordered_map<std::string, BracketPattern>& bracket_patterns() {
    using L = BracketPattern::Literal;
    const std::vector<Slot> all_padding = {Slot::PaddingTop, Slot::PaddingRight,
                                           Slot::PaddingBottom, Slot::PaddingLeft};
    const std::vector<Slot> all_margin = {Slot::MarginTop, Slot::MarginRight,
                                          Slot::MarginBottom, Slot::MarginLeft};
    const std::vector<Slot> all_borders = {Slot::BorderTop, Slot::BorderRight,
                                           Slot::BorderBottom, Slot::BorderLeft};
    const std::vector<Slot> all_corners = {Slot::RadiusTopLeft, Slot::RadiusTopRight,
                                           Slot::RadiusBottomRight, Slot::RadiusBottomLeft};

    static const std::unordered_map<std::string, BracketPattern> patterns = {
        {"bg-", {L::Color, {}, Slot::Background}},
        {"text-", {L::ColorOrLength, {Slot::FontSize}, Slot::TextColor}},
        {"border-", {L::ColorOrLength, all_borders, Slot::BorderColor}},
        {"border-t-", {L::Length, {Slot::BorderTop}}},
        {"border-r-", {L::Length, {Slot::BorderRight}}},
        {"border-b-", {L::Length, {Slot::BorderBottom}}},
        {"border-l-", {L::Length, {Slot::BorderLeft}}},
        {"border-x-", {L::Length, {Slot::BorderLeft, Slot::BorderRight}}},
        {"border-y-", {L::Length, {Slot::BorderTop, Slot::BorderBottom}}},

        {"rounded-", {L::Length, all_corners}},
        {"rounded-t-", {L::Length, {Slot::RadiusTopLeft, Slot::RadiusTopRight}}},
        {"rounded-r-", {L::Length, {Slot::RadiusTopRight, Slot::RadiusBottomRight}}},
        {"rounded-b-", {L::Length, {Slot::RadiusBottomRight, Slot::RadiusBottomLeft}}},
        {"rounded-l-", {L::Length, {Slot::RadiusTopLeft, Slot::RadiusBottomLeft}}},
        {"rounded-tl-", {L::Length, {Slot::RadiusTopLeft}}},
        {"rounded-tr-", {L::Length, {Slot::RadiusTopRight}}},
        {"rounded-br-", {L::Length, {Slot::RadiusBottomRight}}},
        {"rounded-bl-", {L::Length, {Slot::RadiusBottomLeft}}},

        {"w-", {L::Length, {Slot::Width}}},
        {"h-", {L::Length, {Slot::Height}}},
        {"size-", {L::Length, {Slot::Width, Slot::Height}}},
        {"min-w-", {L::Length, {Slot::MinWidth}}},
        {"min-h-", {L::Length, {Slot::MinHeight}}},
        {"max-w-", {L::Length, {Slot::MaxWidth}}},
        {"max-h-", {L::Length, {Slot::MaxHeight}}},

        {"p-", {L::Length, all_padding}},
        {"px-", {L::Length, {Slot::PaddingLeft, Slot::PaddingRight}}},
        {"py-", {L::Length, {Slot::PaddingTop, Slot::PaddingBottom}}},
        {"pt-", {L::Length, {Slot::PaddingTop}}},
        {"pr-", {L::Length, {Slot::PaddingRight}}},
        {"pb-", {L::Length, {Slot::PaddingBottom}}},
        {"pl-", {L::Length, {Slot::PaddingLeft}}},
        {"m-", {L::Length, all_margin}},
        {"mx-", {L::Length, {Slot::MarginLeft, Slot::MarginRight}}},
        {"my-", {L::Length, {Slot::MarginTop, Slot::MarginBottom}}},
        {"mt-", {L::Length, {Slot::MarginTop}}},
        {"mr-", {L::Length, {Slot::MarginRight}}},
        {"mb-", {L::Length, {Slot::MarginBottom}}},
        {"ml-", {L::Length, {Slot::MarginLeft}}},
        {"gap-", {L::Length, {Slot::GapX, Slot::GapY}}},
        {"gap-x-", {L::Length, {Slot::GapX}}},
        {"gap-y-", {L::Length, {Slot::GapY}}},
    };
    return patterns;
}

void append_lengths(const std::vector<Slot>& slots, Length length, std::vector<StyleOp>& ops) {
    for (auto slot : slots) {
        ops.push_back(StyleOp::scalar(slot, length));
    }
}

void resolve_color(Slot slot, std::string_view literal, std::string_view token,
                   std::vector<StyleOp>& ops, std::vector<ResolveIssue>& issues) {
    try {
        ops.push_back(StyleOp::color(slot, parse_hex_color(literal)));
    } catch (const InvalidColorLiteralError& e) {
        issues.push_back({ResolveIssue::Kind::InvalidColorLiteral, std::string(token), e.what()});
    }
}

void resolve_lengths(const std::vector<Slot>& slots, std::string_view literal,
                     std::string_view token, std::vector<StyleOp>& ops,
                     std::vector<ResolveIssue>& issues) {
    try {
        append_lengths(slots, parse_length_literal(literal), ops);
    } catch (const InvalidLengthLiteralError& e) {
        issues.push_back({ResolveIssue::Kind::InvalidLengthLiteral, std::string(token), e.what()});
        append_lengths(slots, Length::px(0), ops);
    }
}

} // anonymous namespace

const char* resolve_issue_kind_name(ResolveIssue::Kind kind) {
    switch (kind) {
        case ResolveIssue::Kind::InvalidColorLiteral:  return "invalid-color";
        case ResolveIssue::Kind::InvalidLengthLiteral: return "invalid-length";
        case ResolveIssue::Kind::InvalidNumericValue:  return "invalid-number";
    }
    return "unknown";
}

const StyleOp* Resolution::effective(Slot slot) const {
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        if (it->slot == slot) return &*it;
    }
    return nullptr;
}

std::vector<StyleOp> collapse(const std::vector<StyleOp>& ops) {
    std::vector<StyleOp> result;
    result.reserve(ops.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        bool overridden = std::any_of(ops.begin() + static_cast<std::ptrdiff_t>(i) + 1, ops.end(),
            [&](const StyleOp& later) { return later.slot == ops[i].slot; });
        if (!overridden) {
            result.push_back(ops[i]);
        }
    }
    return result;
}

std::vector<std::string> split_class_list(std::string_view value) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

AttributeResolver::AttributeResolver() : table_(TokenTable::instance()) {}

AttributeResolver::AttributeResolver(const TokenTable& table) : table_(table) {}

Resolution AttributeResolver::resolve(const std::vector<markup::Attribute>& attributes) const {
    Resolution result;

    std::vector<StyleOp> direct;
    const markup::Attribute* class_attr = nullptr;
    for (const auto& attr : attributes) {
        if (attr.name == kClassAttribute) {
            class_attr = &attr;  // last class attribute wins
            continue;
        }
        resolve_direct(attr, direct, result.issues);
    }
    result.ops = collapse(direct);

    if (class_attr) {
        std::vector<StyleOp> from_classes;
        for (const auto& token : split_class_list(class_attr->value)) {
            resolve_token(token, from_classes, result.issues);
        }
        auto collapsed = collapse(from_classes);
        result.ops.insert(result.ops.end(), collapsed.begin(), collapsed.end());
    }
    return result;
}

void AttributeResolver::resolve_direct(const markup::Attribute& attr, std::vector<StyleOp>& ops,
                                       std::vector<ResolveIssue>& issues) const {
    const std::string& key = attr.name;
    if (key == "bg") {
        resolve_color(Slot::Background, attr.value, key, ops, issues);
    } else if (key == "color" || key == "text-color") {
        resolve_color(Slot::TextColor, attr.value, key, ops, issues);
    } else if (key == "border-color") {
        resolve_color(Slot::BorderColor, attr.value, key, ops, issues);
    } else if (key == "font-weight") {
        if (auto weight = parse_number(attr.value)) {
            ops.push_back(StyleOp::scalar(Slot::FontWeight, Length::number(*weight)));
        } else {
            issues.push_back({ResolveIssue::Kind::InvalidNumericValue, key,
                              "invalid font weight '" + attr.value + "'"});
        }
    } else if (key == "opacity") {
        auto opacity = parse_number(attr.value);
        if (opacity && *opacity <= 1.0f) {
            int pct = static_cast<int>(std::lround(*opacity * 100.0f));
            ops.push_back(StyleOp::fraction(Slot::Opacity, pct, 100));
        } else {
            issues.push_back({ResolveIssue::Kind::InvalidNumericValue, key,
                              "invalid opacity '" + attr.value + "'"});
        }
    }
}

void AttributeResolver::resolve_token(std::string_view token, std::vector<StyleOp>& ops,
                                      std::vector<ResolveIssue>& issues) const {
    if (const auto* entry = table_.find(token)) {
        ops.insert(ops.end(), entry->begin(), entry->end());
        return;
    }
    // Unknown vocabulary is tolerated; nothing is appended.
    resolve_parameterized(token, ops, issues);
}

void AttributeResolver::resolve_parameterized(std::string_view token, std::vector<StyleOp>& ops,
                                              std::vector<ResolveIssue>& issues) const {
    auto open = token.find('[');
    if (open == std::string_view::npos || open == 0 || token.back() != ']') {
        return;
    }

    auto& patterns = bracket_patterns();
    auto it = patterns.find(std::string(token.substr(0, open)));
    if (it == patterns.end()) {
        return;
    }

    std::string_view literal = token.substr(open + 1, token.size() - open - 2);
    const BracketPattern& pattern = it->second;
    switch (pattern.literal) {
        case BracketPattern::Literal::Color:
            resolve_color(pattern.color_slot, literal, token, ops, issues);
            break;
        case BracketPattern::Literal::Length:
            resolve_lengths(pattern.length_slots, literal, token, ops, issues);
            break;
        case BracketPattern::Literal::ColorOrLength:
            if (!literal.empty() && literal.front() == '#') {
                resolve_color(pattern.color_slot, literal, token, ops, issues);
            } else {
                resolve_lengths(pattern.length_slots, literal, token, ops, issues);
            }
            break;
    }
}

} // namespace hotview::style
