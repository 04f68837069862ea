#pragma once
#include <hotview/style/style_op.h>
#include <optional>
#include <string>
#include <string_view>

namespace hotview::style {

// "#RGB" or "#RRGGBB", '#' optional. Throws InvalidColorLiteralError.
Color parse_hex_color(std::string_view literal);

// Non-throwing variant of parse_hex_color.
std::optional<Color> try_parse_hex_color(std::string_view literal);

struct NumericLiteral {
    std::string number;  // longest leading digit/decimal run
    std::string unit;    // everything after it
};

NumericLiteral split_numeric_literal(std::string_view literal);

// "12px", "0.5rem", "8" (bare numbers are pixels). Throws
// InvalidLengthLiteralError when there is no number or the unit is unknown.
Length parse_length_literal(std::string_view literal);

// Whole-number attribute values such as font-weight="600".
std::optional<float> parse_number(std::string_view literal);

} // namespace hotview::style
