#include <hotview/style/value_parser.h>
#include <hotview/core/errors.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace hotview::style {

namespace {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Color parse_hex_color(std::string_view literal) {
    std::string value = trim(literal);
    std::string hex = (!value.empty() && value[0] == '#') ? value.substr(1) : value;

    if (hex.length() == 3) {
        // #RGB -> #RRGGBB
        int r = hex_digit(hex[0]);
        int g = hex_digit(hex[1]);
        int b = hex_digit(hex[2]);
        if (r < 0 || g < 0 || b < 0) throw InvalidColorLiteralError(value);
        return Color{
            static_cast<uint8_t>(r * 17),
            static_cast<uint8_t>(g * 17),
            static_cast<uint8_t>(b * 17)
        };
    }

    if (hex.length() == 6) {
        int r1 = hex_digit(hex[0]), r2 = hex_digit(hex[1]);
        int g1 = hex_digit(hex[2]), g2 = hex_digit(hex[3]);
        int b1 = hex_digit(hex[4]), b2 = hex_digit(hex[5]);
        if (r1 < 0 || r2 < 0 || g1 < 0 || g2 < 0 || b1 < 0 || b2 < 0) {
            throw InvalidColorLiteralError(value);
        }
        return Color{
            static_cast<uint8_t>(r1 * 16 + r2),
            static_cast<uint8_t>(g1 * 16 + g2),
            static_cast<uint8_t>(b1 * 16 + b2)
        };
    }

    throw InvalidColorLiteralError(value);
}

std::optional<Color> try_parse_hex_color(std::string_view literal) {
    try {
        return parse_hex_color(literal);
    } catch (const InvalidColorLiteralError&) {
        return std::nullopt;
    }
}

NumericLiteral split_numeric_literal(std::string_view literal) {
    std::string value = trim(literal);
    size_t i = 0;
    bool seen_dot = false;
    while (i < value.size()) {
        char c = value[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
            ++i;
        } else {
            break;
        }
    }
    return {value.substr(0, i), value.substr(i)};
}

Length parse_length_literal(std::string_view literal) {
    auto parts = split_numeric_literal(literal);
    if (parts.number.empty() || parts.number == ".") {
        throw InvalidLengthLiteralError(std::string(literal));
    }

    float number = std::strtof(parts.number.c_str(), nullptr);
    std::string unit = to_lower(parts.unit);
    if (unit.empty() || unit == "px") {
        return Length::px(number);
    }
    if (unit == "rem") {
        return Length::rem(number);
    }
    throw InvalidLengthLiteralError(std::string(literal));
}

std::optional<float> parse_number(std::string_view literal) {
    auto parts = split_numeric_literal(literal);
    if (parts.number.empty() || parts.number == "." || !parts.unit.empty()) {
        return std::nullopt;
    }
    return std::strtof(parts.number.c_str(), nullptr);
}

} // namespace hotview::style
