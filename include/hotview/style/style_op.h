#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace hotview::style {

// Semantic target of an operation. Two operations on the same slot conflict
// and the later one wins.
enum class Slot {
    Display, Position, Visibility, OverflowX, OverflowY, Cursor,
    JustifyContent, AlignItems, AlignSelf,
    FlexDirection, FlexWrap, Flex, FlexGrow, FlexShrink,
    Shadow, FontSize, FontWeight, TextAlign, Opacity,
    Width, Height, MinWidth, MinHeight, MaxWidth, MaxHeight,
    PaddingTop, PaddingRight, PaddingBottom, PaddingLeft,
    MarginTop, MarginRight, MarginBottom, MarginLeft,
    GapX, GapY,
    BorderTop, BorderRight, BorderBottom, BorderLeft,
    RadiusTopLeft, RadiusTopRight, RadiusBottomRight, RadiusBottomLeft,
    Background, TextColor, BorderColor,
};

const char* slot_name(Slot slot);

enum class Keyword {
    // display / position / visibility
    Flex, Block, Hidden, Absolute, Relative, Visible, Invisible,
    // overflow
    OverflowHidden, OverflowVisible, OverflowScroll,
    // cursor
    CursorDefault, CursorPointer, CursorText, CursorMove, CursorNotAllowed,
    CursorContextMenu, CursorCrosshair, CursorVerticalText, CursorAlias,
    CursorCopy, CursorNoDrop, CursorGrab, CursorGrabbing, CursorColResize,
    CursorRowResize, CursorNResize, CursorEResize, CursorSResize, CursorWResize,
    // alignment
    Start, End, Center, Between, Around, Evenly, Baseline, Stretch,
    // flex
    Row, RowReverse, Column, ColumnReverse, Wrap, NoWrap, WrapReverse,
    FlexOne, FlexAuto, FlexInitial, FlexNone, Grow, Grow0, Shrink, Shrink0,
    // shadow
    ShadowSm, ShadowMd, ShadowLg, ShadowXl, Shadow2xl, ShadowNone,
    // text
    Left, Right,
};

const char* keyword_name(Keyword keyword);

struct Length {
    enum class Unit { Px, Rem, Number, Auto };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length rem(float v) { return {v, Unit::Rem}; }
    static Length number(float v) { return {v, Unit::Number}; }
    static Length auto_val() { return {0, Unit::Auto}; }

    bool operator==(const Length& other) const {
        return value == other.value && unit == other.unit;
    }
    bool operator!=(const Length& other) const { return !(*this == other); }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    uint32_t to_rgb() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }
};

struct Fraction {
    int numerator = 1;
    int denominator = 1;

    float value() const {
        return denominator == 0 ? 0.0f : static_cast<float>(numerator) / denominator;
    }

    bool operator==(const Fraction& other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
    bool operator!=(const Fraction& other) const { return !(*this == other); }
};

struct StyleOp {
    enum class Kind { Flag, Scalar, Color, Fraction };

    Slot slot = Slot::Display;
    std::variant<Keyword, Length, Color, Fraction> value;

    Kind kind() const { return static_cast<Kind>(value.index()); }

    static StyleOp flag(Slot s, Keyword k) { return {s, k}; }
    static StyleOp scalar(Slot s, Length l) { return {s, l}; }
    static StyleOp color(Slot s, Color c) { return {s, c}; }
    static StyleOp fraction(Slot s, int num, int den) { return {s, Fraction{num, den}}; }

    bool operator==(const StyleOp& other) const {
        return slot == other.slot && value == other.value;
    }
    bool operator!=(const StyleOp& other) const { return !(*this == other); }
};

// "height=2rem", "display=flex", "background=#112233", "width=2/3"
std::string describe(const StyleOp& op);
std::string describe(const Length& length);
std::string describe(const Color& color);

} // namespace hotview::style
