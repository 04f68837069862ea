#include <hotview/style/token_table.h>
#include <utility>

namespace hotview::style {

namespace {

struct Step {
    const char* suffix;
    Length length;
};

// Spacing and sizing scale: step n is n * 0.25rem.
const std::vector<Step>& spacing_scale() {
    static const std::vector<Step> scale = {
        {"0", Length::px(0)},      {"1", Length::rem(0.25f)}, {"2", Length::rem(0.5f)},
        {"3", Length::rem(0.75f)}, {"4", Length::rem(1)},     {"5", Length::rem(1.25f)},
        {"6", Length::rem(1.5f)},  {"8", Length::rem(2)},     {"10", Length::rem(2.5f)},
        {"12", Length::rem(3)},    {"16", Length::rem(4)},    {"20", Length::rem(5)},
        {"24", Length::rem(6)},    {"32", Length::rem(8)},    {"40", Length::rem(10)},
        {"48", Length::rem(12)},   {"56", Length::rem(14)},   {"64", Length::rem(16)},
        {"72", Length::rem(18)},   {"80", Length::rem(20)},   {"96", Length::rem(24)},
        {"px", Length::px(1)},
    };
    return scale;
}

struct FractionStep {
    const char* suffix;
    int numerator;
    int denominator;
};

const std::vector<FractionStep>& fraction_scale() {
    static const std::vector<FractionStep> scale = {
        {"1/2", 1, 2}, {"1/3", 1, 3}, {"2/3", 2, 3}, {"1/4", 1, 4}, {"2/4", 2, 4},
        {"3/4", 3, 4}, {"1/5", 1, 5}, {"2/5", 2, 5}, {"3/5", 3, 5}, {"4/5", 4, 5},
        {"1/6", 1, 6}, {"5/6", 5, 6}, {"1/12", 1, 12},
    };
    return scale;
}

struct Prefix {
    const char* name;
    std::vector<Slot> slots;
};

std::vector<StyleOp> scalar_ops(const std::vector<Slot>& slots, Length length) {
    std::vector<StyleOp> ops;
    for (auto slot : slots) ops.push_back(StyleOp::scalar(slot, length));
    return ops;
}

std::vector<StyleOp> fraction_ops(const std::vector<Slot>& slots, int num, int den) {
    std::vector<StyleOp> ops;
    for (auto slot : slots) ops.push_back(StyleOp::fraction(slot, num, den));
    return ops;
}

std::string join(const char* prefix, const char* suffix) {
    std::string token = prefix;
    if (*suffix) {
        token += '-';
        token += suffix;
    }
    return token;
}

} // anonymous namespace

const TokenTable& TokenTable::instance() {
    static const TokenTable table;
    return table;
}

TokenTable::TokenTable() {
    add_flags();
    add_sizing();
    add_spacing();
    add_borders();
    add_radii();
    add_typography();
}

const std::vector<StyleOp>* TokenTable::find(std::string_view token) const {
    auto it = entries_.find(std::string(token));
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

void TokenTable::add(std::string token, std::vector<StyleOp> ops) {
    entries_.insert_or_assign(std::move(token), std::move(ops));
}

void TokenTable::add_flags() {
    using K = Keyword;
    using S = Slot;
    struct FlagEntry {
        const char* token;
        std::vector<StyleOp> ops;
    };
    const std::vector<FlagEntry> flags = {
        {"flex", {StyleOp::flag(S::Display, K::Flex)}},
        {"block", {StyleOp::flag(S::Display, K::Block)}},
        {"hidden", {StyleOp::flag(S::Display, K::Hidden)}},
        {"absolute", {StyleOp::flag(S::Position, K::Absolute)}},
        {"relative", {StyleOp::flag(S::Position, K::Relative)}},
        {"visible", {StyleOp::flag(S::Visibility, K::Visible)}},
        {"invisible", {StyleOp::flag(S::Visibility, K::Invisible)}},

        {"overflow-hidden", {StyleOp::flag(S::OverflowX, K::OverflowHidden),
                             StyleOp::flag(S::OverflowY, K::OverflowHidden)}},
        {"overflow-visible", {StyleOp::flag(S::OverflowX, K::OverflowVisible),
                              StyleOp::flag(S::OverflowY, K::OverflowVisible)}},
        {"overflow-scroll", {StyleOp::flag(S::OverflowX, K::OverflowScroll),
                             StyleOp::flag(S::OverflowY, K::OverflowScroll)}},
        {"overflow-x-hidden", {StyleOp::flag(S::OverflowX, K::OverflowHidden)}},
        {"overflow-y-hidden", {StyleOp::flag(S::OverflowY, K::OverflowHidden)}},
        {"overflow-x-scroll", {StyleOp::flag(S::OverflowX, K::OverflowScroll)}},
        {"overflow-y-scroll", {StyleOp::flag(S::OverflowY, K::OverflowScroll)}},

        {"cursor-default", {StyleOp::flag(S::Cursor, K::CursorDefault)}},
        {"cursor-pointer", {StyleOp::flag(S::Cursor, K::CursorPointer)}},
        {"cursor-text", {StyleOp::flag(S::Cursor, K::CursorText)}},
        {"cursor-move", {StyleOp::flag(S::Cursor, K::CursorMove)}},
        {"cursor-not-allowed", {StyleOp::flag(S::Cursor, K::CursorNotAllowed)}},
        {"cursor-context-menu", {StyleOp::flag(S::Cursor, K::CursorContextMenu)}},
        {"cursor-crosshair", {StyleOp::flag(S::Cursor, K::CursorCrosshair)}},
        {"cursor-vertical-text", {StyleOp::flag(S::Cursor, K::CursorVerticalText)}},
        {"cursor-alias", {StyleOp::flag(S::Cursor, K::CursorAlias)}},
        {"cursor-copy", {StyleOp::flag(S::Cursor, K::CursorCopy)}},
        {"cursor-no-drop", {StyleOp::flag(S::Cursor, K::CursorNoDrop)}},
        {"cursor-grab", {StyleOp::flag(S::Cursor, K::CursorGrab)}},
        {"cursor-grabbing", {StyleOp::flag(S::Cursor, K::CursorGrabbing)}},
        {"cursor-col-resize", {StyleOp::flag(S::Cursor, K::CursorColResize)}},
        {"cursor-row-resize", {StyleOp::flag(S::Cursor, K::CursorRowResize)}},
        {"cursor-n-resize", {StyleOp::flag(S::Cursor, K::CursorNResize)}},
        {"cursor-e-resize", {StyleOp::flag(S::Cursor, K::CursorEResize)}},
        {"cursor-s-resize", {StyleOp::flag(S::Cursor, K::CursorSResize)}},
        {"cursor-w-resize", {StyleOp::flag(S::Cursor, K::CursorWResize)}},

        {"justify-start", {StyleOp::flag(S::JustifyContent, K::Start)}},
        {"justify-end", {StyleOp::flag(S::JustifyContent, K::End)}},
        {"justify-center", {StyleOp::flag(S::JustifyContent, K::Center)}},
        {"justify-between", {StyleOp::flag(S::JustifyContent, K::Between)}},
        {"justify-around", {StyleOp::flag(S::JustifyContent, K::Around)}},
        {"justify-evenly", {StyleOp::flag(S::JustifyContent, K::Evenly)}},
        {"items-start", {StyleOp::flag(S::AlignItems, K::Start)}},
        {"items-end", {StyleOp::flag(S::AlignItems, K::End)}},
        {"items-center", {StyleOp::flag(S::AlignItems, K::Center)}},
        {"items-baseline", {StyleOp::flag(S::AlignItems, K::Baseline)}},
        {"items-stretch", {StyleOp::flag(S::AlignItems, K::Stretch)}},
        {"self-start", {StyleOp::flag(S::AlignSelf, K::Start)}},
        {"self-end", {StyleOp::flag(S::AlignSelf, K::End)}},
        {"self-center", {StyleOp::flag(S::AlignSelf, K::Center)}},
        {"self-stretch", {StyleOp::flag(S::AlignSelf, K::Stretch)}},

        {"flex-row", {StyleOp::flag(S::FlexDirection, K::Row)}},
        {"flex-row-reverse", {StyleOp::flag(S::FlexDirection, K::RowReverse)}},
        {"flex-col", {StyleOp::flag(S::FlexDirection, K::Column)}},
        {"flex-col-reverse", {StyleOp::flag(S::FlexDirection, K::ColumnReverse)}},
        {"flex-wrap", {StyleOp::flag(S::FlexWrap, K::Wrap)}},
        {"flex-nowrap", {StyleOp::flag(S::FlexWrap, K::NoWrap)}},
        {"flex-wrap-reverse", {StyleOp::flag(S::FlexWrap, K::WrapReverse)}},
        {"flex-1", {StyleOp::flag(S::Flex, K::FlexOne)}},
        {"flex-auto", {StyleOp::flag(S::Flex, K::FlexAuto)}},
        {"flex-initial", {StyleOp::flag(S::Flex, K::FlexInitial)}},
        {"flex-none", {StyleOp::flag(S::Flex, K::FlexNone)}},
        {"flex-grow", {StyleOp::flag(S::FlexGrow, K::Grow)}},
        {"grow", {StyleOp::flag(S::FlexGrow, K::Grow)}},
        {"grow-0", {StyleOp::flag(S::FlexGrow, K::Grow0)}},
        {"flex-shrink", {StyleOp::flag(S::FlexShrink, K::Shrink)}},
        {"flex-shrink-0", {StyleOp::flag(S::FlexShrink, K::Shrink0)}},
        {"shrink", {StyleOp::flag(S::FlexShrink, K::Shrink)}},
        {"shrink-0", {StyleOp::flag(S::FlexShrink, K::Shrink0)}},

        {"shadow-sm", {StyleOp::flag(S::Shadow, K::ShadowSm)}},
        {"shadow", {StyleOp::flag(S::Shadow, K::ShadowMd)}},
        {"shadow-md", {StyleOp::flag(S::Shadow, K::ShadowMd)}},
        {"shadow-lg", {StyleOp::flag(S::Shadow, K::ShadowLg)}},
        {"shadow-xl", {StyleOp::flag(S::Shadow, K::ShadowXl)}},
        {"shadow-2xl", {StyleOp::flag(S::Shadow, K::Shadow2xl)}},
        {"shadow-none", {StyleOp::flag(S::Shadow, K::ShadowNone)}},

        {"text-left", {StyleOp::flag(S::TextAlign, K::Left)}},
        {"text-center", {StyleOp::flag(S::TextAlign, K::Center)}},
        {"text-right", {StyleOp::flag(S::TextAlign, K::Right)}},
    };
    for (const auto& entry : flags) {
        add(entry.token, entry.ops);
    }
}

void TokenTable::add_sizing() {
    const std::vector<Prefix> scaled = {
        {"w", {Slot::Width}},
        {"h", {Slot::Height}},
        {"size", {Slot::Width, Slot::Height}},
    };
    for (const auto& prefix : scaled) {
        for (const auto& step : spacing_scale()) {
            add(join(prefix.name, step.suffix), scalar_ops(prefix.slots, step.length));
        }
        for (const auto& f : fraction_scale()) {
            add(join(prefix.name, f.suffix), fraction_ops(prefix.slots, f.numerator, f.denominator));
        }
        add(join(prefix.name, "full"), fraction_ops(prefix.slots, 1, 1));
        add(join(prefix.name, "auto"), scalar_ops(prefix.slots, Length::auto_val()));
    }

    const std::vector<Prefix> bounds = {
        {"min-w", {Slot::MinWidth}},
        {"min-h", {Slot::MinHeight}},
        {"max-w", {Slot::MaxWidth}},
        {"max-h", {Slot::MaxHeight}},
    };
    for (const auto& prefix : bounds) {
        add(join(prefix.name, "0"), scalar_ops(prefix.slots, Length::px(0)));
        add(join(prefix.name, "full"), fraction_ops(prefix.slots, 1, 1));
    }
}

void TokenTable::add_spacing() {
    const std::vector<Prefix> padding = {
        {"p", {Slot::PaddingTop, Slot::PaddingRight, Slot::PaddingBottom, Slot::PaddingLeft}},
        {"px", {Slot::PaddingLeft, Slot::PaddingRight}},
        {"py", {Slot::PaddingTop, Slot::PaddingBottom}},
        {"pt", {Slot::PaddingTop}},
        {"pr", {Slot::PaddingRight}},
        {"pb", {Slot::PaddingBottom}},
        {"pl", {Slot::PaddingLeft}},
    };
    const std::vector<Prefix> margin = {
        {"m", {Slot::MarginTop, Slot::MarginRight, Slot::MarginBottom, Slot::MarginLeft}},
        {"mx", {Slot::MarginLeft, Slot::MarginRight}},
        {"my", {Slot::MarginTop, Slot::MarginBottom}},
        {"mt", {Slot::MarginTop}},
        {"mr", {Slot::MarginRight}},
        {"mb", {Slot::MarginBottom}},
        {"ml", {Slot::MarginLeft}},
    };

    for (const auto* group : {&padding, &margin}) {
        for (const auto& prefix : *group) {
            for (const auto& step : spacing_scale()) {
                add(join(prefix.name, step.suffix), scalar_ops(prefix.slots, step.length));
            }
            for (const auto& f : fraction_scale()) {
                add(join(prefix.name, f.suffix),
                    fraction_ops(prefix.slots, f.numerator, f.denominator));
            }
        }
    }
    for (const auto& prefix : margin) {
        add(join(prefix.name, "auto"), scalar_ops(prefix.slots, Length::auto_val()));
    }
    add("m-full", fraction_ops(margin.front().slots, 1, 1));

    const std::vector<Prefix> gaps = {
        {"gap", {Slot::GapX, Slot::GapY}},
        {"gap-x", {Slot::GapX}},
        {"gap-y", {Slot::GapY}},
    };
    for (const auto& prefix : gaps) {
        for (const auto& step : spacing_scale()) {
            add(join(prefix.name, step.suffix), scalar_ops(prefix.slots, step.length));
        }
    }
}

void TokenTable::add_borders() {
    const std::vector<Prefix> sides = {
        {"border", {Slot::BorderTop, Slot::BorderRight, Slot::BorderBottom, Slot::BorderLeft}},
        {"border-t", {Slot::BorderTop}},
        {"border-r", {Slot::BorderRight}},
        {"border-b", {Slot::BorderBottom}},
        {"border-l", {Slot::BorderLeft}},
        {"border-x", {Slot::BorderLeft, Slot::BorderRight}},
        {"border-y", {Slot::BorderTop, Slot::BorderBottom}},
    };
    const std::vector<Step> widths = {
        {"", Length::px(1)}, {"0", Length::px(0)}, {"2", Length::px(2)},
        {"4", Length::px(4)}, {"8", Length::px(8)},
    };
    for (const auto& prefix : sides) {
        for (const auto& width : widths) {
            add(join(prefix.name, width.suffix), scalar_ops(prefix.slots, width.length));
        }
    }
}

void TokenTable::add_radii() {
    const std::vector<Prefix> corners = {
        {"rounded", {Slot::RadiusTopLeft, Slot::RadiusTopRight,
                     Slot::RadiusBottomRight, Slot::RadiusBottomLeft}},
        {"rounded-t", {Slot::RadiusTopLeft, Slot::RadiusTopRight}},
        {"rounded-r", {Slot::RadiusTopRight, Slot::RadiusBottomRight}},
        {"rounded-b", {Slot::RadiusBottomRight, Slot::RadiusBottomLeft}},
        {"rounded-l", {Slot::RadiusTopLeft, Slot::RadiusBottomLeft}},
        {"rounded-tl", {Slot::RadiusTopLeft}},
        {"rounded-tr", {Slot::RadiusTopRight}},
        {"rounded-br", {Slot::RadiusBottomRight}},
        {"rounded-bl", {Slot::RadiusBottomLeft}},
    };
    const std::vector<Step> radii = {
        {"", Length::rem(0.25f)},   {"none", Length::px(0)},     {"sm", Length::rem(0.125f)},
        {"md", Length::rem(0.375f)}, {"lg", Length::rem(0.5f)},   {"xl", Length::rem(0.75f)},
        {"2xl", Length::rem(1)},    {"3xl", Length::rem(1.5f)},  {"full", Length::px(9999)},
    };
    for (const auto& prefix : corners) {
        for (const auto& radius : radii) {
            add(join(prefix.name, radius.suffix), scalar_ops(prefix.slots, radius.length));
        }
    }
}

void TokenTable::add_typography() {
    const std::vector<Step> sizes = {
        {"xs", Length::rem(0.75f)}, {"sm", Length::rem(0.875f)}, {"base", Length::rem(1)},
        {"lg", Length::rem(1.125f)}, {"xl", Length::rem(1.25f)}, {"2xl", Length::rem(1.5f)},
        {"3xl", Length::rem(1.875f)},
    };
    for (const auto& size : sizes) {
        add(join("text", size.suffix), {StyleOp::scalar(Slot::FontSize, size.length)});
    }

    const std::vector<Step> weights = {
        {"thin", Length::number(100)},     {"extralight", Length::number(200)},
        {"light", Length::number(300)},    {"normal", Length::number(400)},
        {"medium", Length::number(500)},   {"semibold", Length::number(600)},
        {"bold", Length::number(700)},     {"extrabold", Length::number(800)},
        {"black", Length::number(900)},
    };
    for (const auto& weight : weights) {
        add(join("font", weight.suffix), {StyleOp::scalar(Slot::FontWeight, weight.length)});
    }

    for (int pct : {0, 5, 10, 20, 25, 30, 40, 50, 60, 70, 75, 80, 90, 95, 100}) {
        add("opacity-" + std::to_string(pct), {StyleOp::fraction(Slot::Opacity, pct, 100)});
    }
}

} // namespace hotview::style
