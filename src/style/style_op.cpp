#include <hotview/style/style_op.h>
#include <cstdio>
#include <sstream>

namespace hotview::style {

const char* slot_name(Slot slot) {
    switch (slot) {
        case Slot::Display:           return "display";
        case Slot::Position:          return "position";
        case Slot::Visibility:        return "visibility";
        case Slot::OverflowX:         return "overflow-x";
        case Slot::OverflowY:         return "overflow-y";
        case Slot::Cursor:            return "cursor";
        case Slot::JustifyContent:    return "justify-content";
        case Slot::AlignItems:        return "align-items";
        case Slot::AlignSelf:         return "align-self";
        case Slot::FlexDirection:     return "flex-direction";
        case Slot::FlexWrap:          return "flex-wrap";
        case Slot::Flex:              return "flex";
        case Slot::FlexGrow:          return "flex-grow";
        case Slot::FlexShrink:        return "flex-shrink";
        case Slot::Shadow:            return "shadow";
        case Slot::FontSize:          return "font-size";
        case Slot::FontWeight:        return "font-weight";
        case Slot::TextAlign:         return "text-align";
        case Slot::Opacity:           return "opacity";
        case Slot::Width:             return "width";
        case Slot::Height:            return "height";
        case Slot::MinWidth:          return "min-width";
        case Slot::MinHeight:         return "min-height";
        case Slot::MaxWidth:          return "max-width";
        case Slot::MaxHeight:         return "max-height";
        case Slot::PaddingTop:        return "padding-top";
        case Slot::PaddingRight:      return "padding-right";
        case Slot::PaddingBottom:     return "padding-bottom";
        case Slot::PaddingLeft:       return "padding-left";
        case Slot::MarginTop:         return "margin-top";
        case Slot::MarginRight:       return "margin-right";
        case Slot::MarginBottom:      return "margin-bottom";
        case Slot::MarginLeft:        return "margin-left";
        case Slot::GapX:              return "gap-x";
        case Slot::GapY:              return "gap-y";
        case Slot::BorderTop:         return "border-top";
        case Slot::BorderRight:       return "border-right";
        case Slot::BorderBottom:      return "border-bottom";
        case Slot::BorderLeft:        return "border-left";
        case Slot::RadiusTopLeft:     return "radius-top-left";
        case Slot::RadiusTopRight:    return "radius-top-right";
        case Slot::RadiusBottomRight: return "radius-bottom-right";
        case Slot::RadiusBottomLeft:  return "radius-bottom-left";
        case Slot::Background:        return "background";
        case Slot::TextColor:         return "text-color";
        case Slot::BorderColor:       return "border-color";
    }
    return "unknown";
}

const char* keyword_name(Keyword keyword) {
    switch (keyword) {
        case Keyword::Flex:               return "flex";
        case Keyword::Block:              return "block";
        case Keyword::Hidden:             return "hidden";
        case Keyword::Absolute:           return "absolute";
        case Keyword::Relative:           return "relative";
        case Keyword::Visible:            return "visible";
        case Keyword::Invisible:          return "invisible";
        case Keyword::OverflowHidden:     return "hidden";
        case Keyword::OverflowVisible:    return "visible";
        case Keyword::OverflowScroll:     return "scroll";
        case Keyword::CursorDefault:      return "default";
        case Keyword::CursorPointer:      return "pointer";
        case Keyword::CursorText:         return "text";
        case Keyword::CursorMove:         return "move";
        case Keyword::CursorNotAllowed:   return "not-allowed";
        case Keyword::CursorContextMenu:  return "context-menu";
        case Keyword::CursorCrosshair:    return "crosshair";
        case Keyword::CursorVerticalText: return "vertical-text";
        case Keyword::CursorAlias:        return "alias";
        case Keyword::CursorCopy:         return "copy";
        case Keyword::CursorNoDrop:       return "no-drop";
        case Keyword::CursorGrab:         return "grab";
        case Keyword::CursorGrabbing:     return "grabbing";
        case Keyword::CursorColResize:    return "col-resize";
        case Keyword::CursorRowResize:    return "row-resize";
        case Keyword::CursorNResize:      return "n-resize";
        case Keyword::CursorEResize:      return "e-resize";
        case Keyword::CursorSResize:      return "s-resize";
        case Keyword::CursorWResize:      return "w-resize";
        case Keyword::Start:              return "start";
        case Keyword::End:                return "end";
        case Keyword::Center:             return "center";
        case Keyword::Between:            return "space-between";
        case Keyword::Around:             return "space-around";
        case Keyword::Evenly:             return "space-evenly";
        case Keyword::Baseline:           return "baseline";
        case Keyword::Stretch:            return "stretch";
        case Keyword::Row:                return "row";
        case Keyword::RowReverse:         return "row-reverse";
        case Keyword::Column:             return "column";
        case Keyword::ColumnReverse:      return "column-reverse";
        case Keyword::Wrap:               return "wrap";
        case Keyword::NoWrap:             return "nowrap";
        case Keyword::WrapReverse:        return "wrap-reverse";
        case Keyword::FlexOne:            return "1";
        case Keyword::FlexAuto:           return "auto";
        case Keyword::FlexInitial:        return "initial";
        case Keyword::FlexNone:           return "none";
        case Keyword::Grow:               return "1";
        case Keyword::Grow0:              return "0";
        case Keyword::Shrink:             return "1";
        case Keyword::Shrink0:            return "0";
        case Keyword::ShadowSm:           return "sm";
        case Keyword::ShadowMd:           return "md";
        case Keyword::ShadowLg:           return "lg";
        case Keyword::ShadowXl:           return "xl";
        case Keyword::Shadow2xl:          return "2xl";
        case Keyword::ShadowNone:         return "none";
        case Keyword::Left:               return "left";
        case Keyword::Right:              return "right";
    }
    return "unknown";
}

std::string describe(const Length& length) {
    if (length.unit == Length::Unit::Auto) return "auto";
    std::ostringstream oss;
    oss << length.value;
    switch (length.unit) {
        case Length::Unit::Px:     oss << "px"; break;
        case Length::Unit::Rem:    oss << "rem"; break;
        case Length::Unit::Number: break;
        case Length::Unit::Auto:   break;
    }
    return oss.str();
}

std::string describe(const Color& color) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
    return buf;
}

std::string describe(const StyleOp& op) {
    std::string out = slot_name(op.slot);
    out += '=';
    switch (op.kind()) {
        case StyleOp::Kind::Flag:
            out += keyword_name(std::get<Keyword>(op.value));
            break;
        case StyleOp::Kind::Scalar:
            out += describe(std::get<Length>(op.value));
            break;
        case StyleOp::Kind::Color:
            out += describe(std::get<Color>(op.value));
            break;
        case StyleOp::Kind::Fraction: {
            const auto& f = std::get<Fraction>(op.value);
            out += std::to_string(f.numerator) + "/" + std::to_string(f.denominator);
            break;
        }
    }
    return out;
}

} // namespace hotview::style
