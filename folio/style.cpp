#include "style.h"

#include <stdexcept>

namespace folio {

bool operator==(const Margins& a, const Margins& b) {
    return a.top == b.top && a.bottom == b.bottom &&
           a.left == b.left && a.right == b.right;
}

bool operator!=(const Margins& a, const Margins& b) {
    return !(a == b);
}

static int checked_content_width(const StyleSettings& s) {
    if (s.body_size <= 0 || s.code_size <= 0) {
        throw std::invalid_argument("font sizes must be positive");
    }
    if (s.page_width <= 0 || s.page_height <= 0) {
        throw std::invalid_argument("page dimensions must be positive");
    }
    if (s.margins.top < 0 || s.margins.bottom < 0 ||
        s.margins.left < 0 || s.margins.right < 0) {
        throw std::invalid_argument("margins must not be negative");
    }
    int width = s.page_width - s.margins.left - s.margins.right;
    if (width <= 0) {
        throw std::invalid_argument("margins leave no page content width (page width " +
                                    std::to_string(s.page_width) + ")");
    }
    return width;
}

StyleConstants::StyleConstants(const StyleSettings& s)
    : body_font(s.body_font)
    , body_size(s.body_size)
    , code_font(s.code_font)
    , code_size(s.code_size)
    , dark_color(s.dark_color)
    , accent_color(s.accent_color)
    , accent_secondary(s.accent_secondary)
    , h1_color(s.h1_color)
    , h2_color(s.h2_color)
    , code_text_color(s.code_text_color)
    , code_background(s.code_background)
    , table_header_background(s.table_header_background)
    , table_header_text(s.table_header_text)
    , table_alt_row(s.table_alt_row)
    , page_width(s.page_width)
    , page_height(s.page_height)
    , margins(s.margins)
    , page_content_width(checked_content_width(s)) {}

StyleSettings StyleConstants::settings() const {
    StyleSettings s;
    s.body_font               = body_font;
    s.body_size               = body_size;
    s.code_font               = code_font;
    s.code_size               = code_size;
    s.dark_color              = dark_color;
    s.accent_color            = accent_color;
    s.accent_secondary        = accent_secondary;
    s.h1_color                = h1_color;
    s.h2_color                = h2_color;
    s.code_text_color         = code_text_color;
    s.code_background         = code_background;
    s.table_header_background = table_header_background;
    s.table_header_text       = table_header_text;
    s.table_alt_row           = table_alt_row;
    s.page_width              = page_width;
    s.page_height             = page_height;
    s.margins                 = margins;
    return s;
}

bool operator==(const StyleConstants& a, const StyleConstants& b) {
    return a.body_font == b.body_font &&
           a.body_size == b.body_size &&
           a.code_font == b.code_font &&
           a.code_size == b.code_size &&
           a.dark_color == b.dark_color &&
           a.accent_color == b.accent_color &&
           a.accent_secondary == b.accent_secondary &&
           a.h1_color == b.h1_color &&
           a.h2_color == b.h2_color &&
           a.code_text_color == b.code_text_color &&
           a.code_background == b.code_background &&
           a.table_header_background == b.table_header_background &&
           a.table_header_text == b.table_header_text &&
           a.table_alt_row == b.table_alt_row &&
           a.page_width == b.page_width &&
           a.page_height == b.page_height &&
           a.margins == b.margins &&
           a.page_content_width == b.page_content_width;
}

bool operator!=(const StyleConstants& a, const StyleConstants& b) {
    return !(a == b);
}

}  // namespace folio
