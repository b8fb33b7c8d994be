#ifndef FOLIO_STYLE_H
#define FOLIO_STYLE_H

#include <string>

namespace folio {

// ============================================================================
// Layout constants (layout units are twentieths of a point, "DXA")
// ============================================================================

static constexpr int DEFAULT_SPACER_HEIGHT = 200;
static constexpr int LETTER_PAGE_WIDTH     = 12240;  // 8.5in
static constexpr int LETTER_PAGE_HEIGHT    = 15840;  // 11in
static constexpr int DEFAULT_MARGIN        = 1440;   // 1in

struct Margins {
    int top    = DEFAULT_MARGIN;
    int bottom = DEFAULT_MARGIN;
    int left   = DEFAULT_MARGIN;
    int right  = DEFAULT_MARGIN;
};

bool operator==(const Margins& a, const Margins& b);
bool operator!=(const Margins& a, const Margins& b);

// Staging record for the style. Defaults reproduce the house style; the
// overrides file (style_config.h) edits a copy before the one StyleConstants
// of the process is built from it.
struct StyleSettings {
    std::string body_font       = "Garamond";
    int         body_size       = 23;          // half-points (11.5pt)
    std::string code_font       = "Courier New";
    int         code_size       = 17;          // half-points (8.5pt)

    std::string dark_color              = "2B2B2B";  // charcoal body text
    std::string accent_color            = "B8965A";  // champagne gold rules
    std::string accent_secondary        = "A8A196";  // warm gray
    std::string h1_color                = "1B2A4A";  // deep navy
    std::string h2_color                = "3A5A80";  // steel blue
    std::string code_text_color         = "2D3748";
    std::string code_background         = "F5F3EE";
    std::string table_header_background = "1B2A4A";
    std::string table_header_text       = "FFFFFF";
    std::string table_alt_row           = "FAF7F0";

    int     page_width  = LETTER_PAGE_WIDTH;
    int     page_height = LETTER_PAGE_HEIGHT;
    Margins margins;
};

// ============================================================================
// StyleConstants - the immutable style record shared by every component
// ============================================================================
//
// Every member is const and assignment is deleted, so once built the value
// cannot change. Components receive it as const StyleConstants&.

class StyleConstants {
public:
    // Throws std::invalid_argument when the margins leave no content width
    // or a size is not positive.
    explicit StyleConstants(const StyleSettings& settings = StyleSettings());

    StyleConstants(const StyleConstants&) = default;
    StyleConstants& operator=(const StyleConstants&) = delete;
    StyleConstants& operator=(StyleConstants&&) = delete;

    const std::string body_font;
    const int         body_size;
    const std::string code_font;
    const int         code_size;

    const std::string dark_color;
    const std::string accent_color;
    const std::string accent_secondary;
    const std::string h1_color;
    const std::string h2_color;
    const std::string code_text_color;
    const std::string code_background;
    const std::string table_header_background;
    const std::string table_header_text;
    const std::string table_alt_row;

    const int     page_width;
    const int     page_height;
    const Margins margins;
    const int     page_content_width;  // page_width - left - right margins

    // Settings that rebuild an equal value.
    StyleSettings settings() const;
};

bool operator==(const StyleConstants& a, const StyleConstants& b);
bool operator!=(const StyleConstants& a, const StyleConstants& b);

}  // namespace folio

#endif // FOLIO_STYLE_H
