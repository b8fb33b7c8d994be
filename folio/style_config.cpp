#include "style_config.h"

#include <cctype>
#include <fstream>

namespace folio {

// ============================================================================
// Utility: trim / number parsing
// ============================================================================

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool parse_int(const std::string& value, int& out) {
    if (value.empty()) return false;
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool is_hex_color(const std::string& value) {
    if (value.size() != 6) return false;
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

const std::vector<std::string>& style_setting_keys() {
    static const std::vector<std::string> keys = {
        "body_font", "body_size", "code_font", "code_size",
        "dark_color", "accent_color", "accent_secondary",
        "h1_color", "h2_color", "code_text_color", "code_background",
        "table_header_background", "table_header_text", "table_alt_row",
        "page_width", "page_height",
        "margin_top", "margin_bottom", "margin_left", "margin_right",
    };
    return keys;
}

// ============================================================================
// Setting dispatch
// ============================================================================

bool apply_style_setting(StyleSettings& s, const std::string& key,
                         const std::string& value, std::string& error) {
    std::string* text_field = nullptr;
    std::string* color_field = nullptr;
    int* int_field = nullptr;

    if      (key == "body_font")               text_field  = &s.body_font;
    else if (key == "code_font")               text_field  = &s.code_font;
    else if (key == "body_size")               int_field   = &s.body_size;
    else if (key == "code_size")               int_field   = &s.code_size;
    else if (key == "dark_color")              color_field = &s.dark_color;
    else if (key == "accent_color")            color_field = &s.accent_color;
    else if (key == "accent_secondary")        color_field = &s.accent_secondary;
    else if (key == "h1_color")                color_field = &s.h1_color;
    else if (key == "h2_color")                color_field = &s.h2_color;
    else if (key == "code_text_color")         color_field = &s.code_text_color;
    else if (key == "code_background")         color_field = &s.code_background;
    else if (key == "table_header_background") color_field = &s.table_header_background;
    else if (key == "table_header_text")       color_field = &s.table_header_text;
    else if (key == "table_alt_row")           color_field = &s.table_alt_row;
    else if (key == "page_width")              int_field   = &s.page_width;
    else if (key == "page_height")             int_field   = &s.page_height;
    else if (key == "margin_top")              int_field   = &s.margins.top;
    else if (key == "margin_bottom")           int_field   = &s.margins.bottom;
    else if (key == "margin_left")             int_field   = &s.margins.left;
    else if (key == "margin_right")            int_field   = &s.margins.right;
    else {
        error = "unknown style key '" + key + "'";
        return false;
    }

    if (text_field) {
        if (value.empty()) {
            error = key + " must not be empty";
            return false;
        }
        *text_field = value;
    } else if (color_field) {
        if (!is_hex_color(value)) {
            error = key + " must be six hex digits, got '" + value + "'";
            return false;
        }
        *color_field = value;
    } else {
        int parsed = 0;
        if (!parse_int(value, parsed)) {
            error = key + " must be an integer, got '" + value + "'";
            return false;
        }
        *int_field = parsed;
    }
    return true;
}

// ============================================================================
// File loading
// ============================================================================

bool load_style_overrides(const std::string& path, StyleSettings& settings,
                          std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = "cannot read style file: " + path;
        return false;
    }

    // Work on a copy so a bad file leaves the caller's settings untouched.
    StyleSettings staged = settings;
    std::string line;
    int line_num = 0;
    int geometry_line = 0;  // last line touching page width or side margins
    while (std::getline(f, line)) {
        ++line_num;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            error = path + ":" + std::to_string(line_num) + ": expected 'key = value'";
            return false;
        }
        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        std::string why;
        if (!apply_style_setting(staged, key, value, why)) {
            error = path + ":" + std::to_string(line_num) + ": " + why;
            return false;
        }
        if (key == "page_width" || key == "margin_left" || key == "margin_right") {
            geometry_line = line_num;
        }
    }

    const int content_width = staged.page_width - staged.margins.left - staged.margins.right;
    if (content_width <= 0) {
        error = path + ":" + std::to_string(geometry_line) + ": page content width " +
                std::to_string(content_width) + " is not positive";
        return false;
    }

    settings = staged;
    return true;
}

}  // namespace folio
