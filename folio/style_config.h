#ifndef FOLIO_STYLE_CONFIG_H
#define FOLIO_STYLE_CONFIG_H

#include "style.h"

#include <string>
#include <vector>

namespace folio {

// Style overrides file: one "key = value" per line, '#' starts a comment.
//
//   body_font = Georgia
//   body_size = 22
//   accent_color = C5A572
//   margin_left = 1080
//
// Keys are the StyleSettings field names; margins are margin_top,
// margin_bottom, margin_left and margin_right.

// Applies one setting. Returns false with error set for an unknown key or a
// value that does not parse.
bool apply_style_setting(StyleSettings& settings, const std::string& key,
                         const std::string& value, std::string& error);

// Reads overrides from path into settings. Stops at the first bad line and
// reports "<path>:<line>: <problem>" in error.
bool load_style_overrides(const std::string& path, StyleSettings& settings,
                          std::string& error);

// Six hex digits, no leading '#'.
bool is_hex_color(const std::string& value);

// Names accepted by apply_style_setting, in file order.
const std::vector<std::string>& style_setting_keys();

}  // namespace folio

#endif // FOLIO_STYLE_CONFIG_H
