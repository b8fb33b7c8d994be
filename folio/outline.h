#ifndef FOLIO_OUTLINE_H
#define FOLIO_OUTLINE_H

#include "content_node.h"

#include <cstddef>
#include <string>
#include <vector>

namespace folio {

// One navigable heading: parts and chapters are level 1, sections level 2.
// Subsection headings (level 3) are not listed.
struct OutlineEntry {
    size_t      node_index = 0;
    int         level = 1;
    std::string text;
    std::string bookmark_name;  // "_toc_<id>"
    int         bookmark_id = 0;
};

// Single left-to-right pass; ids are numbered from 1 in stream order.
std::vector<OutlineEntry> build_outline(const std::vector<ContentNode>& nodes);

// Bookmark names are limited to 40 characters of [A-Za-z0-9_].
std::string bookmark_safe_name(const std::string& prefix, const std::string& raw);

}  // namespace folio

#endif // FOLIO_OUTLINE_H
