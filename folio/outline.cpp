#include "outline.h"

#include <cctype>

namespace folio {

static constexpr size_t MAX_BOOKMARK_NAME = 40;

std::vector<OutlineEntry> build_outline(const std::vector<ContentNode>& nodes) {
    std::vector<OutlineEntry> entries;
    int next_id = 1;

    for (size_t i = 0; i < nodes.size(); ++i) {
        OutlineEntry e;
        e.node_index = i;
        if (const PartHeading* part = nodes[i].getIf<PartHeading>()) {
            e.level = 1;
            e.text = part->text;
        } else if (const Heading* h = nodes[i].getIf<Heading>()) {
            if (h->level > 2) continue;
            e.level = h->level;
            e.text = h->text;
        } else {
            continue;
        }
        e.bookmark_id = next_id++;
        e.bookmark_name = "_toc_" + std::to_string(e.bookmark_id);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string bookmark_safe_name(const std::string& prefix, const std::string& raw) {
    std::string name = prefix;
    for (char c : raw) {
        if (name.size() >= MAX_BOOKMARK_NAME) break;
        unsigned char u = static_cast<unsigned char>(c);
        name += (std::isalnum(u) && u < 0x80) ? c : '_';
    }
    if (name.size() > MAX_BOOKMARK_NAME) name.resize(MAX_BOOKMARK_NAME);
    return name;
}

}  // namespace folio
