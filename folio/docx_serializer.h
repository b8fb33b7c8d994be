#ifndef FOLIO_DOCX_SERIALIZER_H
#define FOLIO_DOCX_SERIALIZER_H

#include "assembler.h"
#include "content_node.h"
#include "style.h"

#include <cstdint>
#include <string>
#include <vector>

namespace folio {

// Front matter and package metadata.
struct DocumentInfo {
    std::string title = "Untitled";
    std::string subtitle;
    std::string version;
    std::string author;
    std::string header_text;
    std::string footer_text;
    bool        include_cover = true;
    bool        include_toc = true;
};

struct Document {
    DocumentInfo             info;
    std::vector<ContentNode> nodes;
    std::vector<ChapterSpan> chapters;  // may be empty
};

// One named XML part of the package.
struct DocxPart {
    std::string name;     // e.g. "word/document.xml"
    std::string content;
};

// Part names in archive order.
const std::vector<std::string>& docx_part_names();

// Renders every XML part. Throws SerializationError for a node the renderer
// cannot express: bad color, run size outside 1..1638 half-points, empty font
// name, or text XML 1.0 cannot carry.
std::vector<DocxPart> render_parts(const Document& doc, const StyleConstants& style);

// render_parts() packed into a ZIP container. Same input, same bytes.
std::vector<uint8_t> serialize(const Document& doc, const StyleConstants& style);

}  // namespace folio

#endif // FOLIO_DOCX_SERIALIZER_H
