#ifndef FOLIO_ASSEMBLER_H
#define FOLIO_ASSEMBLER_H

#include "content_node.h"
#include "style.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// ============================================================================
// Manifest
// ============================================================================

// A pure builder: its only input is the shared, immutable style.
using ChapterBuilder = std::function<ChapterOutput(const StyleConstants&)>;

struct ChapterModule {
    std::string    id;     // stable name, e.g. "01-mission-vision"
    ChapterBuilder build;
};

// Declared document order.
using Manifest = std::vector<ChapterModule>;

// ============================================================================
// Assembly result
// ============================================================================

// Where a chapter landed in the flat stream.
struct ChapterSpan {
    std::string id;
    size_t      first = 0;
    size_t      count = 0;
};

// Non-fatal findings. node_index is into AssembledDocument::nodes.
struct AssemblyWarning {
    size_t                manifest_index = 0;
    std::string           chapter_id;
    std::optional<size_t> node_index;
    std::string           message;
};

struct AssembledDocument {
    std::vector<ContentNode>     nodes;
    std::vector<ChapterSpan>     chapters;
    std::vector<AssemblyWarning> warnings;
    size_t                       inserted_page_breaks = 0;
};

// Runs every builder in manifest order, flattens the outputs into one stream
// and validates it. Before each part heading that does not open the stream,
// exactly one page break is guaranteed.
//
// Throws:
//   AuthoringError - a builder's node failed validation, or a table is wider
//                    than style.page_content_width (chapter and node attached)
//   AssemblyError  - a builder threw anything else, two parts share an
//                    ordinal, or two manifest entries share an id
//
// Nothing is returned unless every chapter assembled.
AssembledDocument assemble(const Manifest& manifest, const StyleConstants& style);

// Leading section number of a heading ("2.1.3 Receipts" -> "2.1.3"); empty
// if the text does not start with one.
std::string heading_number(const std::string& text);

}  // namespace folio

#endif // FOLIO_ASSEMBLER_H
