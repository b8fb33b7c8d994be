#ifndef FOLIO_PRIMITIVES_H
#define FOLIO_PRIMITIVES_H

#include "content_node.h"
#include "style.h"

#include <initializer_list>
#include <string>
#include <vector>

namespace folio {

// One constructor per node kind. Constructors that expand into several
// structural units (part headings, code blocks, tables) return a NodeSequence,
// the rest a single ContentNode. Validation failures throw AuthoringError.
//
// Only the primitives that need a layout default take the style; everything
// else leaves styling to the serializer, which fills unset run attributes
// from the same StyleConstants.

// A piece of a mixed paragraph: either a styled Run or plain text, which
// becomes a default body run.
class RunPiece {
public:
    RunPiece(const char* text) { run_.text = text; }
    RunPiece(std::string text) { run_.text = std::move(text); }
    RunPiece(Run run) : run_(std::move(run)) {}

    const Run& run() const { return run_; }

private:
    Run run_;
};

// --- Text --------------------------------------------------------------------

ContentNode p(const std::string& text);
ContentNode p_runs(std::initializer_list<RunPiece> pieces);
ContentNode p_runs(const std::vector<RunPiece>& pieces);
ContentNode centered(const std::string& text);

Run bold(const std::string& text);
Run italic(const std::string& text);
Run code(const std::string& text);

// Bare run node; rendered as a paragraph holding just that run.
ContentNode run(const std::string& text);
ContentNode run(Run styled);

// --- Headings ----------------------------------------------------------------

// "PART I: FOUNDATION" - upper-cased heading plus the gold divider rule.
// The assembler guarantees the page break in front of it.
NodeSequence part_heading(const std::string& text);

ContentNode chapter_heading(const std::string& text);
ContentNode h2(const std::string& text);
ContentNode h3(const std::string& text);

// --- Rules -------------------------------------------------------------------

ContentNode rule();
ContentNode rule_light();

// --- Definitions and theorems ------------------------------------------------

ContentNode definition(const std::string& label, const std::string& body);
ContentNode theorem(const std::string& label, const std::string& body);

// --- Code --------------------------------------------------------------------

ContentNode code_line(const std::string& line);

// One CodeBlock node per line of source ("\n"-separated, trailing "\r" dropped).
NodeSequence code_block(const std::string& source);

// --- Tables ------------------------------------------------------------------

// Table with explicit widths in layout units, followed by a spacer.
NodeSequence table(const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& rows,
                   const std::vector<int>& col_widths);

// Same, with even_widths() over the page content width.
NodeSequence table(const StyleConstants& style,
                   const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& rows);

// n widths summing to the page content width; the last column takes the
// remainder of the division.
std::vector<int> even_widths(const StyleConstants& style, size_t n);

// --- Lists -------------------------------------------------------------------

ContentNode bullet_item(const std::string& text);
ContentNode bullet_runs(std::initializer_list<RunPiece> pieces);

// --- Spacing -----------------------------------------------------------------

ContentNode spacer(int height = DEFAULT_SPACER_HEIGHT);
ContentNode page_break();

}  // namespace folio

#endif // FOLIO_PRIMITIVES_H
