#include "primitives.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace folio {

// ============================================================================
// Text primitives
// ============================================================================

static Run text_run(const std::string& text) {
    Run r;
    r.text = text;
    return r;
}

ContentNode p(const std::string& text) {
    Paragraph para;
    para.runs.push_back(text_run(text));
    return ContentNode(std::move(para));
}

ContentNode p_runs(std::initializer_list<RunPiece> pieces) {
    return p_runs(std::vector<RunPiece>(pieces));
}

ContentNode p_runs(const std::vector<RunPiece>& pieces) {
    Paragraph para;
    para.runs.reserve(pieces.size());
    for (const auto& piece : pieces) {
        para.runs.push_back(piece.run());
    }
    return ContentNode(std::move(para));
}

ContentNode centered(const std::string& text) {
    Paragraph para;
    para.alignment = Alignment::Center;
    para.runs.push_back(text_run(text));
    return ContentNode(std::move(para));
}

Run bold(const std::string& text) {
    Run r = text_run(text);
    r.bold = true;
    return r;
}

Run italic(const std::string& text) {
    Run r = text_run(text);
    r.italic = true;
    return r;
}

Run code(const std::string& text) {
    Run r = text_run(text);
    r.role = RunRole::Code;
    return r;
}

ContentNode run(const std::string& text) {
    return ContentNode(text_run(text));
}

ContentNode run(Run styled) {
    return ContentNode(std::move(styled));
}

// ============================================================================
// Headings
// ============================================================================

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

NodeSequence part_heading(const std::string& text) {
    PartHeading heading;
    heading.text = to_upper(text);
    heading.ordinal = parse_part_ordinal(heading.text);
    return NodeSequence{
        ContentNode(std::move(heading)),
        ContentNode(Rule{RuleStyle::PartDivider}),
    };
}

static ContentNode heading(int level, const std::string& text) {
    Heading h;
    h.level = level;
    h.text = text;
    return ContentNode(std::move(h));
}

ContentNode chapter_heading(const std::string& text) { return heading(1, text); }
ContentNode h2(const std::string& text) { return heading(2, text); }
ContentNode h3(const std::string& text) { return heading(3, text); }

// ============================================================================
// Rules
// ============================================================================

ContentNode rule()       { return ContentNode(Rule{RuleStyle::Accent}); }
ContentNode rule_light() { return ContentNode(Rule{RuleStyle::Light}); }

// ============================================================================
// Definitions and theorems
// ============================================================================

static ContentNode labeled(LabeledKind kind, const std::string& label, const std::string& body) {
    LabeledBlock block;
    block.kind = kind;
    block.label = label;
    block.body = body;
    return ContentNode(std::move(block));
}

ContentNode definition(const std::string& label, const std::string& body) {
    return labeled(LabeledKind::Definition, label, body);
}

ContentNode theorem(const std::string& label, const std::string& body) {
    return labeled(LabeledKind::Theorem, label, body);
}

// ============================================================================
// Code blocks
// ============================================================================

ContentNode code_line(const std::string& line) {
    CodeBlock block;
    block.lines.push_back(line);
    return ContentNode(std::move(block));
}

NodeSequence code_block(const std::string& source) {
    NodeSequence seq;
    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        seq.append(code_line(line));
    }
    // getline yields nothing for "" and drops one trailing newline.
    if (source.empty() || source.back() == '\n') {
        seq.append(code_line(""));
    }
    return seq;
}

// ============================================================================
// Tables
// ============================================================================

NodeSequence table(const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& rows,
                   const std::vector<int>& col_widths) {
    Table t;
    t.header_row = headers;
    t.body_rows = rows;
    t.col_widths = col_widths;
    return NodeSequence{
        ContentNode(std::move(t)),
        spacer(DEFAULT_SPACER_HEIGHT),
    };
}

NodeSequence table(const StyleConstants& style,
                   const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& rows) {
    return table(headers, rows, even_widths(style, headers.size()));
}

std::vector<int> even_widths(const StyleConstants& style, size_t n) {
    if (n == 0) return {};
    const int total = style.page_content_width;
    const int w = total / static_cast<int>(n);
    std::vector<int> widths(n, w);
    widths[n - 1] += total - w * static_cast<int>(n);
    return widths;
}

// ============================================================================
// Lists
// ============================================================================

ContentNode bullet_item(const std::string& text) {
    BulletItem item;
    item.runs.push_back(text_run(text));
    return ContentNode(std::move(item));
}

ContentNode bullet_runs(std::initializer_list<RunPiece> pieces) {
    BulletItem item;
    for (const auto& piece : pieces) {
        item.runs.push_back(piece.run());
    }
    return ContentNode(std::move(item));
}

// ============================================================================
// Spacing
// ============================================================================

ContentNode spacer(int height) {
    return ContentNode(Spacer{height});
}

ContentNode page_break() {
    return ContentNode(PageBreak{});
}

}  // namespace folio
