#include "content_node.h"
#include "errors.h"

#include <cctype>
#include <numeric>
#include <string>

namespace folio {

// ============================================================================
// Kind names
// ============================================================================

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Heading:      return "Heading";
        case NodeKind::PartHeading:  return "PartHeading";
        case NodeKind::Paragraph:    return "Paragraph";
        case NodeKind::Run:          return "Run";
        case NodeKind::Table:        return "Table";
        case NodeKind::CodeBlock:    return "CodeBlock";
        case NodeKind::LabeledBlock: return "LabeledBlock";
        case NodeKind::Spacer:       return "Spacer";
        case NodeKind::PageBreak:    return "PageBreak";
        case NodeKind::Rule:         return "Rule";
        case NodeKind::BulletItem:   return "BulletItem";
    }
    return "Unknown";
}

long Table::total_width() const {
    return std::accumulate(col_widths.begin(), col_widths.end(), 0L);
}

// ============================================================================
// Construction-time validation
// ============================================================================

static bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static void fail(NodeKind kind, const std::string& invariant) {
    NodeLocation where;
    where.node_kind = node_kind_name(kind);
    throw AuthoringError(invariant, where);
}

static void validate(const Heading& h) {
    if (h.level < 1 || h.level > 3) {
        fail(NodeKind::Heading, "heading level " + std::to_string(h.level) + " is outside 1..3");
    }
    if (is_blank(h.text)) {
        fail(NodeKind::Heading, "heading text is empty");
    }
}

static void validate(const PartHeading& h) {
    if (is_blank(h.text)) {
        fail(NodeKind::PartHeading, "part heading text is empty");
    }
}

static void validate(const Table& t) {
    const size_t cols = t.header_row.size();
    if (cols == 0) {
        fail(NodeKind::Table, "table has no columns");
    }
    if (t.col_widths.size() != cols) {
        fail(NodeKind::Table, "table declares " + std::to_string(t.col_widths.size()) +
                              " column widths for " + std::to_string(cols) + " header cells");
    }
    for (size_t i = 0; i < t.col_widths.size(); ++i) {
        if (t.col_widths[i] <= 0) {
            fail(NodeKind::Table, "column " + std::to_string(i) + " width " +
                                  std::to_string(t.col_widths[i]) + " is not positive");
        }
    }
    for (size_t r = 0; r < t.body_rows.size(); ++r) {
        if (t.body_rows[r].size() != cols) {
            fail(NodeKind::Table, "row " + std::to_string(r) + " has " +
                                  std::to_string(t.body_rows[r].size()) + " cells, header has " +
                                  std::to_string(cols));
        }
    }
}

static void validate(const CodeBlock& c) {
    if (c.lines.empty()) {
        fail(NodeKind::CodeBlock, "code block has no lines");
    }
}

static void validate(const LabeledBlock& b) {
    const char* what = b.kind == LabeledKind::Theorem ? "theorem" : "definition";
    if (is_blank(b.label)) {
        fail(NodeKind::LabeledBlock, std::string(what) + " label is empty");
    }
    if (is_blank(b.body)) {
        fail(NodeKind::LabeledBlock, std::string(what) + " '" + b.label + "' has an empty body");
    }
}

static void validate(const Spacer& s) {
    if (s.height < 0) {
        fail(NodeKind::Spacer, "spacer height " + std::to_string(s.height) + " is negative");
    }
}

static void validate(const BulletItem& b) {
    if (b.runs.empty()) {
        fail(NodeKind::BulletItem, "bullet item has no runs");
    }
}

ContentNode::ContentNode(Heading h)      { validate(h); value_ = std::move(h); }
ContentNode::ContentNode(PartHeading h)  { validate(h); value_ = std::move(h); }
ContentNode::ContentNode(Paragraph p)    : value_(std::move(p)) {}
ContentNode::ContentNode(Run r)          : value_(std::move(r)) {}
ContentNode::ContentNode(Table t)        { validate(t); value_ = std::move(t); }
ContentNode::ContentNode(CodeBlock c)    { validate(c); value_ = std::move(c); }
ContentNode::ContentNode(LabeledBlock b) { validate(b); value_ = std::move(b); }
ContentNode::ContentNode(Spacer s)       { validate(s); value_ = s; }
ContentNode::ContentNode(PageBreak b)    : value_(b) {}
ContentNode::ContentNode(Rule r)         : value_(r) {}
ContentNode::ContentNode(BulletItem b)   { validate(b); value_ = std::move(b); }

// ============================================================================
// Equality
// ============================================================================

bool operator==(const Run& a, const Run& b) {
    return a.text == b.text && a.bold == b.bold && a.italic == b.italic &&
           a.color == b.color && a.size == b.size && a.font == b.font &&
           a.shading == b.shading && a.character_spacing == b.character_spacing &&
           a.role == b.role;
}

bool operator==(const Heading& a, const Heading& b) {
    return a.level == b.level && a.text == b.text;
}

bool operator==(const PartHeading& a, const PartHeading& b) {
    return a.text == b.text && a.ordinal == b.ordinal;
}

bool operator==(const Paragraph& a, const Paragraph& b) {
    return a.alignment == b.alignment && a.runs == b.runs;
}

bool operator==(const Table& a, const Table& b) {
    return a.header_row == b.header_row && a.body_rows == b.body_rows &&
           a.col_widths == b.col_widths;
}

bool operator==(const CodeBlock& a, const CodeBlock& b) { return a.lines == b.lines; }

bool operator==(const LabeledBlock& a, const LabeledBlock& b) {
    return a.kind == b.kind && a.label == b.label && a.body == b.body;
}

bool operator==(const Spacer& a, const Spacer& b) { return a.height == b.height; }
bool operator==(const PageBreak&, const PageBreak&) { return true; }
bool operator==(const Rule& a, const Rule& b) { return a.style == b.style; }
bool operator==(const BulletItem& a, const BulletItem& b) { return a.runs == b.runs; }

bool operator==(const ContentNode& a, const ContentNode& b) {
    return a.value() == b.value();
}

bool operator!=(const ContentNode& a, const ContentNode& b) {
    return !(a == b);
}

// ============================================================================
// Part ordinals
// ============================================================================

static int roman_digit(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'I': return 1;
        case 'V': return 5;
        case 'X': return 10;
        case 'L': return 50;
        case 'C': return 100;
        case 'D': return 500;
        case 'M': return 1000;
    }
    return 0;
}

static std::string to_roman(int value) {
    static const struct { int value; const char* numeral; } table[] = {
        {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"}, {100, "C"}, {90, "XC"},
        {50, "L"},   {40, "XL"},  {10, "X"},  {9, "IX"},   {5, "V"},   {4, "IV"},  {1, "I"},
    };
    std::string out;
    for (const auto& entry : table) {
        while (value >= entry.value) {
            out += entry.numeral;
            value -= entry.value;
        }
    }
    return out;
}

std::optional<int> parse_part_ordinal(const std::string& text) {
    size_t pos = text.find_first_not_of(" \t");
    if (pos == std::string::npos || text.size() - pos < 5) return std::nullopt;

    std::string word = text.substr(pos, 4);
    for (auto& c : word) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (word != "PART") return std::nullopt;
    pos += 4;
    if (pos >= text.size() || text[pos] != ' ') return std::nullopt;
    while (pos < text.size() && text[pos] == ' ') ++pos;

    size_t start = pos;
    while (pos < text.size() && roman_digit(text[pos]) > 0) ++pos;
    if (pos == start) return std::nullopt;
    // The numeral must end the word: "PART IV:" or "PART IV" but not "PART INTRO".
    if (pos < text.size() && text[pos] != ':' && text[pos] != ' ') return std::nullopt;

    int total = 0;
    for (size_t i = start; i < pos; ++i) {
        int v = roman_digit(text[i]);
        int next = (i + 1 < pos) ? roman_digit(text[i + 1]) : 0;
        total += (v < next) ? -v : v;
    }
    if (total <= 0) return std::nullopt;

    // Only canonical numerals count: "IIII" and "VX" carry no ordinal.
    std::string numeral = text.substr(start, pos - start);
    for (auto& c : numeral) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (numeral != to_roman(total)) return std::nullopt;
    return total;
}

// ============================================================================
// Normalization
// ============================================================================

namespace {

struct Flattener {
    std::vector<ContentNode>& out;

    void operator()(const ContentNode& node) const { out.push_back(node); }
    void operator()(const NodeSequence& seq) const { out.insert(out.end(), seq.begin(), seq.end()); }
    void operator()(const std::vector<Fragment>& fragments) const {
        for (const auto& fragment : fragments) std::visit(*this, fragment);
    }
};

}  // namespace

std::vector<ContentNode> normalize(const ChapterOutput& output) {
    std::vector<ContentNode> flat;
    std::visit(Flattener{flat}, output.value());
    return flat;
}

}  // namespace folio
