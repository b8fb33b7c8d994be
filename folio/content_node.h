#ifndef FOLIO_CONTENT_NODE_H
#define FOLIO_CONTENT_NODE_H

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace folio {

// ============================================================================
// Node payloads
// ============================================================================

// Code runs take their font, size, color and shading defaults from the code
// entries of the style instead of the body entries.
enum class RunRole { Body, Code };

// A styled text run. Unset attributes take the style default at serialization.
struct Run {
    std::string                text;
    std::optional<bool>        bold;
    std::optional<bool>        italic;
    std::optional<std::string> color;              // RRGGBB
    std::optional<int>         size;               // half-points
    std::optional<std::string> font;
    std::optional<std::string> shading;            // RRGGBB fill behind the run
    std::optional<int>         character_spacing;  // twentieths of a point
    RunRole                    role = RunRole::Body;
};

enum class Alignment { Justified, Center };

struct Heading {
    int         level = 1;  // 1 chapter, 2 section, 3 subsection
    std::string text;
};

struct PartHeading {
    std::string        text;     // upper case
    std::optional<int> ordinal;  // from a "PART <roman>:" prefix
};

struct Paragraph {
    std::vector<Run> runs;
    Alignment        alignment = Alignment::Justified;
};

struct Table {
    std::vector<std::string>              header_row;
    std::vector<std::vector<std::string>> body_rows;
    std::vector<int>                      col_widths;  // layout units

    long total_width() const;
};

struct CodeBlock {
    std::vector<std::string> lines;
};

enum class LabeledKind { Definition, Theorem };

struct LabeledBlock {
    LabeledKind kind = LabeledKind::Definition;
    std::string label;
    std::string body;
};

struct Spacer {
    int height = 0;
};

struct PageBreak {};

enum class RuleStyle {
    Accent,       // gold hairline
    Light,        // warm gray
    PartDivider,  // indented gold rule under a part heading
};

struct Rule {
    RuleStyle style = RuleStyle::Accent;
};

struct BulletItem {
    std::vector<Run> runs;
};

bool operator==(const Run& a, const Run& b);
bool operator==(const Heading& a, const Heading& b);
bool operator==(const PartHeading& a, const PartHeading& b);
bool operator==(const Paragraph& a, const Paragraph& b);
bool operator==(const Table& a, const Table& b);
bool operator==(const CodeBlock& a, const CodeBlock& b);
bool operator==(const LabeledBlock& a, const LabeledBlock& b);
bool operator==(const Spacer& a, const Spacer& b);
bool operator==(const PageBreak& a, const PageBreak& b);
bool operator==(const Rule& a, const Rule& b);
bool operator==(const BulletItem& a, const BulletItem& b);

// ============================================================================
// ContentNode - tagged union over the payloads
// ============================================================================

// Order matches the variant alternatives in ContentNode.
enum class NodeKind {
    Heading,
    PartHeading,
    Paragraph,
    Run,
    Table,
    CodeBlock,
    LabeledBlock,
    Spacer,
    PageBreak,
    Rule,
    BulletItem,
};

const char* node_kind_name(NodeKind kind);

// Constructors validate their payload and throw AuthoringError, so every
// ContentNode that exists is well formed. Nodes are read-only once built.
class ContentNode {
public:
    using Value = std::variant<Heading, PartHeading, Paragraph, Run, Table, CodeBlock,
                               LabeledBlock, Spacer, PageBreak, Rule, BulletItem>;

    explicit ContentNode(Heading h);
    explicit ContentNode(PartHeading h);
    explicit ContentNode(Paragraph p);
    explicit ContentNode(Run r);
    explicit ContentNode(Table t);
    explicit ContentNode(CodeBlock c);
    explicit ContentNode(LabeledBlock b);
    explicit ContentNode(Spacer s);
    explicit ContentNode(PageBreak b);
    explicit ContentNode(Rule r);
    explicit ContentNode(BulletItem b);

    NodeKind    kind() const { return static_cast<NodeKind>(value_.index()); }
    const char* kindName() const { return node_kind_name(kind()); }

    template <class T> bool is() const { return std::holds_alternative<T>(value_); }
    template <class T> const T& as() const { return std::get<T>(value_); }
    template <class T> const T* getIf() const { return std::get_if<T>(&value_); }

    const Value& value() const { return value_; }

private:
    Value value_;
};

bool operator==(const ContentNode& a, const ContentNode& b);
bool operator!=(const ContentNode& a, const ContentNode& b);

// Roman ordinal from "PART XIV: ..." (case-insensitive). Empty when the text
// carries no ordinal.
std::optional<int> parse_part_ordinal(const std::string& text);

// ============================================================================
// Sequences and chapter output
// ============================================================================

// Ordered, flat group of nodes returned by primitives that expand into
// several structural units (part headings, code blocks, tables).
class NodeSequence {
public:
    NodeSequence() = default;
    NodeSequence(std::initializer_list<ContentNode> nodes) : nodes_(nodes) {}
    explicit NodeSequence(std::vector<ContentNode> nodes) : nodes_(std::move(nodes)) {}

    void append(ContentNode node) { nodes_.push_back(std::move(node)); }

    const std::vector<ContentNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool   empty() const { return nodes_.empty(); }

    std::vector<ContentNode>::const_iterator begin() const { return nodes_.begin(); }
    std::vector<ContentNode>::const_iterator end() const { return nodes_.end(); }

private:
    std::vector<ContentNode> nodes_;
};

// What a primitive hands back: one node, or a sequence.
using Fragment = std::variant<ContentNode, NodeSequence>;

// What a chapter builder returns: a bare node, or a list of fragments that
// the assembler flattens one level.
class ChapterOutput {
public:
    using Value = std::variant<ContentNode, std::vector<Fragment>>;

    ChapterOutput(ContentNode single) : value_(std::move(single)) {}
    ChapterOutput(NodeSequence sequence) : value_(std::vector<Fragment>{std::move(sequence)}) {}
    ChapterOutput(std::initializer_list<Fragment> fragments)
        : value_(std::vector<Fragment>(fragments)) {}
    ChapterOutput(std::vector<Fragment> fragments) : value_(std::move(fragments)) {}

    const Value& value() const { return value_; }

private:
    Value value_;
};

// Wraps a bare node into a one-element list, otherwise splices each fragment
// in order. The result is the flat node stream of one chapter.
std::vector<ContentNode> normalize(const ChapterOutput& output);

}  // namespace folio

#endif // FOLIO_CONTENT_NODE_H
