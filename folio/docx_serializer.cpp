#include "docx_serializer.h"
#include "errors.h"
#include "outline.h"
#include "style_config.h"
#include "xml_writer.h"
#include "zip_archive.h"

#include <optional>

namespace folio {

// ============================================================================
// Constants
// ============================================================================

static constexpr int MIN_RUN_SIZE = 1;
static constexpr int MAX_RUN_SIZE = 1638;  // half-points, Word's 819pt ceiling

static constexpr const char* NS_W =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
static constexpr const char* NS_R =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
static constexpr const char* REL_BASE =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

static constexpr const char* HEADER_TEXT_COLOR = "666666";
static constexpr const char* WHITE             = "FFFFFF";
static constexpr const char* BULLET_CHAR       = "\xE2\x80\xA2";  // U+2022

static constexpr int HEADER_FOOTER_DISTANCE = 720;
static constexpr int BULLET_INDENT          = 720;
static constexpr int BULLET_HANGING         = 360;
static constexpr int TOC_LEVEL_INDENT       = 360;

const std::vector<std::string>& docx_part_names() {
    static const std::vector<std::string> names = {
        "[Content_Types].xml",
        "_rels/.rels",
        "docProps/core.xml",
        "docProps/app.xml",
        "word/document.xml",
        "word/styles.xml",
        "word/numbering.xml",
        "word/settings.xml",
        "word/header1.xml",
        "word/footer1.xml",
        "word/_rels/document.xml.rels",
    };
    return names;
}

static std::string num(long v) { return std::to_string(v); }

// ============================================================================
// Render-time checks
// ============================================================================

// Where a failure is reported: a node of the stream, or a front-matter part.
struct Origin {
    std::optional<size_t> node_index;
    std::string           kind;
};

static void check_text(const Origin& at, const std::string& what, const std::string& text) {
    if (!is_xml_safe(text)) {
        throw SerializationError(at.node_index, at.kind,
                                 what + " holds characters XML 1.0 cannot carry");
    }
}

static void check_color(const Origin& at, const std::string& what, const std::string& color) {
    if (!is_hex_color(color)) {
        throw SerializationError(at.node_index, at.kind,
                                 what + " '" + color + "' is not six hex digits");
    }
}

static void check_font(const Origin& at, const std::string& font) {
    if (font.empty()) {
        throw SerializationError(at.node_index, at.kind, "font name is empty");
    }
    check_text(at, "font name", font);
}

static void check_size(const Origin& at, int size) {
    if (size < MIN_RUN_SIZE || size > MAX_RUN_SIZE) {
        throw SerializationError(at.node_index, at.kind,
                                 "run size " + num(size) + " is outside " + num(MIN_RUN_SIZE) +
                                 ".." + num(MAX_RUN_SIZE) + " half-points");
    }
}

static void check_style(const StyleConstants& s) {
    const Origin at{std::nullopt, "Style"};
    check_font(at, s.body_font);
    check_font(at, s.code_font);
    check_size(at, s.body_size);
    check_size(at, s.code_size);
    const std::pair<const char*, const std::string*> colors[] = {
        {"dark_color", &s.dark_color},
        {"accent_color", &s.accent_color},
        {"accent_secondary", &s.accent_secondary},
        {"h1_color", &s.h1_color},
        {"h2_color", &s.h2_color},
        {"code_text_color", &s.code_text_color},
        {"code_background", &s.code_background},
        {"table_header_background", &s.table_header_background},
        {"table_header_text", &s.table_header_text},
        {"table_alt_row", &s.table_alt_row},
    };
    for (const auto& c : colors) check_color(at, c.first, *c.second);
}

// ============================================================================
// Runs
// ============================================================================

static Run styled_run(const std::string& text, int size, const std::string& color,
                      bool bold = false, bool italic = false) {
    Run r;
    r.text = text;
    r.size = size;
    r.color = color;
    if (bold) r.bold = true;
    if (italic) r.italic = true;
    return r;
}

// Unset attributes come from the body or code entries of the style.
static void write_run(XmlWriter& w, const Run& r, const StyleConstants& s, const Origin& at) {
    const bool is_code = r.role == RunRole::Code;
    const std::string& font  = r.font ? *r.font : (is_code ? s.code_font : s.body_font);
    const int size           = r.size ? *r.size : (is_code ? s.code_size : s.body_size);
    const std::string& color = r.color ? *r.color : (is_code ? s.code_text_color : s.dark_color);
    std::optional<std::string> shading = r.shading;
    if (!shading && is_code) shading = s.code_background;

    check_font(at, font);
    check_size(at, size);
    check_color(at, "run color", color);
    if (shading) check_color(at, "run shading", *shading);
    check_text(at, "run text", r.text);

    w.open("w:r");
    w.open("w:rPr");
    w.empty("w:rFonts", {{"w:ascii", font}, {"w:hAnsi", font}, {"w:cs", font}});
    if (r.bold.value_or(false)) w.empty("w:b");
    if (r.italic.value_or(false)) w.empty("w:i");
    w.empty("w:color", {{"w:val", color}});
    if (r.character_spacing) w.empty("w:spacing", {{"w:val", num(*r.character_spacing)}});
    w.empty("w:sz", {{"w:val", num(size)}});
    w.empty("w:szCs", {{"w:val", num(size)}});
    if (shading) w.empty("w:shd", {{"w:val", "clear"}, {"w:color", "auto"}, {"w:fill", *shading}});
    w.close("w:rPr");
    w.element("w:t", r.text, {{"xml:space", "preserve"}});
    w.close("w:r");
}

// ============================================================================
// Paragraph properties
// ============================================================================

struct Border {
    const char* side = nullptr;  // "left" or "bottom"
    int         size = 0;        // eighths of a point
    int         space = 0;
    std::string color;
};

struct ParagraphProps {
    std::string        style;
    bool               keep_next = false;
    bool               keep_lines = false;
    bool               widow_control = false;
    bool               bullet = false;
    Border             border;
    std::string        shading;
    std::optional<int> right_tab;  // dot leader
    std::optional<int> before;
    std::optional<int> after;
    std::optional<int> line;
    std::optional<int> indent_left;
    std::optional<int> indent_right;
    std::string        jc;
};

// Children in schema order.
static void write_ppr(XmlWriter& w, const ParagraphProps& pp) {
    w.open("w:pPr");
    if (!pp.style.empty()) w.empty("w:pStyle", {{"w:val", pp.style}});
    if (pp.keep_next) w.empty("w:keepNext");
    if (pp.keep_lines) w.empty("w:keepLines");
    if (pp.widow_control) w.empty("w:widowControl");
    if (pp.bullet) {
        w.open("w:numPr");
        w.empty("w:ilvl", {{"w:val", "0"}});
        w.empty("w:numId", {{"w:val", "1"}});
        w.close("w:numPr");
    }
    if (pp.border.side) {
        std::string tag = std::string("w:") + pp.border.side;
        w.open("w:pBdr");
        w.empty(tag.c_str(), {{"w:val", "single"}, {"w:sz", num(pp.border.size)},
                              {"w:space", num(pp.border.space)}, {"w:color", pp.border.color}});
        w.close("w:pBdr");
    }
    if (!pp.shading.empty()) {
        w.empty("w:shd", {{"w:val", "clear"}, {"w:color", "auto"}, {"w:fill", pp.shading}});
    }
    if (pp.right_tab) {
        w.open("w:tabs");
        w.empty("w:tab", {{"w:val", "right"}, {"w:leader", "dot"}, {"w:pos", num(*pp.right_tab)}});
        w.close("w:tabs");
    }
    if (pp.before || pp.after || pp.line) {
        XmlAttributes spacing;
        if (pp.before) spacing.emplace_back("w:before", num(*pp.before));
        if (pp.after) spacing.emplace_back("w:after", num(*pp.after));
        if (pp.line) {
            spacing.emplace_back("w:line", num(*pp.line));
            spacing.emplace_back("w:lineRule", "auto");
        }
        w.empty("w:spacing", spacing);
    }
    if (pp.indent_left || pp.indent_right) {
        XmlAttributes ind;
        if (pp.indent_left) ind.emplace_back("w:left", num(*pp.indent_left));
        if (pp.indent_right) ind.emplace_back("w:right", num(*pp.indent_right));
        w.empty("w:ind", ind);
    }
    if (!pp.jc.empty()) w.empty("w:jc", {{"w:val", pp.jc}});
    w.close("w:pPr");
}

static ParagraphProps body_props(Alignment align) {
    ParagraphProps pp;
    pp.widow_control = true;
    pp.after = 180;
    pp.line = 312;
    switch (align) {
        case Alignment::Justified: pp.jc = "both"; break;
        case Alignment::Center:    pp.jc = "center"; break;
    }
    return pp;
}

static void write_paragraph(XmlWriter& w, const ParagraphProps& pp, const std::vector<Run>& runs,
                            const StyleConstants& s, const Origin& at,
                            const OutlineEntry* bookmark = nullptr) {
    w.open("w:p");
    write_ppr(w, pp);
    if (bookmark) {
        w.empty("w:bookmarkStart", {{"w:id", num(bookmark->bookmark_id)},
                                    {"w:name", bookmark->bookmark_name}});
    }
    for (const auto& r : runs) write_run(w, r, s, at);
    if (bookmark) w.empty("w:bookmarkEnd", {{"w:id", num(bookmark->bookmark_id)}});
    w.close("w:p");
}

static void write_page_break(XmlWriter& w) {
    w.open("w:p");
    w.open("w:r");
    w.empty("w:br", {{"w:type", "page"}});
    w.close("w:r");
    w.close("w:p");
}

// ============================================================================
// Node rendering
// ============================================================================

struct RenderContext {
    const StyleConstants&             style;
    std::vector<const OutlineEntry*>  bookmark_at;  // by node index
};

static void render_heading(XmlWriter& w, const Heading& h, const RenderContext& ctx,
                           const Origin& at) {
    const StyleConstants& s = ctx.style;
    ParagraphProps pp;
    pp.style = "Heading" + num(h.level);
    pp.keep_next = true;
    pp.keep_lines = true;

    Run r;
    switch (h.level) {
        case 1:
            pp.before = 360; pp.after = 240;
            r = styled_run(h.text, 32, s.h1_color);
            break;
        case 2:
            pp.before = 300; pp.after = 180;
            r = styled_run(h.text, 26, s.h2_color);
            break;
        default:
            pp.before = 240; pp.after = 120;
            r = styled_run(h.text, 24, s.h1_color, true);
            break;
    }
    write_paragraph(w, pp, {r}, s, at, ctx.bookmark_at[*at.node_index]);
}

static void render_part_heading(XmlWriter& w, const PartHeading& h, const RenderContext& ctx,
                                const Origin& at) {
    ParagraphProps pp;
    pp.style = "Heading1";
    pp.keep_next = true;
    pp.keep_lines = true;
    pp.before = 0;
    pp.after = 120;

    Run r = styled_run(h.text, 36, ctx.style.h1_color, true);
    r.character_spacing = 80;
    write_paragraph(w, pp, {r}, ctx.style, at, ctx.bookmark_at[*at.node_index]);
}

static void render_table(XmlWriter& w, const Table& t, const StyleConstants& s, const Origin& at) {
    w.open("w:tbl");

    w.open("w:tblPr");
    w.empty("w:tblW", {{"w:w", num(t.total_width())}, {"w:type", "dxa"}});
    w.open("w:tblBorders");
    for (const char* side : {"w:top", "w:left", "w:bottom", "w:right", "w:insideH", "w:insideV"}) {
        w.empty(side, {{"w:val", "single"}, {"w:sz", "1"}, {"w:space", "0"},
                       {"w:color", s.accent_secondary}});
    }
    w.close("w:tblBorders");
    w.empty("w:tblLayout", {{"w:type", "fixed"}});
    w.open("w:tblCellMar");
    w.empty("w:top", {{"w:w", "80"}, {"w:type", "dxa"}});
    w.empty("w:left", {{"w:w", "120"}, {"w:type", "dxa"}});
    w.empty("w:bottom", {{"w:w", "80"}, {"w:type", "dxa"}});
    w.empty("w:right", {{"w:w", "120"}, {"w:type", "dxa"}});
    w.close("w:tblCellMar");
    w.close("w:tblPr");

    w.open("w:tblGrid");
    for (int width : t.col_widths) w.empty("w:gridCol", {{"w:w", num(width)}});
    w.close("w:tblGrid");

    auto write_row = [&](const std::vector<std::string>& cells, bool header, bool alt) {
        w.open("w:tr");
        if (header) {
            w.open("w:trPr");
            w.empty("w:tblHeader");
            w.close("w:trPr");
        }
        const std::string fill = header ? s.table_header_background
                                        : (alt ? s.table_alt_row : std::string(WHITE));
        for (size_t c = 0; c < cells.size(); ++c) {
            w.open("w:tc");
            w.open("w:tcPr");
            w.empty("w:tcW", {{"w:w", num(t.col_widths[c])}, {"w:type", "dxa"}});
            w.empty("w:shd", {{"w:val", "clear"}, {"w:color", "auto"}, {"w:fill", fill}});
            w.close("w:tcPr");

            Run r = header ? styled_run(cells[c], 20, s.table_header_text, true)
                           : styled_run(cells[c], 21, s.dark_color);
            if (header) r.character_spacing = 20;
            ParagraphProps pp;
            pp.after = 0;
            write_paragraph(w, pp, {r}, s, at);
            w.close("w:tc");
        }
        w.close("w:tr");
    };

    write_row(t.header_row, true, false);
    for (size_t r = 0; r < t.body_rows.size(); ++r) {
        write_row(t.body_rows[r], false, r % 2 == 1);
    }
    w.close("w:tbl");
}

static void render_code(XmlWriter& w, const CodeBlock& block, bool ends_run,
                        const StyleConstants& s, const Origin& at) {
    for (size_t i = 0; i < block.lines.size(); ++i) {
        ParagraphProps pp;
        pp.border = Border{"left", 4, 6, s.accent_secondary};
        pp.shading = s.code_background;
        pp.after = (ends_run && i + 1 == block.lines.size()) ? 200 : 0;
        pp.line = 240;

        Run r;
        r.text = block.lines[i].empty() ? " " : block.lines[i];
        r.role = RunRole::Code;
        write_paragraph(w, pp, {r}, s, at);
    }
}

static void render_labeled(XmlWriter& w, const LabeledBlock& b, const StyleConstants& s,
                           const Origin& at) {
    const bool is_theorem = b.kind == LabeledKind::Theorem;
    ParagraphProps pp;
    pp.keep_next = true;
    pp.border = Border{"left", 6, 8, is_theorem ? s.h2_color : s.accent_color};
    pp.before = 160;
    pp.after = 200;
    pp.line = 312;
    pp.indent_left = 360;

    Run label = styled_run(b.label + " ", s.body_size, s.h1_color, true, true);
    Run body = styled_run(b.body, s.body_size, s.dark_color, false, is_theorem);
    write_paragraph(w, pp, {label, body}, s, at);
}

static void render_rule(XmlWriter& w, const Rule& rule, const StyleConstants& s, const Origin& at) {
    ParagraphProps pp;
    switch (rule.style) {
        case RuleStyle::Accent:
            pp.border = Border{"bottom", 1, 4, s.accent_color};
            pp.before = 120;
            pp.after = 200;
            break;
        case RuleStyle::Light:
            pp.border = Border{"bottom", 1, 4, s.accent_secondary};
            pp.before = 80;
            pp.after = 160;
            break;
        case RuleStyle::PartDivider:
            pp.border = Border{"bottom", 1, 4, s.accent_color};
            pp.after = 300;
            pp.indent_left = 720;
            pp.indent_right = 720;
            break;
    }
    write_paragraph(w, pp, {}, s, at);
}

static void render_node(XmlWriter& w, const std::vector<ContentNode>& nodes, size_t index,
                        const RenderContext& ctx) {
    const ContentNode& node = nodes[index];
    const StyleConstants& s = ctx.style;
    const Origin at{index, node.kindName()};

    switch (node.kind()) {
        case NodeKind::Heading:
            render_heading(w, node.as<Heading>(), ctx, at);
            break;
        case NodeKind::PartHeading:
            render_part_heading(w, node.as<PartHeading>(), ctx, at);
            break;
        case NodeKind::Paragraph: {
            const Paragraph& para = node.as<Paragraph>();
            write_paragraph(w, body_props(para.alignment), para.runs, s, at);
            break;
        }
        case NodeKind::Run:
            write_paragraph(w, body_props(Alignment::Justified), {node.as<Run>()}, s, at);
            break;
        case NodeKind::Table:
            render_table(w, node.as<Table>(), s, at);
            break;
        case NodeKind::CodeBlock: {
            const bool ends_run = index + 1 == nodes.size() || !nodes[index + 1].is<CodeBlock>();
            render_code(w, node.as<CodeBlock>(), ends_run, s, at);
            break;
        }
        case NodeKind::LabeledBlock:
            render_labeled(w, node.as<LabeledBlock>(), s, at);
            break;
        case NodeKind::Spacer: {
            ParagraphProps pp;
            pp.after = node.as<Spacer>().height;
            write_paragraph(w, pp, {}, s, at);
            break;
        }
        case NodeKind::PageBreak:
            write_page_break(w);
            break;
        case NodeKind::Rule:
            render_rule(w, node.as<Rule>(), s, at);
            break;
        case NodeKind::BulletItem: {
            ParagraphProps pp;
            pp.bullet = true;
            pp.after = 80;
            pp.line = 312;
            write_paragraph(w, pp, node.as<BulletItem>().runs, s, at);
            break;
        }
    }
}

// ============================================================================
// Front matter
// ============================================================================

static void render_cover(XmlWriter& w, const DocumentInfo& info, const StyleConstants& s) {
    const Origin at{std::nullopt, "Cover"};

    ParagraphProps top;
    top.after = 2400;
    write_paragraph(w, top, {}, s, at);

    ParagraphProps centered;
    centered.jc = "center";
    centered.after = 240;
    write_paragraph(w, centered, {styled_run(info.title, 56, s.h1_color, true)}, s, at);

    if (!info.subtitle.empty()) {
        write_paragraph(w, centered, {styled_run(info.subtitle, 28, s.h2_color)}, s, at);
    }
    if (!info.version.empty()) {
        write_paragraph(w, centered,
                        {styled_run(info.version, 22, s.accent_secondary, false, true)}, s, at);
    }

    ParagraphProps rule;
    rule.border = Border{"bottom", 1, 4, s.accent_color};
    rule.before = 120;
    rule.after = 200;
    rule.indent_left = 1440;
    rule.indent_right = 1440;
    write_paragraph(w, rule, {}, s, at);

    write_page_break(w);
}

static void render_toc(XmlWriter& w, const std::vector<OutlineEntry>& outline,
                       const StyleConstants& s) {
    const Origin at{std::nullopt, "TableOfContents"};

    ParagraphProps title;
    title.after = 240;
    write_paragraph(w, title, {styled_run("TABLE OF CONTENTS", 28, s.dark_color, true)}, s, at);

    for (const auto& entry : outline) {
        ParagraphProps pp;
        pp.right_tab = s.page_content_width;
        pp.before = entry.level == 1 ? 120 : 0;
        pp.after = 60;
        pp.indent_left = (entry.level - 1) * TOC_LEVEL_INDENT;

        w.open("w:p");
        write_ppr(w, pp);
        w.open("w:hyperlink", {{"w:anchor", entry.bookmark_name}, {"w:history", "1"}});
        write_run(w, styled_run(entry.text, 22, s.dark_color, entry.level == 1), s, at);
        w.open("w:r");
        w.empty("w:tab");
        w.close("w:r");
        w.open("w:r");
        w.empty("w:fldChar", {{"w:fldCharType", "begin"}});
        w.close("w:r");
        w.open("w:r");
        w.element("w:instrText", " PAGEREF " + entry.bookmark_name + " \\h ",
                  {{"xml:space", "preserve"}});
        w.close("w:r");
        w.open("w:r");
        w.empty("w:fldChar", {{"w:fldCharType", "separate"}});
        w.close("w:r");
        w.open("w:r");
        w.element("w:t", "1");
        w.close("w:r");
        w.open("w:r");
        w.empty("w:fldChar", {{"w:fldCharType", "end"}});
        w.close("w:r");
        w.close("w:hyperlink");
        w.close("w:p");
    }

    write_page_break(w);
}

// ============================================================================
// Parts
// ============================================================================

static std::string render_document(const Document& doc, const std::vector<OutlineEntry>& outline,
                                   bool with_toc, const StyleConstants& s) {
    RenderContext ctx{s, std::vector<const OutlineEntry*>(doc.nodes.size(), nullptr)};
    for (const auto& entry : outline) ctx.bookmark_at[entry.node_index] = &entry;

    // Chapter markers take the ids after the outline bookmarks.
    int next_id = static_cast<int>(outline.size()) + 1;
    std::vector<std::vector<std::pair<int, std::string>>> opens(doc.nodes.size());
    std::vector<std::vector<int>> closes(doc.nodes.size());
    for (size_t c = 0; c < doc.chapters.size(); ++c) {
        const ChapterSpan& span = doc.chapters[c];
        if (span.count == 0 || span.first + span.count > doc.nodes.size()) continue;
        const int id = next_id++;
        opens[span.first].emplace_back(id, bookmark_safe_name("_ch" + num(c) + "_", span.id));
        closes[span.first + span.count - 1].push_back(id);
    }

    XmlWriter w;
    w.open("w:document", {{"xmlns:w", NS_W}, {"xmlns:r", NS_R}});
    w.open("w:body");

    if (doc.info.include_cover) render_cover(w, doc.info, s);
    if (with_toc) render_toc(w, outline, s);

    for (size_t i = 0; i < doc.nodes.size(); ++i) {
        for (const auto& open : opens[i]) {
            w.empty("w:bookmarkStart", {{"w:id", num(open.first)}, {"w:name", open.second}});
        }
        render_node(w, doc.nodes, i, ctx);
        for (int id : closes[i]) w.empty("w:bookmarkEnd", {{"w:id", num(id)}});
    }

    w.open("w:sectPr");
    w.empty("w:headerReference", {{"w:type", "default"}, {"r:id", "rId4"}});
    w.empty("w:footerReference", {{"w:type", "default"}, {"r:id", "rId5"}});
    w.empty("w:pgSz", {{"w:w", num(s.page_width)}, {"w:h", num(s.page_height)}});
    w.empty("w:pgMar", {{"w:top", num(s.margins.top)}, {"w:right", num(s.margins.right)},
                        {"w:bottom", num(s.margins.bottom)}, {"w:left", num(s.margins.left)},
                        {"w:header", num(HEADER_FOOTER_DISTANCE)},
                        {"w:footer", num(HEADER_FOOTER_DISTANCE)}, {"w:gutter", "0"}});
    w.close("w:sectPr");

    w.close("w:body");
    w.close("w:document");
    return w.take();
}

static void write_heading_style(XmlWriter& w, int level, int size, const std::string& color,
                                bool bold, const StyleConstants& s) {
    const std::string id = "Heading" + num(level);
    w.open("w:style", {{"w:type", "paragraph"}, {"w:styleId", id}});
    w.empty("w:name", {{"w:val", "heading " + num(level)}});
    w.empty("w:basedOn", {{"w:val", "Normal"}});
    w.empty("w:next", {{"w:val", "Normal"}});
    w.empty("w:qFormat");
    w.open("w:pPr");
    w.empty("w:keepNext");
    w.empty("w:keepLines");
    w.empty("w:outlineLvl", {{"w:val", num(level - 1)}});
    w.close("w:pPr");
    w.open("w:rPr");
    w.empty("w:rFonts", {{"w:ascii", s.body_font}, {"w:hAnsi", s.body_font}, {"w:cs", s.body_font}});
    if (bold) w.empty("w:b");
    w.empty("w:color", {{"w:val", color}});
    w.empty("w:sz", {{"w:val", num(size)}});
    w.empty("w:szCs", {{"w:val", num(size)}});
    w.close("w:rPr");
    w.close("w:style");
}

static std::string render_styles(const StyleConstants& s) {
    XmlWriter w;
    w.open("w:styles", {{"xmlns:w", NS_W}});

    w.open("w:docDefaults");
    w.open("w:rPrDefault");
    w.open("w:rPr");
    w.empty("w:rFonts", {{"w:ascii", s.body_font}, {"w:hAnsi", s.body_font}, {"w:cs", s.body_font}});
    w.empty("w:color", {{"w:val", s.dark_color}});
    w.empty("w:sz", {{"w:val", num(s.body_size)}});
    w.empty("w:szCs", {{"w:val", num(s.body_size)}});
    w.close("w:rPr");
    w.close("w:rPrDefault");
    w.open("w:pPrDefault");
    w.open("w:pPr");
    w.empty("w:spacing", {{"w:after", "0"}});
    w.close("w:pPr");
    w.close("w:pPrDefault");
    w.close("w:docDefaults");

    w.open("w:style", {{"w:type", "paragraph"}, {"w:default", "1"}, {"w:styleId", "Normal"}});
    w.empty("w:name", {{"w:val", "Normal"}});
    w.empty("w:qFormat");
    w.close("w:style");

    write_heading_style(w, 1, 32, s.h1_color, false, s);
    write_heading_style(w, 2, 26, s.h2_color, false, s);
    write_heading_style(w, 3, 24, s.h1_color, true, s);

    w.open("w:style", {{"w:type", "paragraph"}, {"w:styleId", "ListParagraph"}});
    w.empty("w:name", {{"w:val", "List Paragraph"}});
    w.empty("w:basedOn", {{"w:val", "Normal"}});
    w.empty("w:qFormat");
    w.open("w:pPr");
    w.empty("w:ind", {{"w:left", num(BULLET_INDENT)}});
    w.close("w:pPr");
    w.close("w:style");

    w.close("w:styles");
    return w.take();
}

static std::string render_numbering(const StyleConstants& s) {
    XmlWriter w;
    w.open("w:numbering", {{"xmlns:w", NS_W}});
    w.open("w:abstractNum", {{"w:abstractNumId", "0"}});
    w.empty("w:multiLevelType", {{"w:val", "singleLevel"}});
    w.open("w:lvl", {{"w:ilvl", "0"}});
    w.empty("w:start", {{"w:val", "1"}});
    w.empty("w:numFmt", {{"w:val", "bullet"}});
    w.empty("w:lvlText", {{"w:val", BULLET_CHAR}});
    w.empty("w:lvlJc", {{"w:val", "left"}});
    w.open("w:pPr");
    w.empty("w:ind", {{"w:left", num(BULLET_INDENT)}, {"w:hanging", num(BULLET_HANGING)}});
    w.close("w:pPr");
    w.open("w:rPr");
    w.empty("w:rFonts", {{"w:ascii", s.body_font}, {"w:hAnsi", s.body_font}});
    w.empty("w:color", {{"w:val", s.accent_color}});
    w.close("w:rPr");
    w.close("w:lvl");
    w.close("w:abstractNum");
    w.open("w:num", {{"w:numId", "1"}});
    w.empty("w:abstractNumId", {{"w:val", "0"}});
    w.close("w:num");
    w.close("w:numbering");
    return w.take();
}

static std::string render_settings(bool update_fields) {
    XmlWriter w;
    w.open("w:settings", {{"xmlns:w", NS_W}});
    w.empty("w:zoom", {{"w:percent", "100"}});
    w.empty("w:defaultTabStop", {{"w:val", "720"}});
    w.empty("w:characterSpacingControl", {{"w:val", "doNotCompress"}});
    // Page numbers in the static contents fill in on open.
    if (update_fields) w.empty("w:updateFields", {{"w:val", "true"}});
    w.open("w:compat");
    w.empty("w:compatSetting", {{"w:name", "compatibilityMode"},
                                {"w:uri", "http://schemas.microsoft.com/office/word"},
                                {"w:val", "15"}});
    w.close("w:compat");
    w.close("w:settings");
    return w.take();
}

static std::string render_header(const DocumentInfo& info, const StyleConstants& s) {
    const Origin at{std::nullopt, "Header"};
    XmlWriter w;
    w.open("w:hdr", {{"xmlns:w", NS_W}, {"xmlns:r", NS_R}});
    ParagraphProps pp;
    pp.border = Border{"bottom", 4, 4, s.accent_color};
    pp.jc = "right";
    std::vector<Run> runs;
    if (!info.header_text.empty()) {
        runs.push_back(styled_run(info.header_text, 16, HEADER_TEXT_COLOR));
    }
    write_paragraph(w, pp, runs, s, at);
    w.close("w:hdr");
    return w.take();
}

static std::string render_footer(const DocumentInfo& info, const StyleConstants& s) {
    const Origin at{std::nullopt, "Footer"};
    XmlWriter w;
    w.open("w:ftr", {{"xmlns:w", NS_W}, {"xmlns:r", NS_R}});
    w.open("w:p");
    ParagraphProps pp;
    pp.jc = "center";
    write_ppr(w, pp);
    if (!info.footer_text.empty()) {
        write_run(w, styled_run(info.footer_text + "  ", 16, HEADER_TEXT_COLOR), s, at);
    }
    w.open("w:fldSimple", {{"w:instr", " PAGE "}});
    write_run(w, styled_run("1", 16, HEADER_TEXT_COLOR), s, at);
    w.close("w:fldSimple");
    w.close("w:p");
    w.close("w:ftr");
    return w.take();
}

static std::string render_content_types() {
    static const char* WML = "application/vnd.openxmlformats-officedocument.wordprocessingml.";
    XmlWriter w;
    w.open("Types", {{"xmlns", "http://schemas.openxmlformats.org/package/2006/content-types"}});
    w.empty("Default", {{"Extension", "rels"},
                        {"ContentType", "application/vnd.openxmlformats-package.relationships+xml"}});
    w.empty("Default", {{"Extension", "xml"}, {"ContentType", "application/xml"}});
    const std::pair<const char*, std::string> overrides[] = {
        {"/word/document.xml", std::string(WML) + "document.main+xml"},
        {"/word/styles.xml", std::string(WML) + "styles+xml"},
        {"/word/numbering.xml", std::string(WML) + "numbering+xml"},
        {"/word/settings.xml", std::string(WML) + "settings+xml"},
        {"/word/header1.xml", std::string(WML) + "header+xml"},
        {"/word/footer1.xml", std::string(WML) + "footer+xml"},
        {"/docProps/core.xml", "application/vnd.openxmlformats-package.core-properties+xml"},
        {"/docProps/app.xml", "application/vnd.openxmlformats-officedocument.extended-properties+xml"},
    };
    for (const auto& o : overrides) {
        w.empty("Override", {{"PartName", o.first}, {"ContentType", o.second}});
    }
    w.close("Types");
    return w.take();
}

static std::string render_relationships(
        const std::vector<std::pair<std::string, std::string>>& targets) {
    XmlWriter w;
    w.open("Relationships",
           {{"xmlns", "http://schemas.openxmlformats.org/package/2006/relationships"}});
    for (size_t i = 0; i < targets.size(); ++i) {
        w.empty("Relationship", {{"Id", "rId" + num(static_cast<long>(i) + 1)},
                                 {"Type", targets[i].first}, {"Target", targets[i].second}});
    }
    w.close("Relationships");
    return w.take();
}

static std::string render_core(const DocumentInfo& info) {
    XmlWriter w;
    w.open("cp:coreProperties",
           {{"xmlns:cp", "http://schemas.openxmlformats.org/package/2006/metadata/core-properties"},
            {"xmlns:dc", "http://purl.org/dc/elements/1.1/"},
            {"xmlns:dcterms", "http://purl.org/dc/terms/"},
            {"xmlns:dcmitype", "http://purl.org/dc/dcmitype/"},
            {"xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance"}});
    w.element("dc:title", info.title);
    if (!info.subtitle.empty()) w.element("dc:subject", info.subtitle);
    if (!info.author.empty()) w.element("dc:creator", info.author);
    if (!info.version.empty()) w.element("cp:version", info.version);
    w.element("cp:revision", "1");
    w.close("cp:coreProperties");
    return w.take();
}

static std::string render_app(const Document& doc) {
    XmlWriter w;
    w.open("Properties",
           {{"xmlns", "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties"},
            {"xmlns:vt", "http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes"}});
    w.element("Application", "folio");
    w.element("Paragraphs", num(static_cast<long>(doc.nodes.size())));
    w.close("Properties");
    return w.take();
}

// ============================================================================
// Entry points
// ============================================================================

std::vector<DocxPart> render_parts(const Document& doc, const StyleConstants& style) {
    check_style(style);

    const Origin meta{std::nullopt, "DocumentInfo"};
    check_text(meta, "title", doc.info.title);
    check_text(meta, "subtitle", doc.info.subtitle);
    check_text(meta, "version", doc.info.version);
    check_text(meta, "author", doc.info.author);
    check_text(meta, "header text", doc.info.header_text);
    check_text(meta, "footer text", doc.info.footer_text);

    const std::vector<OutlineEntry> outline = build_outline(doc.nodes);
    const bool with_toc = doc.info.include_toc && !outline.empty();

    const std::string rel = REL_BASE;
    std::vector<DocxPart> parts;
    parts.push_back({"[Content_Types].xml", render_content_types()});
    parts.push_back({"_rels/.rels", render_relationships({
        {rel + "officeDocument", "word/document.xml"},
        {"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties",
         "docProps/core.xml"},
        {rel + "extended-properties", "docProps/app.xml"},
    })});
    parts.push_back({"docProps/core.xml", render_core(doc.info)});
    parts.push_back({"docProps/app.xml", render_app(doc)});
    parts.push_back({"word/document.xml", render_document(doc, outline, with_toc, style)});
    parts.push_back({"word/styles.xml", render_styles(style)});
    parts.push_back({"word/numbering.xml", render_numbering(style)});
    parts.push_back({"word/settings.xml", render_settings(with_toc)});
    parts.push_back({"word/header1.xml", render_header(doc.info, style)});
    parts.push_back({"word/footer1.xml", render_footer(doc.info, style)});
    // rId4 and rId5 are referenced from the section properties.
    parts.push_back({"word/_rels/document.xml.rels", render_relationships({
        {rel + "styles", "styles.xml"},
        {rel + "numbering", "numbering.xml"},
        {rel + "settings", "settings.xml"},
        {rel + "header", "header1.xml"},
        {rel + "footer", "footer1.xml"},
    })});
    return parts;
}

std::vector<uint8_t> serialize(const Document& doc, const StyleConstants& style) {
    const std::vector<DocxPart> parts = render_parts(doc, style);

    ZipWriter zip;
    for (const auto& part : parts) {
        if (!zip.addEntry(part.name, part.content)) {
            throw SerializationError(std::nullopt, "Container", zip.getLastError());
        }
    }
    return zip.finish();
}

}  // namespace folio
