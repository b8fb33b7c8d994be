#include <gtest/gtest.h>

#include "folio/errors.h"
#include "folio/primitives.h"

#include <numeric>

namespace folio {
namespace test {

class PrimitivesTest : public ::testing::Test {
protected:
    const StyleConstants style_;
};

// ============================================================================
// Text
// ============================================================================

TEST_F(PrimitivesTest, ParagraphHoldsOneDefaultRun) {
    ContentNode node = p("Plain text.");
    const Paragraph& para = node.as<Paragraph>();
    ASSERT_EQ(para.runs.size(), 1u);
    EXPECT_EQ(para.runs[0].text, "Plain text.");
    EXPECT_FALSE(para.runs[0].bold.has_value());
    EXPECT_EQ(para.alignment, Alignment::Justified);
}

TEST_F(PrimitivesTest, MixedRunsKeepOrderAndStyling) {
    ContentNode node = p_runs({bold("Note. "), "plain ", italic("emphasis"), code("x = 1")});
    const auto& runs = node.as<Paragraph>().runs;
    ASSERT_EQ(runs.size(), 4u);
    EXPECT_EQ(runs[0].bold, true);
    EXPECT_EQ(runs[1].text, "plain ");
    EXPECT_FALSE(runs[1].italic.has_value());
    EXPECT_EQ(runs[2].italic, true);
    EXPECT_EQ(runs[3].role, RunRole::Code);
}

TEST_F(PrimitivesTest, CenteredAlignment) {
    EXPECT_EQ(centered("Title").as<Paragraph>().alignment, Alignment::Center);
}

// ============================================================================
// Headings
// ============================================================================

TEST_F(PrimitivesTest, PartHeadingIsUpperCasedAndFollowedByDivider) {
    NodeSequence seq = part_heading("Part IV: Legal Framework");
    ASSERT_EQ(seq.size(), 2u);
    const PartHeading& heading = seq.nodes()[0].as<PartHeading>();
    EXPECT_EQ(heading.text, "PART IV: LEGAL FRAMEWORK");
    EXPECT_EQ(heading.ordinal, 4);
    EXPECT_EQ(seq.nodes()[1].as<Rule>().style, RuleStyle::PartDivider);
}

TEST_F(PrimitivesTest, HeadingLevels) {
    EXPECT_EQ(chapter_heading("Chapter 2").as<Heading>().level, 1);
    EXPECT_EQ(h2("2.1 Scope").as<Heading>().level, 2);
    EXPECT_EQ(h3("2.1.1 Detail").as<Heading>().level, 3);
    EXPECT_THROW(h2(""), AuthoringError);
}

// ============================================================================
// Code
// ============================================================================

TEST_F(PrimitivesTest, CodeBlockEmitsOneNodePerLine) {
    NodeSequence seq = code_block("fn main() {\n    run();\n}");
    ASSERT_EQ(seq.size(), 3u);
    EXPECT_EQ(seq.nodes()[1].as<CodeBlock>().lines[0], "    run();");
}

TEST_F(PrimitivesTest, CodeBlockKeepsBlankLinesAndTrailingNewline) {
    EXPECT_EQ(code_block("a\n\nb").size(), 3u);
    EXPECT_EQ(code_block("a\nb\n").size(), 3u);
    EXPECT_EQ(code_block("").size(), 1u);
}

TEST_F(PrimitivesTest, CodeBlockDropsCarriageReturns) {
    NodeSequence seq = code_block("one\r\ntwo\r\n");
    ASSERT_EQ(seq.size(), 3u);
    EXPECT_EQ(seq.nodes()[0].as<CodeBlock>().lines[0], "one");
    EXPECT_EQ(seq.nodes()[1].as<CodeBlock>().lines[0], "two");
}

// ============================================================================
// Tables
// ============================================================================

TEST_F(PrimitivesTest, TableIsFollowedBySpacer) {
    NodeSequence seq = table({"A", "B"}, {{"1", "2"}}, {3000, 6360});
    ASSERT_EQ(seq.size(), 2u);
    EXPECT_EQ(seq.nodes()[0].as<Table>().col_widths, (std::vector<int>{3000, 6360}));
    EXPECT_EQ(seq.nodes()[1].as<Spacer>().height, DEFAULT_SPACER_HEIGHT);
}

TEST_F(PrimitivesTest, TableShapeMismatchThrows) {
    EXPECT_THROW(table({"A", "B"}, {{"1", "2", "3"}}, {3000, 6360}), AuthoringError);
    EXPECT_THROW(table({"A", "B"}, {{"1", "2"}}, {9360}), AuthoringError);
}

TEST_F(PrimitivesTest, EvenWidthsFillContentWidth) {
    auto widths = even_widths(style_, 7);
    ASSERT_EQ(widths.size(), 7u);
    EXPECT_EQ(std::accumulate(widths.begin(), widths.end(), 0), style_.page_content_width);
    EXPECT_EQ(widths[0], 9360 / 7);
    EXPECT_EQ(widths[6], 9360 / 7 + 9360 % 7);
    EXPECT_TRUE(even_widths(style_, 0).empty());
}

TEST_F(PrimitivesTest, StyleTableUsesEvenWidths) {
    NodeSequence seq = table(style_, {"A", "B", "C"}, {{"1", "2", "3"}});
    EXPECT_EQ(seq.nodes()[0].as<Table>().total_width(), style_.page_content_width);
}

// ============================================================================
// Lists, rules and spacing
// ============================================================================

TEST_F(PrimitivesTest, BulletRuns) {
    ContentNode item = bullet_runs({bold("Term: "), "meaning"});
    EXPECT_EQ(item.as<BulletItem>().runs.size(), 2u);
    EXPECT_EQ(bullet_item("x").kind(), NodeKind::BulletItem);
}

TEST_F(PrimitivesTest, RulesAndSpacing) {
    EXPECT_EQ(rule().as<Rule>().style, RuleStyle::Accent);
    EXPECT_EQ(rule_light().as<Rule>().style, RuleStyle::Light);
    EXPECT_EQ(spacer().as<Spacer>().height, 200);
    EXPECT_EQ(spacer(480).as<Spacer>().height, 480);
    EXPECT_THROW(spacer(-10), AuthoringError);
    EXPECT_TRUE(page_break().is<PageBreak>());
}

TEST_F(PrimitivesTest, LabeledBlocks) {
    const LabeledBlock& d = definition("Definition 1.1.", "A receipt is...").as<LabeledBlock>();
    EXPECT_EQ(d.kind, LabeledKind::Definition);
    const LabeledBlock& t = theorem("Theorem 1.", "It holds.").as<LabeledBlock>();
    EXPECT_EQ(t.kind, LabeledKind::Theorem);
    EXPECT_EQ(t.label, "Theorem 1.");
}

}  // namespace test
}  // namespace folio
