#include <gtest/gtest.h>

#include "folio/content_node.h"
#include "folio/errors.h"

namespace folio {
namespace test {

class ContentNodeTest : public ::testing::Test {
protected:
    static Table make_table(std::vector<int> widths) {
        Table t;
        t.header_row = {"Layer", "Role"};
        t.body_rows = {{"L1", "Settlement"}, {"L2", "Execution"}};
        t.col_widths = std::move(widths);
        return t;
    }
};

// ============================================================================
// Construction-time validation
// ============================================================================

TEST_F(ContentNodeTest, HeadingLevelOutsideRangeIsRejected) {
    EXPECT_THROW(ContentNode(Heading{0, "Zero"}), AuthoringError);
    EXPECT_THROW(ContentNode(Heading{4, "Four"}), AuthoringError);
    EXPECT_NO_THROW(ContentNode(Heading{3, "Three"}));
}

TEST_F(ContentNodeTest, BlankHeadingTextIsRejected) {
    try {
        ContentNode node(Heading{2, "   "});
        FAIL() << "expected AuthoringError";
    } catch (const AuthoringError& e) {
        EXPECT_EQ(e.location().node_kind, "Heading");
        EXPECT_FALSE(e.location().manifest_index.has_value());
        EXPECT_NE(std::string(e.what()).find("heading text is empty"), std::string::npos);
    }
}

TEST_F(ContentNodeTest, TableWidthCountMustMatchHeader) {
    EXPECT_THROW(ContentNode(make_table({4680})), AuthoringError);
    EXPECT_NO_THROW(ContentNode(make_table({4680, 4680})));
}

TEST_F(ContentNodeTest, TableRowsMustMatchHeader) {
    Table t = make_table({4680, 4680});
    t.body_rows.push_back({"L3 only"});
    try {
        ContentNode node(t);
        FAIL() << "expected AuthoringError";
    } catch (const AuthoringError& e) {
        EXPECT_EQ(e.location().node_kind, "Table");
        EXPECT_NE(e.invariant().find("row 2 has 1 cells"), std::string::npos) << e.invariant();
    }
}

TEST_F(ContentNodeTest, TableRejectsNonPositiveWidth) {
    EXPECT_THROW(ContentNode(make_table({9360, 0})), AuthoringError);
    EXPECT_THROW(ContentNode(make_table({9460, -100})), AuthoringError);
}

TEST_F(ContentNodeTest, TableWithoutColumnsIsRejected) {
    EXPECT_THROW(ContentNode(Table{}), AuthoringError);
}

TEST_F(ContentNodeTest, TableTotalWidth) {
    EXPECT_EQ(make_table({2400, 6960}).total_width(), 9360);
}

TEST_F(ContentNodeTest, OtherPayloadChecks) {
    EXPECT_THROW(ContentNode(CodeBlock{}), AuthoringError);
    EXPECT_THROW(ContentNode(Spacer{-1}), AuthoringError);
    EXPECT_THROW(ContentNode(BulletItem{}), AuthoringError);
    EXPECT_THROW(ContentNode(LabeledBlock{LabeledKind::Definition, "", "body"}), AuthoringError);
    EXPECT_THROW(ContentNode(LabeledBlock{LabeledKind::Theorem, "Theorem 1.", " "}), AuthoringError);
    EXPECT_THROW(ContentNode(PartHeading{"", std::nullopt}), AuthoringError);
    EXPECT_NO_THROW(ContentNode(Spacer{0}));
}

TEST_F(ContentNodeTest, KindMatchesPayload) {
    ContentNode node(Rule{RuleStyle::Light});
    EXPECT_EQ(node.kind(), NodeKind::Rule);
    EXPECT_STREQ(node.kindName(), "Rule");
    EXPECT_TRUE(node.is<Rule>());
    EXPECT_EQ(node.as<Rule>().style, RuleStyle::Light);
    EXPECT_EQ(node.getIf<Table>(), nullptr);
}

// ============================================================================
// Part ordinals
// ============================================================================

TEST_F(ContentNodeTest, PartOrdinals) {
    EXPECT_EQ(parse_part_ordinal("PART I: FOUNDATION"), 1);
    EXPECT_EQ(parse_part_ordinal("PART IV: LEGAL"), 4);
    EXPECT_EQ(parse_part_ordinal("PART XVII: OPERATIONS"), 17);
    EXPECT_EQ(parse_part_ordinal("Part xiv: lower case"), 14);
    EXPECT_EQ(parse_part_ordinal("PART IX"), 9);
}

TEST_F(ContentNodeTest, TextsWithoutOrdinal) {
    EXPECT_FALSE(parse_part_ordinal("APPENDICES").has_value());
    EXPECT_FALSE(parse_part_ordinal("PART INTRODUCTION").has_value());
    EXPECT_FALSE(parse_part_ordinal("PARTS I: X").has_value());
    EXPECT_FALSE(parse_part_ordinal("PART").has_value());
    EXPECT_FALSE(parse_part_ordinal("").has_value());
    EXPECT_FALSE(parse_part_ordinal("PART IIII: FOUR").has_value());
    EXPECT_FALSE(parse_part_ordinal("PART VX: FIVE").has_value());
    EXPECT_FALSE(parse_part_ordinal("PART IC").has_value());
}

// ============================================================================
// Normalization
// ============================================================================

TEST_F(ContentNodeTest, BareNodeBecomesSingleElementList) {
    ChapterOutput out(ContentNode(Heading{1, "Chapter 1"}));
    auto flat = normalize(out);
    ASSERT_EQ(flat.size(), 1u);
    EXPECT_TRUE(flat[0].is<Heading>());
}

TEST_F(ContentNodeTest, SequencesSpliceInPlace) {
    NodeSequence seq{ContentNode(CodeBlock{{"a"}}), ContentNode(CodeBlock{{"b"}})};
    ChapterOutput out{
        ContentNode(Heading{1, "Chapter 1"}),
        seq,
        ContentNode(Spacer{100}),
        NodeSequence{},
    };
    auto flat = normalize(out);
    ASSERT_EQ(flat.size(), 4u);
    EXPECT_TRUE(flat[0].is<Heading>());
    EXPECT_EQ(flat[1].as<CodeBlock>().lines[0], "a");
    EXPECT_EQ(flat[2].as<CodeBlock>().lines[0], "b");
    EXPECT_TRUE(flat[3].is<Spacer>());
}

TEST_F(ContentNodeTest, EmptyListNormalizesToNothing) {
    ChapterOutput out(std::vector<Fragment>{});
    EXPECT_TRUE(normalize(out).empty());
}

}  // namespace test
}  // namespace folio
