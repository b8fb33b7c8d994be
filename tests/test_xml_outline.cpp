#include <gtest/gtest.h>

#include "folio/outline.h"
#include "folio/primitives.h"
#include "folio/xml_writer.h"

namespace folio {
namespace test {

class XmlWriterTest : public ::testing::Test {};

// ============================================================================
// Escaping
// ============================================================================

TEST_F(XmlWriterTest, TextEscapesMarkupCharacters) {
    EXPECT_EQ(xml_escape("a < b && c > d"), "a &lt; b &amp;&amp; c &gt; d");
    EXPECT_EQ(xml_escape("\"quoted\" 'single'"), "\"quoted\" 'single'");
    EXPECT_EQ(xml_escape("tab\tline\n"), "tab\tline\n");
}

TEST_F(XmlWriterTest, AttributesEscapeQuotesAndWhitespace) {
    std::string out;
    append_xml_escaped(out, "say \"hi\" & 'bye'\t\n", true);
    EXPECT_EQ(out, "say &quot;hi&quot; &amp; &apos;bye&apos;&#x09;&#x0A;");
}

TEST_F(XmlWriterTest, UnicodePassesThrough) {
    EXPECT_EQ(xml_escape("\xE2\x80\xA2 bullet"), "\xE2\x80\xA2 bullet");
}

TEST_F(XmlWriterTest, WriterBuildsElements) {
    XmlWriter w;
    w.open("w:p");
    w.empty("w:pStyle", {{"w:val", "Heading1"}});
    w.element("w:t", "A & B", {{"xml:space", "preserve"}});
    w.close("w:p");
    const std::string xml = w.take();
    EXPECT_EQ(xml.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n", 0), 0u);
    EXPECT_NE(xml.find("<w:p><w:pStyle w:val=\"Heading1\"/>"
                       "<w:t xml:space=\"preserve\">A &amp; B</w:t></w:p>"),
              std::string::npos);
}

// ============================================================================
// XML 1.0 character checks
// ============================================================================

TEST_F(XmlWriterTest, SafeText) {
    EXPECT_TRUE(is_xml_safe(""));
    EXPECT_TRUE(is_xml_safe("plain\ttext\r\n"));
    EXPECT_TRUE(is_xml_safe("caf\xC3\xA9 \xE2\x86\x92 \xF0\x9F\x93\x84"));
}

TEST_F(XmlWriterTest, UnsafeText) {
    EXPECT_FALSE(is_xml_safe(std::string("nul\0byte", 8)));
    EXPECT_FALSE(is_xml_safe("bell\x07"));
    EXPECT_FALSE(is_xml_safe("\x1B[0m"));
    EXPECT_FALSE(is_xml_safe("\xC3"));              // truncated
    EXPECT_FALSE(is_xml_safe("\xC0\xAF"));          // overlong
    EXPECT_FALSE(is_xml_safe("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_xml_safe("\xEF\xBF\xBF"));      // U+FFFF
    EXPECT_FALSE(is_xml_safe("\xFF"));
}

// ============================================================================
// Outline
// ============================================================================

class OutlineTest : public ::testing::Test {};

TEST_F(OutlineTest, CollectsPartsChaptersAndSections) {
    std::vector<ContentNode> nodes;
    for (const auto& n : part_heading("Part I: Foundation")) nodes.push_back(n);
    nodes.push_back(chapter_heading("Chapter 1: Mission"));
    nodes.push_back(p("Text."));
    nodes.push_back(h2("1.1 Vision"));
    nodes.push_back(h3("1.1.1 Detail"));
    nodes.push_back(h2("1.2 Scope"));

    auto outline = build_outline(nodes);
    ASSERT_EQ(outline.size(), 4u);

    EXPECT_EQ(outline[0].node_index, 0u);
    EXPECT_EQ(outline[0].level, 1);
    EXPECT_EQ(outline[0].text, "PART I: FOUNDATION");
    EXPECT_EQ(outline[1].node_index, 2u);
    EXPECT_EQ(outline[1].level, 1);
    EXPECT_EQ(outline[2].level, 2);
    EXPECT_EQ(outline[2].text, "1.1 Vision");
    EXPECT_EQ(outline[3].node_index, 6u);

    for (size_t i = 0; i < outline.size(); ++i) {
        EXPECT_EQ(outline[i].bookmark_id, static_cast<int>(i + 1));
        EXPECT_EQ(outline[i].bookmark_name, "_toc_" + std::to_string(i + 1));
    }
}

TEST_F(OutlineTest, NoHeadingsNoEntries) {
    EXPECT_TRUE(build_outline({p("only text"), spacer()}).empty());
}

TEST_F(OutlineTest, BookmarkNames) {
    EXPECT_EQ(bookmark_safe_name("_ch0_", "00-executive-summary"), "_ch0_00_executive_summary");
    EXPECT_EQ(bookmark_safe_name("_ch1_", "caf\xC3\xA9"), "_ch1_caf__");

    std::string longest = bookmark_safe_name("_ch12_", std::string(80, 'x'));
    EXPECT_EQ(longest.size(), 40u);
    EXPECT_EQ(longest.substr(0, 6), "_ch12_");
}

}  // namespace test
}  // namespace folio
