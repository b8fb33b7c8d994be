#include <gtest/gtest.h>

#include "chapters/manifest.h"
#include "folio/assembler.h"
#include "folio/docx_serializer.h"

#include <set>

namespace folio {
namespace test {

class ChaptersTest : public ::testing::Test {
protected:
    const StyleConstants style_;
};

TEST_F(ChaptersTest, ManifestIdsAreUnique) {
    const Manifest& manifest = chapters::manifest();
    ASSERT_FALSE(manifest.empty());
    std::set<std::string> ids;
    for (const auto& module : manifest) {
        EXPECT_TRUE(ids.insert(module.id).second) << module.id;
        EXPECT_TRUE(static_cast<bool>(module.build)) << module.id;
    }
}

TEST_F(ChaptersTest, ManifestAssemblesCleanly) {
    AssembledDocument doc = assemble(chapters::manifest(), style_);
    EXPECT_EQ(doc.chapters.size(), chapters::manifest().size());
    for (const auto& w : doc.warnings) {
        ADD_FAILURE() << w.chapter_id << ": " << w.message;
    }
    for (const auto& span : doc.chapters) {
        EXPECT_GT(span.count, 0u) << span.id;
    }
}

TEST_F(ChaptersTest, PartHeadingsStartNewPages) {
    AssembledDocument doc = assemble(chapters::manifest(), style_);
    size_t parts = 0;
    for (size_t i = 0; i < doc.nodes.size(); ++i) {
        if (!doc.nodes[i].is<PartHeading>()) continue;
        ++parts;
        if (i > 0) {
            EXPECT_TRUE(doc.nodes[i - 1].is<PageBreak>()) << "node " << i;
        }
    }
    EXPECT_GT(parts, 0u);
}

TEST_F(ChaptersTest, ManifestSerializes) {
    AssembledDocument assembled = assemble(chapters::manifest(), style_);
    Document doc;
    doc.info.title = "SEZ Stack";
    doc.nodes = assembled.nodes;
    doc.chapters = assembled.chapters;
    EXPECT_FALSE(serialize(doc, style_).empty());
}

}  // namespace test
}  // namespace folio
