#include <gtest/gtest.h>
#include "test_helpers.h"

#include "folio/errors.h"
#include "folio/pipeline.h"
#include "folio/primitives.h"
#include "folio/zip_archive.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

namespace folio {
namespace test {

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = scratch_dir();
        std::error_code ec;
        fs::remove_all(dir_, ec);
        fs::create_directories(dir_);
        info_.title = "Pipeline Test";
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static size_t file_count(const fs::path& dir) {
        return static_cast<size_t>(std::distance(fs::directory_iterator(dir),
                                                 fs::directory_iterator()));
    }

    static std::vector<uint8_t> read_bytes(const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(f),
                                    std::istreambuf_iterator<char>());
    }

    // Three chapters; B's single table carries the given widths.
    static Manifest abc_manifest(std::vector<int> b_widths) {
        return {
            {"A", [](const StyleConstants&) -> ChapterOutput {
                 return {chapter_heading("Chapter A"), p("First.")};
             }},
            {"B", [b_widths](const StyleConstants&) -> ChapterOutput {
                 return {chapter_heading("Chapter B"),
                         table({"Left", "Right"}, {{"l", "r"}}, b_widths)};
             }},
            {"C", [](const StyleConstants&) -> ChapterOutput {
                 return {part_heading("Part II: Later"), chapter_heading("Chapter C")};
             }},
        };
    }

    // left + right margins of 3240 leave 9000 layout units of content.
    static StyleSettings narrow_settings() {
        StyleSettings s;
        s.margins.left = 1620;
        s.margins.right = 1620;
        return s;
    }

    fs::path     dir_;
    DocumentInfo info_;
};

// ============================================================================
// Successful builds
// ============================================================================

TEST_F(PipelineTest, WritesAndVerifiesDocument) {
    const StyleConstants style(narrow_settings());
    const fs::path out = dir_ / "out" / "spec.docx";

    BuildSummary summary = run_pipeline(abc_manifest({5000, 4000}), style, info_, out.string());

    ASSERT_TRUE(fs::exists(out));
    EXPECT_EQ(summary.chapter_count, 3u);
    EXPECT_EQ(summary.inserted_page_breaks, 1u);
    EXPECT_EQ(summary.bytes_written, fs::file_size(out));
    EXPECT_EQ(summary.verify.entry_count, docx_part_names().size());
    EXPECT_TRUE(summary.warnings.empty());
    EXPECT_EQ(file_count(out.parent_path()), 1u);

    VerifyReport report;
    std::string error;
    EXPECT_TRUE(verify_docx(out.string(), report, error)) << error;
}

TEST_F(PipelineTest, ChaptersLandInManifestOrder) {
    const StyleConstants style(narrow_settings());
    AssembledDocument assembled;
    std::vector<uint8_t> bytes = build_document(abc_manifest({5000, 4000}), style, info_, assembled);

    ASSERT_EQ(assembled.chapters.size(), 3u);
    EXPECT_EQ(assembled.chapters[0].id, "A");
    EXPECT_EQ(assembled.chapters[1].id, "B");
    EXPECT_EQ(assembled.chapters[2].id, "C");

    std::vector<ZipEntry> entries;
    std::string error;
    ASSERT_TRUE(read_zip_archive(bytes, entries, error)) << error;
    const std::string xml(entries[4].data.begin(), entries[4].data.end());
    const size_t a = xml.find("w:name=\"_ch0_A\"");
    const size_t b = xml.find("w:name=\"_ch1_B\"");
    const size_t c = xml.find("w:name=\"_ch2_C\"");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(b, std::string::npos);
    ASSERT_NE(c, std::string::npos);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
}

TEST_F(PipelineTest, RebuildIsByteIdentical) {
    const StyleConstants style;
    const Manifest manifest = abc_manifest({4680, 4680});

    AssembledDocument first_doc, second_doc;
    std::vector<uint8_t> first = build_document(manifest, style, info_, first_doc);
    std::vector<uint8_t> second = build_document(manifest, style, info_, second_doc);
    EXPECT_EQ(first, second);

    const fs::path a = dir_ / "a.docx";
    const fs::path b = dir_ / "b.docx";
    run_pipeline(manifest, style, info_, a.string());
    run_pipeline(manifest, style, info_, b.string());
    EXPECT_EQ(read_bytes(a), read_bytes(b));
    EXPECT_EQ(read_bytes(a), first);
}

TEST_F(PipelineTest, StyleIsUnchangedByARun) {
    const StyleConstants style(narrow_settings());
    const StyleConstants snapshot = style;
    run_pipeline(abc_manifest({5000, 4000}), style, info_, (dir_ / "x.docx").string());
    EXPECT_EQ(style, snapshot);
}

// ============================================================================
// Fail fast: no artifact on error
// ============================================================================

TEST_F(PipelineTest, OversizedTableAbortsWithoutArtifact) {
    const StyleConstants style(narrow_settings());
    const fs::path out = dir_ / "spec.docx";

    try {
        run_pipeline(abc_manifest({5000, 5000}), style, info_, out.string());
        FAIL() << "expected AuthoringError";
    } catch (const AuthoringError& e) {
        EXPECT_EQ(e.location().chapter_id, "B");
        EXPECT_EQ(e.location().manifest_index, 1u);
        EXPECT_EQ(e.location().node_kind, "Table");
    }
    EXPECT_FALSE(fs::exists(out));
    EXPECT_EQ(file_count(dir_), 0u);
}

TEST_F(PipelineTest, BuilderFailureAbortsWithoutArtifact) {
    Manifest manifest = abc_manifest({4680, 4680});
    manifest.push_back({"D", [](const StyleConstants&) -> ChapterOutput {
        throw std::logic_error("not written yet");
    }});
    const fs::path out = dir_ / "spec.docx";

    EXPECT_THROW(run_pipeline(manifest, StyleConstants(), info_, out.string()), AssemblyError);
    EXPECT_EQ(file_count(dir_), 0u);
}

TEST_F(PipelineTest, SerializationFailureAbortsWithoutArtifact) {
    info_.title = std::string("bad\x01title");
    const fs::path out = dir_ / "spec.docx";

    EXPECT_THROW(run_pipeline(abc_manifest({4680, 4680}), StyleConstants(), info_, out.string()),
                 SerializationError);
    EXPECT_EQ(file_count(dir_), 0u);
}

TEST_F(PipelineTest, FailedBuildKeepsPreviousOutput) {
    const fs::path out = dir_ / "spec.docx";
    write_text_file(out, "previous");

    EXPECT_THROW(run_pipeline(abc_manifest({9000, 9000}), StyleConstants(), info_, out.string()),
                 AuthoringError);
    std::vector<uint8_t> kept = read_bytes(out);
    EXPECT_EQ(std::string(kept.begin(), kept.end()), "previous");
    EXPECT_EQ(file_count(dir_), 1u);
}

// ============================================================================
// Artifact writer
// ============================================================================

TEST_F(PipelineTest, WriterLeavesNoTempFile) {
    const fs::path out = dir_ / "nested" / "doc.bin";
    {
        ArtifactWriter writer(out.string());
        EXPECT_NE(writer.tempPath(), writer.outputPath());
        ASSERT_TRUE(writer.write({1, 2, 3})) << writer.getLastError();
        EXPECT_FALSE(fs::exists(writer.tempPath()));
    }
    EXPECT_EQ(read_bytes(out), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(file_count(out.parent_path()), 1u);
}

TEST_F(PipelineTest, VerifyRejectsNonDocx) {
    const fs::path path = dir_ / "plain.docx";
    write_text_file(path, "not a zip archive at all, just some text");
    VerifyReport report;
    std::string error;
    EXPECT_FALSE(verify_docx(path.string(), report, error));
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(verify_docx((dir_ / "missing.docx").string(), report, error));
}

}  // namespace test
}  // namespace folio
