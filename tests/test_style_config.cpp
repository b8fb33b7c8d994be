#include <gtest/gtest.h>
#include "test_helpers.h"

#include "folio/style_config.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace folio {
namespace test {

class StyleConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = scratch_dir();
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string file(const std::string& text) {
        return write_text_file(dir_ / "house.style", text);
    }

    fs::path dir_;
};

// ============================================================================
// Single settings
// ============================================================================

TEST_F(StyleConfigTest, AppliesKnownKeys) {
    StyleSettings s;
    std::string error;
    EXPECT_TRUE(apply_style_setting(s, "body_font", "Georgia", error));
    EXPECT_TRUE(apply_style_setting(s, "code_size", "18", error));
    EXPECT_TRUE(apply_style_setting(s, "h2_color", "335577", error));
    EXPECT_TRUE(apply_style_setting(s, "margin_left", "1080", error));
    EXPECT_EQ(s.body_font, "Georgia");
    EXPECT_EQ(s.code_size, 18);
    EXPECT_EQ(s.h2_color, "335577");
    EXPECT_EQ(s.margins.left, 1080);
}

TEST_F(StyleConfigTest, RejectsBadValues) {
    StyleSettings s;
    std::string error;
    EXPECT_FALSE(apply_style_setting(s, "paper", "A4", error));
    EXPECT_NE(error.find("unknown style key"), std::string::npos);

    EXPECT_FALSE(apply_style_setting(s, "accent_color", "#B8965A", error));
    EXPECT_FALSE(apply_style_setting(s, "accent_color", "B8965", error));
    EXPECT_FALSE(apply_style_setting(s, "body_size", "12pt", error));
    EXPECT_FALSE(apply_style_setting(s, "body_font", "", error));
    EXPECT_EQ(s.accent_color, StyleSettings().accent_color);
}

TEST_F(StyleConfigTest, HexColor) {
    EXPECT_TRUE(is_hex_color("1b2a4a"));
    EXPECT_TRUE(is_hex_color("FFFFFF"));
    EXPECT_FALSE(is_hex_color("GGGGGG"));
    EXPECT_FALSE(is_hex_color("FFF"));
}

TEST_F(StyleConfigTest, EveryListedKeyIsAccepted) {
    for (const auto& key : style_setting_keys()) {
        StyleSettings s;
        std::string error;
        std::string value = key.find("color") != std::string::npos ||
                            key.find("background") != std::string::npos ||
                            key.find("text") != std::string::npos ||
                            key.find("alt_row") != std::string::npos ||
                            key == "accent_secondary"
                                ? "123456"
                                : (key.find("font") != std::string::npos ? "Georgia" : "100");
        EXPECT_TRUE(apply_style_setting(s, key, value, error)) << key << ": " << error;
    }
}

// ============================================================================
// Files
// ============================================================================

TEST_F(StyleConfigTest, LoadsFileWithCommentsAndBlankLines) {
    std::string path = file(
        "# house style\n"
        "\n"
        "body_font = Georgia   # serif\n"
        "body_size=22\n"
        "  accent_color = C5A572\r\n"
        "margin_left = 1620\n"
        "margin_right = 1620\n");

    StyleSettings s;
    std::string error;
    ASSERT_TRUE(load_style_overrides(path, s, error)) << error;
    EXPECT_EQ(s.body_font, "Georgia");
    EXPECT_EQ(s.body_size, 22);
    EXPECT_EQ(s.accent_color, "C5A572");
    EXPECT_EQ(StyleConstants(s).page_content_width, 9000);
}

TEST_F(StyleConfigTest, ReportsLineNumberAndLeavesSettingsUntouched) {
    std::string path = file(
        "body_font = Georgia\n"
        "# fine\n"
        "accent_color = gold\n");

    StyleSettings s;
    std::string error;
    EXPECT_FALSE(load_style_overrides(path, s, error));
    EXPECT_NE(error.find("house.style:3:"), std::string::npos) << error;
    EXPECT_EQ(s.body_font, "Garamond");
}

TEST_F(StyleConfigTest, RejectsMarginsLeavingNoContentWidth) {
    std::string path = file(
        "margin_left = 6000\n"
        "body_size = 22\n"
        "margin_right = 6240\n"
        "# done\n");

    StyleSettings s;
    std::string error;
    EXPECT_FALSE(load_style_overrides(path, s, error));
    EXPECT_NE(error.find("house.style:3:"), std::string::npos) << error;
    EXPECT_EQ(s.margins, Margins());
}

TEST_F(StyleConfigTest, RejectsLineWithoutEquals) {
    std::string path = file("body_font Georgia\n");
    StyleSettings s;
    std::string error;
    EXPECT_FALSE(load_style_overrides(path, s, error));
    EXPECT_NE(error.find(":1:"), std::string::npos);
}

TEST_F(StyleConfigTest, MissingFile) {
    StyleSettings s;
    std::string error;
    EXPECT_FALSE(load_style_overrides((dir_ / "absent.style").string(), s, error));
    EXPECT_FALSE(error.empty());
}

}  // namespace test
}  // namespace folio
