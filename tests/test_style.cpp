#include <gtest/gtest.h>

#include "folio/style.h"

#include <stdexcept>
#include <type_traits>

namespace folio {
namespace test {

// ============================================================================
// Immutability is structural
// ============================================================================

static_assert(!std::is_copy_assignable<StyleConstants>::value,
              "StyleConstants must not be copy-assignable");
static_assert(!std::is_move_assignable<StyleConstants>::value,
              "StyleConstants must not be move-assignable");
static_assert(std::is_copy_constructible<StyleConstants>::value,
              "a snapshot copy must be possible");
static_assert(std::is_const<decltype(StyleConstants::body_font)>::value,
              "members are const");
static_assert(std::is_const<decltype(StyleConstants::page_content_width)>::value,
              "members are const");

class StyleTest : public ::testing::Test {};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(StyleTest, DefaultsMatchHouseStyle) {
    const StyleConstants style;
    EXPECT_EQ(style.body_font, "Garamond");
    EXPECT_EQ(style.body_size, 23);
    EXPECT_EQ(style.code_font, "Courier New");
    EXPECT_EQ(style.code_size, 17);
    EXPECT_EQ(style.dark_color, "2B2B2B");
    EXPECT_EQ(style.accent_color, "B8965A");
    EXPECT_EQ(style.page_width, 12240);
    EXPECT_EQ(style.page_height, 15840);
    EXPECT_EQ(style.margins, Margins());
    EXPECT_EQ(DEFAULT_SPACER_HEIGHT, 200);
}

TEST_F(StyleTest, ContentWidthIsPageMinusSideMargins) {
    EXPECT_EQ(StyleConstants().page_content_width, 9360);

    StyleSettings s;
    s.margins.left = 1620;
    s.margins.right = 1620;
    EXPECT_EQ(StyleConstants(s).page_content_width, 9000);
}

TEST_F(StyleTest, RejectsMarginsThatLeaveNoContent) {
    StyleSettings s;
    s.margins.left = 6120;
    s.margins.right = 6120;
    EXPECT_THROW(StyleConstants{s}, std::invalid_argument);
}

TEST_F(StyleTest, RejectsNonPositiveSizes) {
    StyleSettings s;
    s.body_size = 0;
    EXPECT_THROW(StyleConstants{s}, std::invalid_argument);

    StyleSettings t;
    t.page_height = -1;
    EXPECT_THROW(StyleConstants{t}, std::invalid_argument);
}

TEST_F(StyleTest, SettingsRebuildEqualValue) {
    StyleSettings s;
    s.body_font = "Georgia";
    s.accent_color = "C5A572";
    s.margins.top = 1080;
    const StyleConstants original(s);
    const StyleConstants rebuilt(original.settings());
    EXPECT_EQ(original, rebuilt);
    EXPECT_NE(original, StyleConstants());
}

TEST_F(StyleTest, CopyIsEqualSnapshot) {
    const StyleConstants style;
    const StyleConstants snapshot = style;
    EXPECT_EQ(style, snapshot);
}

}  // namespace test
}  // namespace folio
