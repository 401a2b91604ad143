#include <gtest/gtest.h>
#include "glyphic/layout/text_layout.hpp"

using namespace glyphic;
using namespace glyphic::layout;

namespace {

f32 fixed_measure(const String& text) {
    return static_cast<f32>(text.code_points().size()) * 10.0f;
}

} // namespace

// ============================================================================
// Document Tests
// ============================================================================

TEST(DocumentTest, SplitsOnEveryLineBreakForm) {
    auto doc = Document::from_text("one\ntwo\r\nthree\rfour"_s);
    ASSERT_EQ(doc.lines().size(), 4u);
    EXPECT_EQ(doc.lines()[0], "one"_s);
    EXPECT_EQ(doc.lines()[1], "two"_s);
    EXPECT_EQ(doc.lines()[2], "three"_s);
    EXPECT_EQ(doc.lines()[3], "four"_s);
}

TEST(DocumentTest, DropsBlankLines) {
    auto doc = Document::from_text("\n  \nhello\n\t\n"_s);
    ASSERT_EQ(doc.lines().size(), 1u);
    EXPECT_EQ(doc.lines()[0], "hello"_s);
}

TEST(DocumentTest, OnlyNewlinesIsEmpty) {
    EXPECT_TRUE(Document::from_text("\n\n\n"_s).is_empty());
    EXPECT_TRUE(Document::from_text(""_s).is_empty());
    EXPECT_TRUE(Document().is_empty());
}

TEST(DocumentTest, NonAsciiSpaceLinesAreBlank) {
    // No-break space, ideographic space, line separator
    EXPECT_TRUE(Document::from_text("\xC2\xA0\n\xE3\x80\x80\n \xE2\x80\xA8 "_s).is_empty());

    auto doc = Document::from_text("\xC2\xA0\nword"_s);
    ASSERT_EQ(doc.lines().size(), 1u);
    EXPECT_EQ(doc.lines()[0], "word"_s);
}

TEST(DocumentTest, KeepsInnerSpacing) {
    auto doc = Document::from_text("  indented  text "_s);
    ASSERT_EQ(doc.lines().size(), 1u);
    EXPECT_EQ(doc.lines()[0], "  indented  text "_s);
}

// ============================================================================
// Layout Tests
// ============================================================================

TEST(LayoutConfigTest, Defaults) {
    LayoutConfig config;
    EXPECT_FLOAT_EQ(config.fixed_width, 600.0f);
    EXPECT_FLOAT_EQ(config.padding, 1.0f);
    EXPECT_FLOAT_EQ(config.available_width(), 598.0f);
}

TEST(TextLayoutTest, LineHeightFollowsFontSize) {
    StyleDescriptor style;
    style.font_size = 20;

    auto result = layout_document(Document::from_text("hello"_s), style, fixed_measure);
    EXPECT_FLOAT_EQ(result.font_size, 20.0f);
    EXPECT_FLOAT_EQ(result.line_height, 30.0f);
    ASSERT_EQ(result.lines.size(), 1u);
    EXPECT_FLOAT_EQ(result.text_height(), 20.0f);
}

TEST(TextLayoutTest, HeightFormula) {
    for (i32 size : {8, 11, 16, 33, 72}) {
        for (usize count : {1u, 2u, 5u, 17u}) {
            LayoutResult result;
            result.font_size = static_cast<f32>(size);
            result.line_height = 1.5f * static_cast<f32>(size);
            result.lines.assign(count, "x"_s);

            f32 expected = static_cast<f32>(count) * 1.5f * static_cast<f32>(size) - 0.5f * static_cast<f32>(size);
            EXPECT_NEAR(result.text_height(), expected, 0.001f);
        }
    }
}

TEST(TextLayoutTest, SurfaceSizeAddsPadding) {
    StyleDescriptor style;
    auto result = layout_document(Document::from_text("one\ntwo"_s), style, fixed_measure);
    ASSERT_EQ(result.lines.size(), 2u);

    // 2 * 16.5 - 5.5 = 27.5
    SizeF size = result.surface_size(LayoutConfig{});
    EXPECT_FLOAT_EQ(size.width, 600.0f);
    EXPECT_FLOAT_EQ(size.height, 29.5f);
}

TEST(TextLayoutTest, WrapsToAvailableWidth) {
    LayoutConfig config;
    config.fixed_width = 102.0f;  // 100 available

    auto result = layout_document(
        Document::from_text("aaaa bbbb cccc"_s), StyleDescriptor{}, fixed_measure, config);
    ASSERT_EQ(result.lines.size(), 2u);
    EXPECT_EQ(result.lines[0], "aaaa bbbb"_s);
    EXPECT_EQ(result.lines[1], "cccc"_s);
}

TEST(TextLayoutTest, EmptyDocumentHasNoHeight) {
    auto result = layout_document(Document::from_text("\n\n\n"_s), StyleDescriptor{}, fixed_measure);
    EXPECT_TRUE(result.empty());
    EXPECT_FLOAT_EQ(result.text_height(), 0.0f);
}
