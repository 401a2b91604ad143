#include <gtest/gtest.h>
#include "glyphic/text/line_breaker.hpp"

using namespace glyphic;
using namespace glyphic::text;

namespace {

// Every code point is 10 units wide
f32 fixed_measure(const String& text) {
    return static_cast<f32>(text.code_points().size()) * 10.0f;
}

std::vector<String> collect_words(const std::vector<String>& lines) {
    std::vector<String> words;
    for (const auto& line : lines) {
        for (auto& word : line.split_whitespace()) {
            words.push_back(std::move(word));
        }
    }
    return words;
}

} // namespace

// ============================================================================
// Basic Wrapping
// ============================================================================

TEST(LineBreakerTest, FitsOnOneLine) {
    auto lines = wrap({"hello world"_s}, fixed_measure, 598.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "hello world"_s);
}

TEST(LineBreakerTest, BreaksAtWordBoundary) {
    // "aaa bbb" measures exactly 70; adding "ccc" overflows
    auto lines = wrap({"aaa bbb ccc"_s}, fixed_measure, 70.0f);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "aaa bbb"_s);
    EXPECT_EQ(lines[1], "ccc"_s);
}

TEST(LineBreakerTest, ExactFitIsAccepted) {
    auto lines = wrap({"ab cd"_s}, fixed_measure, 50.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "ab cd"_s);
}

TEST(LineBreakerTest, LinesAreWrappedIndependently) {
    auto lines = wrap({"one"_s, "two"_s}, fixed_measure, 598.0f);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one"_s);
    EXPECT_EQ(lines[1], "two"_s);
}

TEST(LineBreakerTest, BlankLinesAreSkipped) {
    auto lines = wrap({""_s, "   "_s, "text"_s, "\t"_s}, fixed_measure, 598.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "text"_s);
}

TEST(LineBreakerTest, EmptyInputGivesNoLines) {
    EXPECT_TRUE(wrap({}, fixed_measure, 598.0f).empty());
    EXPECT_TRUE(wrap({""_s, ""_s, ""_s}, fixed_measure, 598.0f).empty());
}

// ============================================================================
// Over-wide Words
// ============================================================================

TEST(LineBreakerTest, OverWideWordIsEmittedWhole) {
    String word("supercalifragilistic");
    auto lines = wrap({word}, fixed_measure, 50.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], word);
    EXPECT_GT(fixed_measure(lines[0]), 50.0f);
}

TEST(LineBreakerTest, OverWideWordAfterShortWord) {
    auto lines = wrap({"ab abcdefghij cd"_s}, fixed_measure, 50.0f);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "ab"_s);
    EXPECT_EQ(lines[1], "abcdefghij"_s);
    EXPECT_EQ(lines[2], "cd"_s);
}

// ============================================================================
// Space Handling
// ============================================================================

TEST(LineBreakerTest, ConsecutiveSpacesArePreserved) {
    auto lines = wrap({"a  b"_s}, fixed_measure, 598.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "a  b"_s);
}

TEST(LineBreakerTest, LeadingSpaceStartsWithEmptyWord) {
    // The empty first word leaves the candidate empty
    auto lines = wrap({" hi"_s}, fixed_measure, 598.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "hi"_s);
}

TEST(LineBreakerTest, EmptyWordAtBreakIsAbsorbed) {
    // "aaaa" fits and "aaaa " does not, so the empty word starts the next
    // candidate, which the following word then replaces
    auto lines = wrap({"aaaa  bb"_s}, fixed_measure, 40.0f);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "aaaa"_s);
    EXPECT_EQ(lines[1], "bb"_s);
}

// ============================================================================
// Properties
// ============================================================================

TEST(LineBreakerTest, WidthBoundHoldsExceptSingleWords) {
    std::vector<String> raw = {
        "The quick brown fox jumps over the lazy dog and keeps running"_s,
        "a b c d e f g h i j k l m n o p q r s t u v w x y z"_s,
        "short"_s,
        "incomprehensibilities are long words"_s,
    };
    const f32 max_width = 120.0f;

    for (const auto& line : wrap(raw, fixed_measure, max_width)) {
        if (line.split_whitespace().size() > 1) {
            EXPECT_LE(fixed_measure(line), max_width) << line.c_str();
        }
    }
}

TEST(LineBreakerTest, WrapKeepsEveryWordInOrder) {
    std::vector<String> raw = {
        "The quick brown fox jumps over the lazy dog"_s,
        ""_s,
        "  Pack my box   with five dozen liquor jugs  "_s,
    };

    auto lines = wrap(raw, fixed_measure, 90.0f);
    EXPECT_EQ(collect_words(lines), collect_words(raw));
}

TEST(LineBreakerTest, ClassFormMatchesFreeFunction) {
    LineBreaker breaker(fixed_measure);
    std::vector<String> raw = {"one two three four five six"_s};
    EXPECT_EQ(breaker.wrap(raw, 100.0f), wrap(raw, fixed_measure, 100.0f));

    std::vector<String> out;
    breaker.wrap_line("   "_s, 100.0f, out);
    EXPECT_TRUE(out.empty());
}
