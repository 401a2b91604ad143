#include <gtest/gtest.h>
#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"

using namespace glyphic;

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, OkResult) {
    Result<int, String> result = 42;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorResult) {
    Result<int, String> result = make_error(String("error message"));

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error(), "error message"_s);
}

TEST(ResultTest, VoidResult) {
    Result<void, String> ok;
    EXPECT_TRUE(ok.is_ok());

    Result<void, String> err = make_error(String("failed"));
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "failed"_s);
}

// ============================================================================
// Geometry Tests
// ============================================================================

TEST(PointTest, Scale) {
    PointF a{1.5f, 2.0f};
    PointF b{0.5f, 1.0f};

    EXPECT_EQ(a * 2.0f, (PointF{3.0f, 4.0f}));
    EXPECT_NE(a, b);
}

// ============================================================================
// Color Tests
// ============================================================================

TEST(ColorTest, Constants) {
    EXPECT_EQ(Color::black(), Color(0, 0, 0, 255));
    EXPECT_EQ(Color::white(), Color(255, 255, 255, 255));
    EXPECT_EQ(Color::transparent().a, 0);
}
