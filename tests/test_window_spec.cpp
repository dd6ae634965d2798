#include "util/window_spec.hpp"

#include <gtest/gtest.h>

namespace gzinspect {
namespace {

TEST(WindowSpecTest, HeadOnly) {
    const WindowSpec w = ParseWindowSpec("3");
    EXPECT_EQ(w.head, 3U);
    EXPECT_FALSE(w.tail.has_value());
}

TEST(WindowSpecTest, HeadAndTail) {
    const WindowSpec w = ParseWindowSpec("2:4");
    EXPECT_EQ(w.head, 2U);
    ASSERT_TRUE(w.tail.has_value());
    EXPECT_EQ(*w.tail, 4U);
}

TEST(WindowSpecTest, BadHeadFallsBackToDefault) {
    EXPECT_EQ(ParseWindowSpec("abc").head, kDefaultWindowHead);
    EXPECT_EQ(ParseWindowSpec("").head, kDefaultWindowHead);
    EXPECT_EQ(ParseWindowSpec("-1").head, kDefaultWindowHead);

    const WindowSpec w = ParseWindowSpec("x:2");
    EXPECT_EQ(w.head, kDefaultWindowHead);
    ASSERT_TRUE(w.tail.has_value());
    EXPECT_EQ(*w.tail, 2U);
}

TEST(WindowSpecTest, BadTailIsUnset) {
    const WindowSpec w = ParseWindowSpec("1:zz");
    EXPECT_EQ(w.head, 1U);
    EXPECT_FALSE(w.tail.has_value());
    EXPECT_FALSE(ParseWindowSpec("1:").tail.has_value());
}

TEST(WindowSpecTest, ExtraFieldsAreIgnored) {
    const WindowSpec w = ParseWindowSpec("1:2:3");
    EXPECT_EQ(w.head, 1U);
    ASSERT_TRUE(w.tail.has_value());
    EXPECT_EQ(*w.tail, 2U);
}

} // namespace
} // namespace gzinspect
