#include <gtest/gtest.h>
#include "output_compare.h"

namespace gradebox {
namespace {

TEST(OutputComparatorTest, DefaultModeIgnoresTrailingNewline) {
    // Given: The default comparator
    OutputComparator comparator;

    // When/Then: A print() newline does not fail the comparison
    EXPECT_EQ(comparator.mode(), CompareMode::TRAILING_WHITESPACE);
    EXPECT_TRUE(comparator.matches("Hello, Ada!\n", "Hello, Ada!"));
    EXPECT_TRUE(comparator.matches("Hello, Ada!", "Hello, Ada!\n\n"));
}

TEST(OutputComparatorTest, DefaultModeNormalizesCrlfAndLineEndSpaces) {
    OutputComparator comparator;

    EXPECT_TRUE(comparator.matches("1 2 3   \r\n4 5 6\r\n", "1 2 3\n4 5 6"));
    EXPECT_TRUE(comparator.matches("a\t\nb", "a\nb"));
}

TEST(OutputComparatorTest, DefaultModeKeepsLeadingAndInnerWhitespace) {
    OutputComparator comparator;

    // Indentation and blank lines between content are significant
    EXPECT_FALSE(comparator.matches("  x", "x"));
    EXPECT_FALSE(comparator.matches("a\n\nb", "a\nb"));
    EXPECT_FALSE(comparator.matches("a  b", "a b"));
}

TEST(OutputComparatorTest, DefaultModeIsCaseSensitive) {
    OutputComparator comparator;
    EXPECT_FALSE(comparator.matches("hello", "Hello"));
}

TEST(OutputComparatorTest, ExactModeComparesBytes) {
    OutputComparator comparator(CompareMode::EXACT);

    EXPECT_TRUE(comparator.matches("42\n", "42\n"));
    EXPECT_FALSE(comparator.matches("42\n", "42"));
    EXPECT_FALSE(comparator.matches("42\r\n", "42\n"));
}

TEST(OutputComparatorTest, TrimModeStripsBothEnds) {
    OutputComparator comparator(CompareMode::TRIM);

    EXPECT_TRUE(comparator.matches("\n  42  \n", "42"));
    EXPECT_FALSE(comparator.matches("4 2", "42"));
}

TEST(OutputComparatorTest, EmptyExpectedMatchesWhitespaceOnlyOutput) {
    OutputComparator comparator;
    EXPECT_TRUE(comparator.matches("", ""));
    EXPECT_TRUE(comparator.matches("\n\n", ""));
    EXPECT_FALSE(comparator.matches("x", ""));
}

TEST(OutputComparatorTest, ParsesModeNames) {
    CompareMode mode = CompareMode::EXACT;

    ASSERT_TRUE(OutputComparator::parse_mode("trim", mode));
    EXPECT_EQ(mode, CompareMode::TRIM);
    ASSERT_TRUE(OutputComparator::parse_mode("trailing_whitespace", mode));
    EXPECT_EQ(mode, CompareMode::TRAILING_WHITESPACE);
    EXPECT_FALSE(OutputComparator::parse_mode("fuzzy", mode));
    EXPECT_EQ(mode, CompareMode::TRAILING_WHITESPACE) << "Failed parse must not touch the mode";

    EXPECT_EQ(OutputComparator::mode_to_string(CompareMode::EXACT), "exact");
}

TEST(OutputComparatorTest, TrimHelpers) {
    EXPECT_EQ(rtrim("abc \r\n"), "abc");
    EXPECT_EQ(rtrim(" \n"), "");
    EXPECT_EQ(trim("\t abc \n"), "abc");
}

} // namespace
} // namespace gradebox
