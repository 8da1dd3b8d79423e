#include <gtest/gtest.h>
#include "progmeter/format/format_utils.hpp"
#include <chrono>

using namespace progmeter::format;
using std::chrono::seconds;

TEST(FormatUtilsTest, CountsStayExactWithoutHumanize) {
    EXPECT_EQ(formatCount(0, false, ""), "0");
    EXPECT_EQ(formatCount(1024, false, "B"), "1024B");
    EXPECT_EQ(formatCount(123456789, false, ""), "123456789");
}

TEST(FormatUtilsTest, HumanizedCountsUseDecimalSuffixes) {
    EXPECT_EQ(formatCount(999, true, "B"), "999B");
    EXPECT_EQ(formatCount(1000, true, "B"), "1000B");
    EXPECT_EQ(formatCount(1500, true, "B"), "1.50KB");
    EXPECT_EQ(formatCount(2500000, true, ""), "2.50M");
    EXPECT_EQ(formatCount(3000000000ULL, true, "B"), "3.00GB");
}

TEST(FormatUtilsTest, ScaleStopsAtLargestSuffix) {
    auto scaled = scaleUnit(1e30);
    EXPECT_STREQ(scaled.suffix, "Y");
    EXPECT_NEAR(scaled.value, 1e6, 1.0);
}

TEST(FormatUtilsTest, RateShowsPlaceholderWhenUnknown) {
    EXPECT_EQ(formatRate(std::nullopt, "B"), "--B/s");
    EXPECT_EQ(formatRate(std::nullopt, ""), "--/s");
}

TEST(FormatUtilsTest, RateIsScaled) {
    EXPECT_EQ(formatRate(25.0, ""), "25.0/s");
    EXPECT_EQ(formatRate(1500.0, ""), "1.5K/s");
    EXPECT_EQ(formatRate(2000000.0, "B"), "2.0MB/s");
}

TEST(FormatUtilsTest, DurationPicksShortestLayout) {
    EXPECT_EQ(formatDuration(seconds(0)), "0s");
    EXPECT_EQ(formatDuration(seconds(59)), "59s");
    EXPECT_EQ(formatDuration(seconds(125)), "02:05");
    EXPECT_EQ(formatDuration(seconds(3725)), "01:02:05");
    EXPECT_EQ(formatDuration(seconds(3 * 86400 + 3725)), "3-01:02:05");
}

TEST(FormatUtilsTest, NegativeDurationIsZero) {
    EXPECT_EQ(formatDuration(seconds(-5)), "0s");
}

TEST(FormatUtilsTest, PercentageIsClamped) {
    EXPECT_EQ(formatPercentage(0.5), " 50.0%");
    EXPECT_EQ(formatPercentage(1.0), "100.0%");
    EXPECT_EQ(formatPercentage(1.7), "100.0%");
    EXPECT_EQ(formatPercentage(-0.2), "  0.0%");
}

TEST(FormatUtilsTest, DisplayWidthCountsCodePoints) {
    EXPECT_EQ(displayWidth(""), 0u);
    EXPECT_EQ(displayWidth("plain"), 5u);
    EXPECT_EQ(displayWidth("h\xc3\xa9llo"), 5u);
    EXPECT_EQ(displayWidth("\xe6\x97\xa5\xe6\x9c\xac"), 2u);
}

TEST(FormatUtilsTest, TruncationKeepsWholeCharacters) {
    EXPECT_EQ(truncateToWidth("abcdef", 3), "abc");
    EXPECT_EQ(truncateToWidth("abc", 10), "abc");
    EXPECT_EQ(truncateToWidth("abc", 0), "");
    EXPECT_EQ(truncateToWidth("\xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e", 2), "\xe6\x97\xa5\xe6\x9c\xac");
    EXPECT_EQ(truncateToWidth("a\xc3\xa9" "b", 2), "a\xc3\xa9");
}
