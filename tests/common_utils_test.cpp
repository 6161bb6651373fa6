#include <gtest/gtest.h>
#include "CommonUtils.h"

#include <limits>

TEST(CommonUtilsTest, FormatFixed) {
    EXPECT_EQ(CommonUtils::formatFixed(0.0, 1), "0.0");
    EXPECT_EQ(CommonUtils::formatFixed(100.0 / 3.0, 1), "33.3");
    EXPECT_EQ(CommonUtils::formatFixed(2.0 / 3.0, 3), "0.667");
    EXPECT_EQ(CommonUtils::formatFixed(-0.001, 2), "0.00");
    EXPECT_EQ(CommonUtils::formatFixed(-1.5, 2), "-1.50");
    EXPECT_EQ(CommonUtils::formatFixed(std::numeric_limits<double>::quiet_NaN(), 2), "NaN");
    EXPECT_EQ(CommonUtils::formatFixed(std::numeric_limits<double>::infinity(), 2), "Infinity");
    EXPECT_EQ(CommonUtils::formatFixed(-std::numeric_limits<double>::infinity(), 2), "-Infinity");
}

TEST(CommonUtilsTest, ParseFiniteDouble) {
    EXPECT_EQ(CommonUtils::parseFiniteDouble("  -7.25 "), -7.25);
    EXPECT_EQ(CommonUtils::parseFiniteDouble("+4"), 4.0);
    EXPECT_FALSE(CommonUtils::parseFiniteDouble("").has_value());
    EXPECT_FALSE(CommonUtils::parseFiniteDouble("+").has_value());
    EXPECT_FALSE(CommonUtils::parseFiniteDouble("nan").has_value());
    EXPECT_FALSE(CommonUtils::parseFiniteDouble("1e999").has_value());
    EXPECT_FALSE(CommonUtils::parseFiniteDouble("1,5").has_value());
}

TEST(CommonUtilsTest, TrimLowerTruncate) {
    EXPECT_EQ(CommonUtils::trim("\t a b \r\n"), "a b");
    EXPECT_EQ(CommonUtils::trim("   "), "");
    EXPECT_EQ(CommonUtils::toLower("MixedCase"), "mixedcase");
    EXPECT_EQ(CommonUtils::truncateLabel("abcdef", 3), "abc");
    EXPECT_EQ(CommonUtils::truncateLabel("ab", 3), "ab");
}

TEST(CommonUtilsTest, TruncateCountsCodePoints) {
    // "é" is two bytes, "€" three.
    EXPECT_EQ(CommonUtils::truncateLabel("\xC3\xA9\xC3\xA9\xC3\xA9", 2), "\xC3\xA9\xC3\xA9");
    EXPECT_EQ(CommonUtils::truncateLabel("a\xE2\x82\xAC" "b", 2), "a\xE2\x82\xAC");
    EXPECT_EQ(CommonUtils::truncateLabel("\xE2\x82\xAC\xE2\x82\xAC", 2), "\xE2\x82\xAC\xE2\x82\xAC");
}
