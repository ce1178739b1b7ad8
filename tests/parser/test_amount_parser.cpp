/// @file tests/parser/test_amount_parser.cpp
/// @brief Unit tests for separator inference in parse_amount.
///
/// Test categories:
///   - Russian, European and English separator conventions
///   - Surrounding currency symbols are ignored
///   - Inputs without a number
///   - Canonical form exposed for diagnostics

#include <gtest/gtest.h>
#include "fdx/amount_parser.hpp"

using namespace fdx::parse;

// ─── Separator conventions ───────────────────────────────────────────────────

TEST(AmountParser, EuropeanGroupingWithCommaDecimal) {
    auto v = parse_amount("1.000,50");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1000.50);
}

TEST(AmountParser, LastCommaDecidesTheDecimalMark) {
    auto v = parse_amount("1,000,50");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1000.50);
    EXPECT_EQ(canonicalize_amount(L"1,000,50"), "1000.50");
    EXPECT_EQ(canonicalize_amount(L"1,000,500"), "1000500");
}

TEST(AmountParser, EnglishGroupingWithDotDecimal) {
    auto v = parse_amount("1,234.56");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1234.56);
}

TEST(AmountParser, SpaceGrouping) {
    auto v = parse_amount("10 000");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 10000.0);
}

TEST(AmountParser, NonBreakingSpaceGrouping) {
    auto v = parse_amount("1\xC2\xA0" "500\xC2\xA0" "000");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1500000.0);
}

TEST(AmountParser, RepeatedDotGrouping) {
    auto v = parse_amount("1.000.000");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1000000.0);
}

TEST(AmountParser, CommaDecimalOneDigit) {
    auto v = parse_amount("12,5");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 12.5);
}

TEST(AmountParser, CommaWithThreeDigitsGroups) {
    auto v = parse_amount("12,500");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 12500.0);
}

TEST(AmountParser, RepeatedCommaGrouping) {
    auto v = parse_amount("1,000,000");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1000000.0);
}

TEST(AmountParser, SingleDotWithThreeDigitsGroups) {
    auto v = parse_amount("1.234");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1234.0);
}

TEST(AmountParser, SingleDotDecimal) {
    auto v = parse_amount("99.9");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 99.9);
}

TEST(AmountParser, SpaceGroupingWithCommaDecimal) {
    auto v = parse_amount("1 000 000,50");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1000000.50);
}

// ─── Surrounding text ────────────────────────────────────────────────────────

TEST(AmountParser, IgnoresPrefixSymbol) {
    auto v = parse_amount("$1,234.56");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1234.56);
}

TEST(AmountParser, IgnoresSuffixWord) {
    auto v = parse_amount("1.000,50 сом");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1000.50);
}

TEST(AmountParser, WideOverload) {
    auto v = parse_amount(std::wstring_view(L"10 000 руб"));
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 10000.0);
}

TEST(AmountParser, ZeroIsReturnedForCallersToFilter) {
    auto v = parse_amount("0");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 0.0);
}

// ─── No amount ───────────────────────────────────────────────────────────────

TEST(AmountParser, NoDigitIsNoAmount) {
    EXPECT_FALSE(parse_amount("руб").has_value());
    EXPECT_FALSE(parse_amount("").has_value());
    EXPECT_FALSE(parse_amount(",.").has_value());
}

TEST(AmountParser, MalformedUtf8IsNoAmount) {
    EXPECT_FALSE(parse_amount("12\xFF").has_value());
}

// ─── Canonical form ──────────────────────────────────────────────────────────

TEST(AmountParser, CanonicalForms) {
    EXPECT_EQ(canonicalize_amount(L"1.000,50"), "1000.50");
    EXPECT_EQ(canonicalize_amount(L"1,234.56"), "1234.56");
    EXPECT_EQ(canonicalize_amount(L"10 000"), "10000");
    EXPECT_EQ(canonicalize_amount(L"1.000.000"), "1000000");
    EXPECT_EQ(canonicalize_amount(L"abc"), "");
}
