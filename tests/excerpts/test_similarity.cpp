/// @file tests/excerpts/test_similarity.cpp
/// @brief Unit tests for levenshtein() and similarity().

#include <gtest/gtest.h>
#include "fdx/excerpts.hpp"

using namespace fdx::excerpt;

TEST(Levenshtein, ClassicExamples) {
    EXPECT_EQ(levenshtein(L"kitten", L"sitting"), 3u);
    EXPECT_EQ(levenshtein(L"flaw", L"lawn"), 2u);
    EXPECT_EQ(levenshtein(L"same", L"same"), 0u);
}

TEST(Levenshtein, EmptyOperands) {
    EXPECT_EQ(levenshtein(L"", L""), 0u);
    EXPECT_EQ(levenshtein(L"abc", L""), 3u);
    EXPECT_EQ(levenshtein(L"", L"abcd"), 4u);
}

TEST(Levenshtein, Symmetric) {
    EXPECT_EQ(levenshtein(L"оплата", L"предоплата"), levenshtein(L"предоплата", L"оплата"));
    EXPECT_EQ(levenshtein(L"оплата", L"предоплата"), 4u);
}

TEST(Similarity, IdenticalIsOne) {
    EXPECT_DOUBLE_EQ(similarity("abc", "abc"), 1.0);
}

TEST(Similarity, TwoEmptyStringsAreIdentical) {
    EXPECT_DOUBLE_EQ(similarity("", ""), 1.0);
}

TEST(Similarity, EmptyAgainstNonEmptyIsZero) {
    EXPECT_DOUBLE_EQ(similarity("", "abc"), 0.0);
}

TEST(Similarity, OneSubstitutionInFour) {
    EXPECT_DOUBLE_EQ(similarity("abcd", "abce"), 0.75);
}

TEST(Similarity, CaseInsensitiveAcrossScripts) {
    EXPECT_DOUBLE_EQ(similarity("ОПЛАТА В ТЕЧЕНИЕ 10 ДНЕЙ", "оплата в течение 10 дней"), 1.0);
    EXPECT_DOUBLE_EQ(similarity("Payment", "PAYMENT"), 1.0);
}

TEST(Similarity, NearIdenticalTermsExceedCutoff) {
    EXPECT_GT(similarity("Payment due within 30 days", "Payment due within 31 days"), 0.7);
}

TEST(Similarity, UnrelatedTextsAreDissimilar) {
    EXPECT_LT(similarity("Предоплата 50% при подписании", "VAT is not included"), 0.3);
}

TEST(Similarity, MalformedUtf8ComparesAsEmpty) {
    EXPECT_DOUBLE_EQ(similarity("\xFF", ""), 1.0);
}
