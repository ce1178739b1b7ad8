/// @file tests/excerpts/test_excerpt_extractor.cpp
/// @brief Unit tests for regex-driven excerpt collection.
///
/// Test categories:
///   - Exclusive length bounds
///   - Fuzzy rejection of near-identical excerpts
///   - Count cap in discovery order
///   - Whitespace normalisation and original-case slicing
///   - Built-in payment-term and note patterns

#include <gtest/gtest.h>
#include "fdx/excerpts.hpp"
#include "fdx/patterns.hpp"
#include "fdx/text.hpp"

#include <regex>
#include <string>
#include <vector>

using namespace fdx;
using namespace fdx::excerpt;

namespace {

std::vector<std::string> run(const std::string& utf8,
                             const std::vector<std::wregex>& patterns,
                             const ExcerptConfig& config) {
    const auto decoded = text::decode_utf8(utf8);
    if (!decoded) {
        return {};
    }
    const std::wstring folded = text::fold_for_matching(*decoded);
    return extract_excerpts(*decoded, folded, patterns, config);
}

std::vector<std::string> builtin_terms(const std::string& utf8) {
    const auto table = PatternTable::builtin();
    return run(utf8, table->payment_term_patterns(), ExcerptConfig::payment_terms());
}

std::vector<std::string> builtin_notes(const std::string& utf8) {
    const auto table = PatternTable::builtin();
    return run(utf8, table->note_patterns(), ExcerptConfig::financial_notes());
}

}  // namespace

// ─── Filters ─────────────────────────────────────────────────────────────────

TEST(ExcerptExtractor, LengthBoundsAreExclusive) {
    const std::vector<std::wregex> patterns{std::wregex(L"x+")};
    const ExcerptConfig cfg{.min_length = 15, .max_length = 20,
                            .max_count = 10, .similarity_cutoff = 0.99};
    // 15 x's: too short. 16 x's: kept. 20 x's: too long.
    const std::string text = std::string(15, 'x') + " " + std::string(16, 'x') + " " +
                             std::string(20, 'x');
    const auto out = run(text, patterns, cfg);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], std::string(16, 'x'));
}

TEST(ExcerptExtractor, NearIdenticalExcerptsAreDropped) {
    const std::vector<std::wregex> patterns{std::wregex(L"payment[^.]*")};
    const auto out = run(
        "Payment due within 30 days. Payment due within 30 days. "
        "Payment due within 31 days. Payment is made by wire transfer to the account.",
        patterns, ExcerptConfig::payment_terms());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "Payment due within 30 days");
    EXPECT_EQ(out[1], "Payment is made by wire transfer to the account");
}

TEST(ExcerptExtractor, CapKeepsDiscoveryOrder) {
    const std::vector<std::wregex> patterns{std::wregex(L"[a-z]{16,}")};
    const ExcerptConfig cfg{.min_length = 15, .max_length = 200,
                            .max_count = 2, .similarity_cutoff = 0.7};
    const std::string text = std::string(16, 'a') + " " + std::string(16, 'b') + " " +
                             std::string(16, 'c');
    const auto out = run(text, patterns, cfg);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], std::string(16, 'a'));
    EXPECT_EQ(out[1], std::string(16, 'b'));
}

TEST(ExcerptExtractor, PatternsRunInOrder) {
    const std::vector<std::wregex> patterns{std::wregex(L"second[^.]*"),
                                            std::wregex(L"first[^.]*")};
    const auto out = run("First, cash is accepted at the office. Second, wire transfer within 5 days.",
                         patterns, ExcerptConfig::payment_terms());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "Second, wire transfer within 5 days");
    EXPECT_EQ(out[1], "First, cash is accepted at the office");
}

TEST(ExcerptExtractor, WhitespaceIsCollapsedAndCaseKept) {
    const std::vector<std::wregex> patterns{std::wregex(L"note[^.]*")};
    const auto out = run("Note:   tax\n\n  is   INCLUDED in the price.",
                         patterns, ExcerptConfig::financial_notes());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "Note: tax is INCLUDED in the price");
}

TEST(ExcerptExtractor, MismatchedViewsYieldNothing) {
    const std::vector<std::wregex> patterns{std::wregex(L"a+")};
    EXPECT_TRUE(extract_excerpts(L"aaaaaaaaaaaaaaaaaaaa", L"aaa", patterns,
                                 ExcerptConfig::payment_terms()).empty());
}

TEST(ExcerptExtractor, ZeroCapYieldsNothing) {
    const std::vector<std::wregex> patterns{std::wregex(L"a+")};
    const ExcerptConfig cfg{.min_length = 0, .max_length = 100,
                            .max_count = 0, .similarity_cutoff = 0.7};
    EXPECT_TRUE(run("aaaa", patterns, cfg).empty());
}

// ─── Built-in patterns ───────────────────────────────────────────────────────

TEST(ExcerptExtractor, BuiltinPrepaymentTerm) {
    const auto terms = builtin_terms("Оплата: предоплата 50% при подписании договора.");
    ASSERT_FALSE(terms.empty());
    EXPECT_EQ(terms[0], "Оплата: предоплата");
}

TEST(ExcerptExtractor, BuiltinRepeatedTermIsDeduplicated) {
    const auto terms = builtin_terms("Оплата в течение 10 дней. Оплата в течение 10 дней.");
    ASSERT_EQ(terms.size(), 2u);
    EXPECT_EQ(terms[0], "Оплата в течение 10");
    EXPECT_EQ(terms[1], "в течение 10 дней");
}

TEST(ExcerptExtractor, BuiltinEnglishTerm) {
    const auto terms = builtin_terms("Payment terms: 30% prepayment, the rest upon completion.");
    ASSERT_FALSE(terms.empty());
    EXPECT_EQ(terms[0], "Payment terms: 30% prepayment");
}

TEST(ExcerptExtractor, BuiltinNoteKeepsWholeSentence) {
    const auto notes = builtin_notes("Внимание: цены указаны без учета НДС.");
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0], "Внимание: цены указаны без учета НДС.");
}

TEST(ExcerptExtractor, NoMatchesNoExcerpts) {
    EXPECT_TRUE(builtin_terms("Просто текст без условий").empty());
    EXPECT_TRUE(builtin_notes("").empty());
}
