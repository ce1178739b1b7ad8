/// @file tests/core/test_engine.cpp
/// @brief Unit tests for the Engine facade.
///
/// Test categories:
///   - Input validation (null, malformed UTF-8)
///   - Empty and non-financial documents
///   - Custom pattern tables and configuration
///   - Determinism and report rendering

#include <gtest/gtest.h>
#include "fdx/engine.hpp"

#include <algorithm>
#include <memory>
#include <string>

using namespace fdx;

namespace {

std::shared_ptr<const PatternTable> usd_only_table() {
    PatternSpec spec = PatternSpec::builtin();
    spec.currencies.erase(
        std::remove_if(spec.currencies.begin(), spec.currencies.end(),
                       [](const CurrencyPatternSpec& c) { return c.code != CurrencyCode::USD; }),
        spec.currencies.end());
    auto table = PatternTable::compile(spec);
    if (!table) {
        return nullptr;
    }
    return std::make_shared<const PatternTable>(std::move(*table));
}

}  // namespace

// ─── Input validation ────────────────────────────────────────────────────────

TEST(Engine, NullTextIsRejected) {
    const Engine engine;
    const char* text = nullptr;
    const auto err = engine.validate_input(text);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::InvalidInput);
    EXPECT_EQ(err->message, "text is null");
    EXPECT_FALSE(engine.extract(text).has_value());
}

TEST(Engine, MalformedUtf8ReportsOffset) {
    const Engine engine;
    const std::string bad = "abc\xFF";
    const auto err = engine.validate_input(std::string_view(bad));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->byte_offset, 3u);
    EXPECT_EQ(err->message.rfind("malformed UTF-8 at byte 3", 0), 0u);
    EXPECT_FALSE(engine.extract(std::string_view(bad)).has_value());
    EXPECT_FALSE(engine.analyze(bad).has_value());
}

TEST(Engine, WellFormedTextPassesValidation) {
    const Engine engine;
    EXPECT_FALSE(engine.validate_input(std::string_view("Стоимость: 5000 руб.")).has_value());
    EXPECT_FALSE(engine.validate_input(std::string_view("")).has_value());
}

TEST(Engine, ErrorKindName) {
    EXPECT_EQ(to_string(ErrorKind::InvalidInput), "invalid input");
}

// ─── Empty documents ─────────────────────────────────────────────────────────

TEST(Engine, EmptyTextGivesEmptyResult) {
    const Engine engine;
    const auto out = engine.extract(std::string_view(""));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->currencies.empty());
    EXPECT_FALSE(out->total_budget.has_value());
    EXPECT_TRUE(out->cost_breakdown.empty());
    EXPECT_TRUE(out->payment_terms.empty());
    EXPECT_TRUE(out->financial_notes.empty());
}

TEST(Engine, EmptyTextAnalysisIsInvalid) {
    const Engine engine;
    const auto analysis = engine.analyze("");
    ASSERT_TRUE(analysis.has_value());
    EXPECT_EQ(analysis->validation.confidence, 65);
    EXPECT_FALSE(analysis->validation.is_valid);
    EXPECT_EQ(analysis->statistics.total_mentions, 0u);
}

TEST(Engine, TextWithoutAmounts) {
    const Engine engine;
    const auto out = engine.extract(std::string_view("Просто письмо без цен."));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->currencies.empty());
}

// ─── Extraction ──────────────────────────────────────────────────────────────

TEST(Engine, SingleMention) {
    const Engine engine;
    const auto out = engine.extract(std::string_view("Стоимость: 5000 руб."));
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->currencies.size(), 1u);
    EXPECT_EQ(out->currencies[0].code, CurrencyCode::RUB);
    EXPECT_DOUBLE_EQ(out->currencies[0].amount, 5000.0);
    EXPECT_EQ(out->currencies[0].position, 11u);
    EXPECT_EQ(out->total_budget, 0u);
}

TEST(Engine, CStringOverloadMatchesStringView) {
    const Engine engine;
    const char* text = "Итого: $1 500";
    const auto a = engine.extract(text);
    const auto b = engine.extract(std::string_view(text));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
}

// ─── Configuration ───────────────────────────────────────────────────────────

TEST(Engine, CustomTableLimitsCurrencies) {
    auto table = usd_only_table();
    ASSERT_NE(table, nullptr);
    const Engine engine(EngineConfig{}, table);
    const auto out = engine.extract(std::string_view("Итого: 1000 руб. и $500"));
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->currencies.size(), 1u);
    EXPECT_EQ(out->currencies[0].code, CurrencyCode::USD);
    EXPECT_DOUBLE_EQ(out->currencies[0].amount, 500.0);
    EXPECT_EQ(out->total_budget, 0u);
}

TEST(Engine, NullTableFallsBackToBuiltin) {
    const Engine engine(EngineConfig{}, nullptr);
    EXPECT_EQ(engine.patterns().currencies().size(), CURRENCY_COUNT);
    const auto out = engine.extract(std::string_view("1000 тенге"));
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->currencies.size(), 1u);
    EXPECT_EQ(out->currencies[0].code, CurrencyCode::KZT);
}

TEST(Engine, CategoryWindowFromConfig) {
    const std::string text = "Разработка: 200000 руб.";

    const Engine defaults;
    const auto a = defaults.extract(std::string_view(text));
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(a->category(CostCategory::Development).has_value());

    EngineConfig cfg;
    cfg.proximity.category_window = 1;
    const Engine narrow(cfg);
    const auto b = narrow.extract(std::string_view(text));
    ASSERT_TRUE(b.has_value());
    EXPECT_FALSE(b->category(CostCategory::Development).has_value());
    EXPECT_EQ(narrow.config().proximity.category_window, 1u);
}

TEST(Engine, VerboseDoesNotChangeResult) {
    EngineConfig cfg;
    cfg.verbose = true;
    const Engine loud(cfg);
    const Engine quiet;
    const std::string text = "Разработка: 200000 руб. Тестирование: 50000 руб.";
    EXPECT_EQ(loud.extract(std::string_view(text)), quiet.extract(std::string_view(text)));
}

// ─── Determinism and rendering ───────────────────────────────────────────────

TEST(Engine, RepeatedCallsAreIdentical) {
    const Engine engine;
    const std::string text =
        "Общая стоимость: 1 000 000 руб. Разработка: 700 000 руб. "
        "Поддержка: 300 000 руб. Оплата в течение 10 дней.";
    const auto first  = engine.extract(std::string_view(text));
    const auto second = engine.extract(std::string_view(text));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first, second);
}

TEST(Engine, ReportContainsAllSections) {
    const Engine engine;
    const auto analysis = engine.analyze("Итого: 1 000 000 руб. Разработка: 800 000 руб.");
    ASSERT_TRUE(analysis.has_value());
    const std::string report = analysis->to_string();
    EXPECT_NE(report.find("Financial summary"), std::string::npos);
    EXPECT_NE(report.find("Total budget:   1 000 000 ₽"), std::string::npos);
    EXPECT_NE(report.find("development"), std::string::npos);
    EXPECT_NE(report.find("Statistics"), std::string::npos);
    EXPECT_NE(report.find("Validation: valid"), std::string::npos);
}
