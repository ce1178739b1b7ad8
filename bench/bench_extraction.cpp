/**
 * @file  bench/bench_extraction.cpp
 * @brief Google Benchmark suite for the extraction pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_ParseAmount          — separator inference on one snippet
 *   BM_DecodeAndFold        — UTF-8 decode + case folding
 *   BM_Scan                 — currency scanning only
 *   BM_Extract              — full Engine::extract
 *   BM_Analyze              — extract + statistics + validation
 *
 * Build (CMake):
 *   cmake --build build --target bench_extraction
 *   ./build/bench_extraction --benchmark_format=json
 *
 * Document sizes are given in proposal sections; one section is a category
 * line with an amount plus a sentence of payment terms (~120 code points).
 * Custom counter "KB_per_sec" = input bytes processed / 1024.
 */

#include "benchmark/benchmark.h"

#include "fdx/amount_parser.hpp"
#include "fdx/engine.hpp"
#include "fdx/scanner.hpp"
#include "fdx/text.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <fmt/core.h>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Synthetic proposal with `sections` priced sections and a closing total.
static std::string make_proposal(std::size_t sections) {
    static constexpr std::array<const char*, 5> LABELS = {
        "Разработка", "Тестирование", "Внедрение", "Поддержка", "Дизайн",
    };
    static constexpr std::array<const char*, 4> UNITS = {"руб.", "сом", "USD", "тенге"};

    std::string doc = "Коммерческое предложение\n\n";
    for (std::size_t i = 0; i < sections; ++i) {
        doc += fmt::format("{} этапа {}: {} {}\n", LABELS[i % LABELS.size()], i + 1,
                           100000 + 2500 * i, UNITS[i % UNITS.size()]);
        doc += "Оплата в течение 10 рабочих дней после подписания акта.\n";
    }
    doc += fmt::format("\nОбщая стоимость проекта: {} руб.\n", 100000 * sections);
    doc += "Внимание: цены указаны без учета НДС.\n";
    return doc;
}

static void set_byte_counters(benchmark::State& state, std::size_t bytes) {
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(bytes));
    state.counters["KB_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(bytes) / 1024.0,
        benchmark::Counter::kIsRate);
}

// ── Building blocks ────────────────────────────────────────────────────────────

static void BM_ParseAmount(benchmark::State& state) {
    const std::string snippet = "1 234 567,89 руб";
    for (auto _ : state) {
        auto value = fdx::parse::parse_amount(snippet);
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseAmount);

static void BM_DecodeAndFold(benchmark::State& state) {
    const std::string doc = make_proposal(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto decoded = fdx::text::decode_utf8(doc);
        auto folded  = fdx::text::fold_for_matching(*decoded);
        benchmark::DoNotOptimize(folded.data());
        benchmark::ClobberMemory();
    }
    set_byte_counters(state, doc.size());
}
BENCHMARK(BM_DecodeAndFold)->RangeMultiplier(4)->Range(4, 256)->Unit(benchmark::kMicrosecond);

static void BM_Scan(benchmark::State& state) {
    const std::string doc = make_proposal(static_cast<std::size_t>(state.range(0)));
    const auto decoded = fdx::text::decode_utf8(doc);
    const std::wstring folded = fdx::text::fold_for_matching(*decoded);
    const fdx::scan::CurrencyScanner scanner(fdx::PatternTable::builtin());
    for (auto _ : state) {
        auto mentions = scanner.scan(*decoded, folded);
        benchmark::DoNotOptimize(mentions.data());
    }
    set_byte_counters(state, doc.size());
}
BENCHMARK(BM_Scan)->RangeMultiplier(4)->Range(4, 256)->Unit(benchmark::kMicrosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_Extract(benchmark::State& state) {
    const std::string doc = make_proposal(static_cast<std::size_t>(state.range(0)));
    const fdx::Engine engine;
    for (auto _ : state) {
        auto result = engine.extract(std::string_view(doc));
        benchmark::DoNotOptimize(result);
    }
    set_byte_counters(state, doc.size());
}
BENCHMARK(BM_Extract)->RangeMultiplier(4)->Range(4, 256)->Unit(benchmark::kMillisecond);

static void BM_Analyze(benchmark::State& state) {
    const std::string doc = make_proposal(static_cast<std::size_t>(state.range(0)));
    const fdx::Engine engine;
    for (auto _ : state) {
        auto result = engine.analyze(doc);
        benchmark::DoNotOptimize(result);
    }
    set_byte_counters(state, doc.size());
}
BENCHMARK(BM_Analyze)->RangeMultiplier(4)->Range(4, 64)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
