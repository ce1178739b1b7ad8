/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DFDX_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. analyze() returns nullopt exactly when validate_input() reports an
 *      error, and then the error offset lies inside the input.
 *   3. If a result is returned:
 *      a. mentions are sorted by position with positive, finite amounts
 *      b. total_budget and every category index point into `currencies`
 *      c. confidence ∈ [0, 100]
 *      d. statistics count every mention
 *   4. Extraction as a terms of reference or a proposal finds the same
 *      mentions, and its budget also points into `currencies`
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. The pipeline must handle:
 *     • Binary garbage (null bytes, stray continuation bytes)
 *     • Overlong encodings and surrogates
 *     • Long digit runs with mixed separators ("1.000,000 000.5")
 *     • Currency words and symbols glued to numbers
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string_view>

#include "fdx/engine.hpp"

using namespace fdx;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    static const Engine engine;
    const auto error  = engine.validate_input(input);
    const auto result = engine.analyze(input);

    // Invariant 2
    assert(result.has_value() == !error.has_value());
    if (error) {
        assert(error->byte_offset < size);
        return 0;
    }

    const auto& f  = result->financials;
    const auto& ms = f.currencies;

    // Invariant 3a
    for (std::size_t i = 0; i < ms.size(); ++i) {
        assert(ms[i].amount > 0.0);
        assert(std::isfinite(ms[i].amount));
        if (i > 0) {
            assert(ms[i - 1].position <= ms[i].position);
        }
    }

    // Invariant 3b
    if (f.total_budget) {
        assert(*f.total_budget < ms.size());
    }
    for (const auto& [category, index] : f.cost_breakdown.named) {
        assert(index < ms.size());
    }
    for (std::size_t index : f.cost_breakdown.other) {
        assert(index < ms.size());
    }

    // Invariant 3c
    assert(result->validation.confidence >= 0);
    assert(result->validation.confidence <= 100);

    // Invariant 3d
    assert(result->statistics.total_mentions == ms.size());

    // Invariant 4
    for (DocumentKind kind : {DocumentKind::TermsOfReference, DocumentKind::Proposal}) {
        const auto typed = engine.extract(input, kind);
        assert(typed.has_value());
        assert(typed->currencies == ms);
        if (typed->total_budget) {
            assert(*typed->total_budget < ms.size());
        }
    }

    return 0;
}
