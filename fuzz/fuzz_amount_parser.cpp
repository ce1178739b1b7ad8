/**
 * @file  fuzz_amount_parser.cpp
 * @brief libFuzzer target for fdx::parse::parse_amount
 *
 * Build:
 *   cmake -DFDX_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_amount_parser
 *
 * Invariants:
 *   1. No crash for any byte sequence.
 *   2. A parsed value is finite and ≥ 0.
 *   3. The canonical form contains only digits and at most one '.'.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fdx/amount_parser.hpp"
#include "fdx/text.hpp"

using namespace fdx;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    if (const auto value = parse::parse_amount(input)) {
        assert(std::isfinite(*value));
        assert(*value >= 0.0);
    }

    if (const auto decoded = text::decode_utf8(input)) {
        const std::string canonical = parse::canonicalize_amount(*decoded);
        assert(std::count(canonical.begin(), canonical.end(), '.') <= 1);
        assert(std::all_of(canonical.begin(), canonical.end(), [](char c) {
            return (c >= '0' && c <= '9') || c == '.';
        }));
    }

    return 0;
}
