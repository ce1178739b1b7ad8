/**
 * @file  prop_amount_parser.cpp
 * @brief Property: grouped amounts parse back to their value in every
 *        supported separator convention.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_amount_parser
 *
 * Conventions covered:
 *   Russian   "1 234 567,05"
 *   European  "1.234.567,05"
 *   English   "1,234,567.05"
 *
 * A violation means the separator-role inference picked the wrong mark as
 * the decimal point for some digit layout.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include <fmt/core.h>

#include "fdx/amount_parser.hpp"

using namespace fdx::parse;

namespace {

std::string group(std::uint64_t n, char sep) {
    const std::string digits = std::to_string(n);
    std::string out;
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (i + 3 - lead) % 3 == 0) {
            out += sep;
        }
        out += digits[i];
    }
    return out;
}

bool close(double a, double b) {
    return std::abs(a - b) <= 1e-12 * std::max(1.0, std::abs(b));
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: grouped integers round-trip in every convention ──────────
    ok &= rc::check(
        "amount_parser: grouped integers parse to their value",
        []() {
            const auto n = *rc::gen::inRange<std::uint64_t>(1, 1000000000);
            const double expected = static_cast<double>(n);

            const auto ru = parse_amount(group(n, ' '));
            const auto eu = parse_amount(group(n, '.'));
            const auto en = parse_amount(group(n, ','));
            RC_ASSERT(ru.has_value());
            RC_ASSERT(eu.has_value());
            RC_ASSERT(en.has_value());
            RC_ASSERT(*ru == expected);
            RC_ASSERT(*eu == expected);
            RC_ASSERT(*en == expected);
        }
    );

    // ── Property 2: two-digit fractions keep their decimal mark ──────────────
    ok &= rc::check(
        "amount_parser: fractions survive Russian, European and English forms",
        []() {
            const auto n     = *rc::gen::inRange<std::uint64_t>(0, 100000000);
            const auto cents = *rc::gen::inRange<unsigned>(1, 100);
            const double expected = static_cast<double>(n) + cents / 100.0;

            const auto ru = parse_amount(fmt::format("{},{:02d}", group(n, ' '), cents));
            const auto eu = parse_amount(fmt::format("{},{:02d}", group(n, '.'), cents));
            const auto en = parse_amount(fmt::format("{}.{:02d}", group(n, ','), cents));
            RC_ASSERT(ru.has_value() && close(*ru, expected));
            RC_ASSERT(eu.has_value() && close(*eu, expected));
            RC_ASSERT(en.has_value() && close(*en, expected));
        }
    );

    // ── Property 3: surrounding currency text is ignored ─────────────────────
    ok &= rc::check(
        "amount_parser: symbols around the number do not change the value",
        []() {
            const auto n = *rc::gen::inRange<std::uint64_t>(1, 10000000);
            const std::string number = group(n, ' ');
            const auto bare     = parse_amount(number);
            const auto prefixed = parse_amount("$" + number);
            const auto suffixed = parse_amount(number + " руб.");
            RC_ASSERT(bare.has_value());
            RC_ASSERT(prefixed == bare);
            RC_ASSERT(suffixed == bare);
        }
    );

    // ── Property 4: arbitrary bytes never yield a negative or non-finite value
    ok &= rc::check(
        "amount_parser: any result is finite and non-negative",
        [](const std::string& text) {
            const auto value = parse_amount(text);
            if (value) {
                RC_ASSERT(std::isfinite(*value));
                RC_ASSERT(*value >= 0.0);
            }
        }
    );

    return ok ? 0 : 1;
}
