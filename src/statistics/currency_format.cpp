/// @file src/statistics/currency_format.cpp
/// @brief Grouped, localised amount rendering.

#include "fdx/statistics.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdint>

namespace fdx::stats {

namespace {

/// Largest magnitude rendered with fraction digits; beyond it cents overflow.
constexpr double CENTS_SAFE_LIMIT = 1e15;

std::string group_thousands(std::string_view digits) {
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (i + 3 - lead) % 3 == 0) {
            out += ' ';
        }
        out += digits[i];
    }
    return out;
}

std::string format_number(double amount) {
    const bool negative = amount < 0.0;
    const double magnitude = std::abs(amount);

    std::string number;
    if (magnitude >= CENTS_SAFE_LIMIT) {
        number = group_thousands(fmt::format("{:.0f}", magnitude));
    } else {
        const auto cents = static_cast<std::int64_t>(std::llround(magnitude * 100.0));
        number = group_thousands(fmt::format("{}", cents / 100));
        const auto frac = cents % 100;
        if (frac != 0) {
            number += frac % 10 == 0 ? fmt::format(",{}", frac / 10)
                                     : fmt::format(",{:02d}", frac);
        }
    }
    return negative && number != "0" ? "-" + number : number;
}

}  // namespace

std::string format_amount(double amount, CurrencyCode code) {
    if (!std::isfinite(amount)) {
        return "n/a";
    }
    const std::string number = format_number(amount);
    const std::string_view symbol = default_symbol(code);
    if (code == CurrencyCode::USD || code == CurrencyCode::EUR) {
        return fmt::format("{}{}", symbol, number);
    }
    return fmt::format("{} {}", number, symbol);
}

}  // namespace fdx::stats
