/// @file src/statistics/currency_statistics.cpp
/// @brief Reference-currency conversion and mention statistics.

#include "fdx/statistics.hpp"

#include <Eigen/Dense>
#include <fmt/core.h>

#include <algorithm>
#include <vector>

namespace fdx::stats {

// ─── Conversion ───────────────────────────────────────────────────────────────

double reference_rate(CurrencyCode code) noexcept {
    switch (code) {
        case CurrencyCode::USD: return 1.0;
        case CurrencyCode::EUR: return 1.08;
        case CurrencyCode::RUB: return 0.011;
        case CurrencyCode::KGS: return 0.011;
        case CurrencyCode::KZT: return 0.002;
        case CurrencyCode::UZS: return 0.000079;
        case CurrencyCode::TJS: return 0.091;
        case CurrencyCode::UAH: return 0.024;
    }
    return 0.0;
}

double convert_to_reference(double amount, CurrencyCode code) noexcept {
    return amount * reference_rate(code);
}

double convert_to_reference(const CurrencyMention& mention) noexcept {
    return convert_to_reference(mention.amount, mention.code);
}

double convert(double amount, CurrencyCode from, CurrencyCode to) noexcept {
    if (from == to) {
        return amount;
    }
    const double target_rate = reference_rate(to);
    if (target_rate <= 0.0) {
        return 0.0;
    }
    return convert_to_reference(amount, from) / target_rate;
}

// ─── compute_statistics ───────────────────────────────────────────────────────

CurrencyStatistics compute_statistics(std::span<const CurrencyMention> mentions) {
    CurrencyStatistics out;
    const auto n = static_cast<Eigen::Index>(mentions.size());
    if (n == 0) {
        return out;
    }

    Eigen::VectorXd amounts(n);
    Eigen::VectorXd rates(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& m = mentions[static_cast<std::size_t>(i)];
        amounts(i) = m.amount;
        rates(i)   = reference_rate(m.code);
    }

    out.total_mentions        = mentions.size();
    out.total_reference_value = amounts.cwiseProduct(rates).sum();
    out.mean_amount           = amounts.mean();

    std::vector<double> sorted(amounts.data(), amounts.data() + n);
    std::sort(sorted.begin(), sorted.end());
    const std::size_t mid = sorted.size() / 2;
    out.median_amount = sorted.size() % 2 == 1
        ? sorted[mid]
        : 0.5 * (sorted[mid - 1] + sorted[mid]);

    Eigen::Index best = 0;
    for (Eigen::Index i = 1; i < n; ++i) {
        if (amounts(i) > amounts(best)) {
            best = i;
        }
    }
    out.largest = static_cast<std::size_t>(best);

    // First-appearance order drives the tie-break for the primary currency:
    // a later code with an equal count replaces the holder.
    std::vector<CurrencyCode> first_seen;
    for (const auto& m : mentions) {
        if (out.distribution[m.code]++ == 0) {
            first_seen.push_back(m.code);
        }
    }
    out.unique_currencies = out.distribution.size();
    out.mixed_currencies  = out.unique_currencies > 1;

    std::size_t best_count = 0;
    for (CurrencyCode code : first_seen) {
        const std::size_t count = out.distribution[code];
        if (count >= best_count) {
            best_count           = count;
            out.primary_currency = code;
        }
    }
    return out;
}

std::string CurrencyStatistics::to_string() const {
    return fmt::format(
        "mentions={}  currencies={}  primary={}  total=${:.2f}  mean={:.2f}  median={:.2f}",
        total_mentions, unique_currencies,
        primary_currency ? fdx::to_string(*primary_currency) : std::string_view("-"),
        total_reference_value, mean_amount, median_amount);
}

}  // namespace fdx::stats
