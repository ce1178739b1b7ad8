/// @file src/statistics/budget_comparison.cpp
/// @brief Proposal-versus-reference budget deviation.

#include "fdx/constants.hpp"
#include "fdx/statistics.hpp"

#include <fmt/core.h>

#include <cmath>

namespace fdx::stats {

std::string_view to_string(BudgetStatus status) noexcept {
    switch (status) {
        case BudgetStatus::Excellent: return "excellent";
        case BudgetStatus::Good:      return "good";
        case BudgetStatus::Warning:   return "warning";
        case BudgetStatus::Critical:  return "critical";
        case BudgetStatus::Unknown:   return "unknown";
    }
    return "unknown";
}

BudgetStatus classify_deviation(double deviation_pct) noexcept {
    const double abs_pct = std::abs(deviation_pct);
    if (!std::isfinite(abs_pct))                      return BudgetStatus::Unknown;
    if (abs_pct <= constants::DEVIATION_EXCELLENT_PCT) return BudgetStatus::Excellent;
    if (abs_pct <= constants::DEVIATION_GOOD_PCT)      return BudgetStatus::Good;
    if (abs_pct <= constants::DEVIATION_WARNING_PCT)   return BudgetStatus::Warning;
    return BudgetStatus::Critical;
}

BudgetComparison compare_budgets(const std::optional<CurrencyMention>& reference,
                                 const std::optional<CurrencyMention>& proposal) {
    BudgetComparison out;
    if (!reference || !proposal) {
        return out;
    }

    out.comparable      = true;
    out.reference_value = convert_to_reference(*reference);
    out.proposal_value  = convert_to_reference(*proposal);
    out.deviation       = out.proposal_value - out.reference_value;
    out.deviation_pct   = out.reference_value > 0.0
        ? out.deviation / out.reference_value * 100.0
        : 0.0;
    out.status = classify_deviation(out.deviation_pct);
    return out;
}

std::string BudgetComparison::to_string() const {
    if (!comparable) {
        return "Budget comparison: unknown (budget missing in one of the documents)";
    }
    return fmt::format(
        "Budget comparison: reference=${:.2f}  proposal=${:.2f}  "
        "deviation=${:+.2f} ({:+.1f}%)  status={}",
        reference_value, proposal_value, deviation, deviation_pct,
        stats::to_string(status));
}

}  // namespace fdx::stats
