#pragma once

/// @file include/fdx/statistics.hpp
/// @brief Reference-currency conversion, aggregate statistics, budget
///        comparison and amount formatting.
///
/// # Module: Currency Converter & Statistics
///
/// ## Responsibility
/// Convert mentions to the reference currency (USD) with a fixed rate table
/// and summarise a mention list. The rates are approximate and are meant for
/// comparing amounts across currencies, not for accounting.
///
/// | code | USD per unit |
/// |------|--------------|
/// | USD  | 1            |
/// | EUR  | 1.08         |
/// | RUB  | 0.011        |
/// | KGS  | 0.011        |
/// | KZT  | 0.002        |
/// | UZS  | 0.000079     |
/// | TJS  | 0.091        |
/// | UAH  | 0.024        |
///
/// Reference values are computed in bulk with Eigen (element-wise product of
/// the amount vector and the rate vector).
///
/// ## Guarantees
/// - With zero mentions every number is 0 and every optional is empty
/// - No function throws

#include "fdx/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace fdx::stats {

// ─── Conversion ───────────────────────────────────────────────────────────────

/// USD value of one unit of `code`.
[[nodiscard]] double reference_rate(CurrencyCode code) noexcept;

[[nodiscard]] double convert_to_reference(double amount, CurrencyCode code) noexcept;
[[nodiscard]] double convert_to_reference(const CurrencyMention& mention) noexcept;

/// Convert between two currencies through the reference currency.
[[nodiscard]] double convert(double amount, CurrencyCode from, CurrencyCode to) noexcept;

// ─── Statistics ───────────────────────────────────────────────────────────────

struct CurrencyStatistics {
    std::size_t                         total_mentions    = 0;
    std::size_t                         unique_currencies = 0;
    std::optional<CurrencyCode>         primary_currency;       ///< Most frequent
    double                              total_reference_value  = 0.0;
    bool                                mixed_currencies       = false;
    std::map<CurrencyCode, std::size_t> distribution;           ///< code → count
    double                              mean_amount            = 0.0;  ///< Raw amounts, any currency
    double                              median_amount          = 0.0;
    std::optional<std::size_t>          largest;                ///< Index of the largest raw amount

    /// One-line summary.
    [[nodiscard]] std::string to_string() const;
};

/// Summarise a mention list (sorted by position).
///
/// Mean, median and the largest mention are taken over the raw amounts as
/// written, whatever their currency; only `total_reference_value` is
/// converted. The primary currency is the most frequent code; ties go to the
/// code whose first mention appears latest. The largest mention is the first
/// in position order on ties.
[[nodiscard]] CurrencyStatistics
compute_statistics(std::span<const CurrencyMention> mentions);

// ─── Budget comparison ────────────────────────────────────────────────────────

enum class BudgetStatus {
    Excellent,  ///< |deviation| ≤ 5 %
    Good,       ///< |deviation| ≤ 15 %
    Warning,    ///< |deviation| ≤ 30 %
    Critical,   ///< |deviation| > 30 %
    Unknown,    ///< One of the budgets is missing
};

[[nodiscard]] std::string_view to_string(BudgetStatus status) noexcept;

/// Classify an absolute deviation percentage.
[[nodiscard]] BudgetStatus classify_deviation(double deviation_pct) noexcept;

/// Deviation of a proposal budget from a terms-of-reference budget.
struct BudgetComparison {
    bool         comparable      = false;
    double       reference_value = 0.0;  ///< Reference budget, in USD
    double       proposal_value  = 0.0;  ///< Proposal budget, in USD
    double       deviation       = 0.0;  ///< proposal − reference, in USD
    double       deviation_pct   = 0.0;  ///< deviation / reference × 100
    BudgetStatus status          = BudgetStatus::Unknown;

    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] BudgetComparison
compare_budgets(const std::optional<CurrencyMention>& reference,
                const std::optional<CurrencyMention>& proposal);

// ─── Formatting ───────────────────────────────────────────────────────────────

/// Human-readable amount: "1 234 567,5 ₽", "$1 000", "€12,75".
///
/// Thousands are separated by a space and the decimal mark is a comma; at
/// most two fraction digits are shown, trailing zeros dropped. USD and EUR put
/// the symbol first, other codes after the number.
[[nodiscard]] std::string format_amount(double amount, CurrencyCode code);

}  // namespace fdx::stats
