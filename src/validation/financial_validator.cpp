/// @file src/validation/financial_validator.cpp
/// @brief Rule-based confidence scoring.

#include "fdx/validator.hpp"
#include "fdx/statistics.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace fdx::validation {

ValidationReport validate(const ExtractedFinancials& data, const ValidatorConfig& config) {
    ValidationReport report;
    int confidence = 100;

    // ── Currencies present ──────────────────────────────────────────────────
    if (data.currencies.empty()) {
        confidence -= config.penalty_no_currencies;
        report.issues.emplace_back("No currency amounts were found in the document");
        report.suggestions.emplace_back(
            "Check that prices are written with a currency symbol or code");
    }

    // ── Realistic amounts ───────────────────────────────────────────────────
    const auto unrealistic = static_cast<std::size_t>(std::count_if(
        data.currencies.begin(), data.currencies.end(), [&](const CurrencyMention& m) {
            return m.amount > config.unrealistic_max || m.amount < config.unrealistic_min;
        }));
    if (unrealistic > 0) {
        confidence -= config.penalty_unrealistic;
        report.issues.push_back(fmt::format("{} amount(s) look unrealistic", unrealistic));
        report.suggestions.emplace_back(
            "Verify very large or very small amounts against the source document");
    }

    // ── Budget versus parts ─────────────────────────────────────────────────
    if (const auto budget = data.budget()) {
        const double budget_ref = stats::convert_to_reference(*budget);
        double others_ref = 0.0;
        for (std::size_t i = 0; i < data.currencies.size(); ++i) {
            if (i != *data.total_budget) {
                others_ref += stats::convert_to_reference(data.currencies[i]);
            }
        }
        if (budget_ref < config.budget_parts_ratio * others_ref) {
            confidence -= config.penalty_budget_parts;
            report.issues.emplace_back("Total budget is smaller than the sum of its parts");
            report.suggestions.emplace_back(
                "Check that the identified total budget is the final project cost");
        }
    }

    // ── Breakdown present ───────────────────────────────────────────────────
    if (data.cost_breakdown.named.empty()) {
        confidence -= config.penalty_no_breakdown;
        report.suggestions.emplace_back(
            "Add a cost breakdown by category (development, testing, support, ...)");
    }

    report.confidence = std::clamp(confidence, 0, 100);
    report.is_valid   = report.confidence >= config.valid_min_confidence &&
                        report.issues.size() < config.valid_max_issues &&
                        !data.currencies.empty();
    return report;
}

std::string ValidationReport::to_string() const {
    std::string out = fmt::format("Validation: {}  confidence={}\n",
                                  is_valid ? "valid" : "invalid", confidence);
    for (const auto& issue : issues) {
        out += fmt::format("  issue:      {}\n", issue);
    }
    for (const auto& suggestion : suggestions) {
        out += fmt::format("  suggestion: {}\n", suggestion);
    }
    return out;
}

}  // namespace fdx::validation
