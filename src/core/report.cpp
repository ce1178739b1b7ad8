/// @file src/core/report.cpp
/// @brief Plain-text rendering of a FinancialAnalysis.

#include "fdx/engine.hpp"

#include <fmt/core.h>

namespace fdx {

namespace {

std::string describe(const CurrencyMention& m) {
    return fmt::format("{}  ({} at {})", stats::format_amount(m.amount, m.code),
                       to_string(m.code), m.position);
}

}  // namespace

std::string FinancialAnalysis::to_string() const {
    std::string out;
    out += "── Financial summary ─────────────────────────────────────────\n";

    if (const auto budget = financials.budget()) {
        out += fmt::format("Total budget:   {}\n", describe(*budget));
    } else {
        out += "Total budget:   not found\n";
    }

    out += fmt::format("Amounts found:  {}\n", financials.currencies.size());
    for (const auto& m : financials.currencies) {
        out += fmt::format("  {:>24}  {}  \"{}\"\n",
                           stats::format_amount(m.amount, m.code),
                           fdx::to_string(m.code), m.original_text);
    }

    if (!financials.cost_breakdown.empty()) {
        out += "Cost breakdown:\n";
        for (const auto& [category, index] : financials.cost_breakdown.named) {
            if (index < financials.currencies.size()) {
                out += fmt::format("  {:<20} {}\n", fdx::to_string(category),
                                   describe(financials.currencies[index]));
            }
        }
        for (const auto& m : financials.other_costs()) {
            out += fmt::format("  {:<20} {}\n", "other", describe(m));
        }
    }

    if (!financials.payment_terms.empty()) {
        out += "Payment terms:\n";
        for (const auto& term : financials.payment_terms) {
            out += fmt::format("  - {}\n", term);
        }
    }

    if (!financials.financial_notes.empty()) {
        out += "Financial notes:\n";
        for (const auto& note : financials.financial_notes) {
            out += fmt::format("  - {}\n", note);
        }
    }

    out += "── Statistics ────────────────────────────────────────────────\n";
    out += statistics.to_string();
    out += '\n';
    if (!statistics.distribution.empty()) {
        out += "Distribution:  ";
        for (const auto& [code, count] : statistics.distribution) {
            out += fmt::format(" {}={}", fdx::to_string(code), count);
        }
        out += '\n';
    }

    out += "── Validation ────────────────────────────────────────────────\n";
    out += validation.to_string();
    return out;
}

}  // namespace fdx
