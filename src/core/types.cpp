/// @file src/core/types.cpp
/// @brief Code/category names and ExtractedFinancials accessors.

#include "fdx/types.hpp"

#include <cctype>

namespace fdx {

// ─── CurrencyCode ─────────────────────────────────────────────────────────────

std::string_view to_string(CurrencyCode code) noexcept {
    switch (code) {
        case CurrencyCode::KGS: return "KGS";
        case CurrencyCode::RUB: return "RUB";
        case CurrencyCode::USD: return "USD";
        case CurrencyCode::EUR: return "EUR";
        case CurrencyCode::KZT: return "KZT";
        case CurrencyCode::UZS: return "UZS";
        case CurrencyCode::TJS: return "TJS";
        case CurrencyCode::UAH: return "UAH";
    }
    return "???";
}

std::optional<CurrencyCode> parse_currency_code(std::string_view text) noexcept {
    if (text.size() != 3) {
        return std::nullopt;
    }
    for (CurrencyCode code : ALL_CURRENCIES) {
        const std::string_view name = to_string(code);
        bool same = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            same = same && std::toupper(static_cast<unsigned char>(text[i])) == name[i];
        }
        if (same) {
            return code;
        }
    }
    return std::nullopt;
}

std::string_view default_symbol(CurrencyCode code) noexcept {
    switch (code) {
        case CurrencyCode::KGS: return "сом";
        case CurrencyCode::RUB: return "₽";
        case CurrencyCode::USD: return "$";
        case CurrencyCode::EUR: return "€";
        case CurrencyCode::KZT: return "₸";
        case CurrencyCode::UZS: return "сум";
        case CurrencyCode::TJS: return "сомони";
        case CurrencyCode::UAH: return "₴";
    }
    return "";
}

std::string_view default_name(CurrencyCode code) noexcept {
    switch (code) {
        case CurrencyCode::KGS: return "Кыргызский сом";
        case CurrencyCode::RUB: return "Российский рубль";
        case CurrencyCode::USD: return "Доллар США";
        case CurrencyCode::EUR: return "Евро";
        case CurrencyCode::KZT: return "Казахский тенге";
        case CurrencyCode::UZS: return "Узбекский сум";
        case CurrencyCode::TJS: return "Таджикский сомони";
        case CurrencyCode::UAH: return "Украинская гривна";
    }
    return "";
}

// ─── DocumentKind ─────────────────────────────────────────────────────────────

std::string_view to_string(DocumentKind kind) noexcept {
    switch (kind) {
        case DocumentKind::General:          return "general";
        case DocumentKind::TermsOfReference: return "terms_of_reference";
        case DocumentKind::Proposal:         return "proposal";
    }
    return "unknown";
}

// ─── CostCategory ─────────────────────────────────────────────────────────────

std::string_view to_string(CostCategory category) noexcept {
    switch (category) {
        case CostCategory::Development:       return "development";
        case CostCategory::Infrastructure:    return "infrastructure";
        case CostCategory::Support:           return "support";
        case CostCategory::Testing:           return "testing";
        case CostCategory::Deployment:        return "deployment";
        case CostCategory::ProjectManagement: return "project_management";
        case CostCategory::Design:            return "design";
        case CostCategory::Documentation:     return "documentation";
    }
    return "unknown";
}

// ─── CurrencyMention ──────────────────────────────────────────────────────────

std::size_t CurrencyMention::end_position() const noexcept {
    return position + length;
}

// ─── ExtractedFinancials ──────────────────────────────────────────────────────

std::optional<CurrencyMention> ExtractedFinancials::budget() const {
    if (!total_budget || *total_budget >= currencies.size()) {
        return std::nullopt;
    }
    return currencies[*total_budget];
}

std::optional<CurrencyMention> ExtractedFinancials::category(CostCategory category) const {
    const auto it = cost_breakdown.named.find(category);
    if (it == cost_breakdown.named.end() || it->second >= currencies.size()) {
        return std::nullopt;
    }
    return currencies[it->second];
}

std::vector<CurrencyMention> ExtractedFinancials::other_costs() const {
    std::vector<CurrencyMention> out;
    out.reserve(cost_breakdown.other.size());
    for (std::size_t idx : cost_breakdown.other) {
        if (idx < currencies.size()) {
            out.push_back(currencies[idx]);
        }
    }
    return out;
}

}  // namespace fdx
