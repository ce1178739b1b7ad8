#pragma once

/// @file include/fdx/types.hpp
/// @brief Shared value types for the FDX financial extraction engine.
///
/// Every module includes this file. It defines the closed currency and cost
/// category sets, the per-occurrence `CurrencyMention`, and the engine's
/// complete output `ExtractedFinancials`.
///
/// References between parts of `ExtractedFinancials` are indices into
/// `currencies`, so a result can be copied or moved freely without dangling.

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdx {

// ─── Currency codes ───────────────────────────────────────────────────────────

/// Closed set of recognised currencies.
enum class CurrencyCode {
    KGS,  ///< Kyrgyz som
    RUB,  ///< Russian rouble
    USD,  ///< US dollar (reference currency)
    EUR,  ///< Euro
    KZT,  ///< Kazakh tenge
    UZS,  ///< Uzbek sum
    TJS,  ///< Tajik somoni
    UAH,  ///< Ukrainian hryvnia
};

static constexpr std::size_t CURRENCY_COUNT = 8;

/// All codes in declaration order.
static constexpr std::array<CurrencyCode, CURRENCY_COUNT> ALL_CURRENCIES = {
    CurrencyCode::KGS, CurrencyCode::RUB, CurrencyCode::USD, CurrencyCode::EUR,
    CurrencyCode::KZT, CurrencyCode::UZS, CurrencyCode::TJS, CurrencyCode::UAH,
};

/// ISO 4217 code, e.g. "RUB".
[[nodiscard]] std::string_view to_string(CurrencyCode code) noexcept;

/// Parse an ISO 4217 code (case-insensitive ASCII). `nullopt` if unknown.
[[nodiscard]] std::optional<CurrencyCode>
parse_currency_code(std::string_view text) noexcept;

/// Primary display symbol (UTF-8), e.g. "₽" or "сом".
[[nodiscard]] std::string_view default_symbol(CurrencyCode code) noexcept;

/// Display name (UTF-8), e.g. "Российский рубль".
[[nodiscard]] std::string_view default_name(CurrencyCode code) noexcept;

// ─── Document kinds ───────────────────────────────────────────────────────────

/// What a document is, as far as locating its budget goes. A terms of
/// reference states the planned budget; a commercial proposal states the
/// offered price.
enum class DocumentKind {
    General,
    TermsOfReference,
    Proposal,
};

[[nodiscard]] std::string_view to_string(DocumentKind kind) noexcept;

// ─── Cost categories ──────────────────────────────────────────────────────────

/// Fixed set of named cost categories. The `other` bucket is not a member.
enum class CostCategory {
    Development,
    Infrastructure,
    Support,
    Testing,
    Deployment,
    ProjectManagement,
    Design,
    Documentation,
};

static constexpr std::size_t CATEGORY_COUNT = 8;

/// Categories in processing order.
static constexpr std::array<CostCategory, CATEGORY_COUNT> ALL_CATEGORIES = {
    CostCategory::Development,       CostCategory::Infrastructure,
    CostCategory::Support,           CostCategory::Testing,
    CostCategory::Deployment,        CostCategory::ProjectManagement,
    CostCategory::Design,            CostCategory::Documentation,
};

/// Snake-case key, e.g. "project_management".
[[nodiscard]] std::string_view to_string(CostCategory category) noexcept;

// ─── CurrencyMention ──────────────────────────────────────────────────────────

/// One recognised currency + amount occurrence.
struct CurrencyMention {
    CurrencyCode code;          ///< Recognised currency
    std::string  symbol;        ///< Display symbol for `code`
    std::string  name;          ///< Display name for `code`
    double       amount;        ///< Parsed value, always > 0
    std::string  original_text; ///< Exact matched substring, trimmed (UTF-8)
    std::size_t  position;      ///< Match start, in code points
    std::size_t  length = 0;    ///< Match length, in code points

    /// Position of the first code point after the match.
    [[nodiscard]] std::size_t end_position() const noexcept;

    friend bool operator==(const CurrencyMention&, const CurrencyMention&) = default;
};

// ─── CostBreakdown ────────────────────────────────────────────────────────────

/// Category assignment, expressed as indices into `ExtractedFinancials::currencies`.
struct CostBreakdown {
    std::map<CostCategory, std::size_t> named;  ///< At most one mention per category
    std::vector<std::size_t>            other;  ///< Keyword matches that lost, by position

    [[nodiscard]] bool empty() const noexcept { return named.empty() && other.empty(); }

    friend bool operator==(const CostBreakdown&, const CostBreakdown&) = default;
};

// ─── ExtractedFinancials ──────────────────────────────────────────────────────

/// The engine's complete output for one document.
struct ExtractedFinancials {
    std::optional<std::size_t>   total_budget;     ///< Index into `currencies`
    std::vector<CurrencyMention> currencies;       ///< Sorted by position, deduplicated
    CostBreakdown                cost_breakdown;
    std::vector<std::string>     payment_terms;    ///< ≤ 10, mutually non-similar
    std::vector<std::string>     financial_notes;  ///< ≤ 15, mutually non-similar

    /// The budget mention, if one was identified.
    [[nodiscard]] std::optional<CurrencyMention> budget() const;

    /// The mention assigned to `category`, if any.
    [[nodiscard]] std::optional<CurrencyMention> category(CostCategory category) const;

    /// Mentions in the `other` bucket, in position order.
    [[nodiscard]] std::vector<CurrencyMention> other_costs() const;

    friend bool operator==(const ExtractedFinancials&, const ExtractedFinancials&) = default;
};

}  // namespace fdx
