#pragma once

/// @file include/fdx/patterns.hpp
/// @brief Currency, keyword and excerpt pattern tables.
///
/// # Module: Pattern Table
///
/// ## Responsibility
/// Hold every piece of language-specific recognition data as plain records so
/// that adding a currency, a category synonym or an excerpt pattern never
/// touches control flow:
///   - `PatternSpec`  — editable source data (UTF-8 strings, regex fragments)
///   - `PatternTable` — the compiled, immutable form used by the engine
///
/// ## Matching model
/// Text is folded with `text::fold_for_matching` before any pattern runs, so
/// regex fragments and keywords are written in lowercase. Regex fragments are
/// *not* folded (that would corrupt escapes such as `\S`); keywords are.
///
/// Each currency pattern has the shape
///
///     (?:PREFIX)GAP AMOUNT | AMOUNT GAP(?:SUFFIX)
///
/// where AMOUNT is `AMOUNT_FRAGMENT` and GAP is `SYMBOL_GAP_FRAGMENT` below.
/// Fragments supplied in a `PatternSpec` must keep their repetitions bounded
/// in the same way.
///
/// ## Guarantees
/// - `PatternTable` is immutable after construction and safe to share across
///   threads
/// - `compile` never throws: a malformed fragment yields `nullopt`

#include "fdx/types.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace fdx {

/// One grouped amount ("1 000 000,50", "1.000", "1,234.56") or one ungrouped
/// amount with up to two decimals ("1000000", "12,5").
///
/// Every repetition is bounded: std::regex backtracks recursively, one stack
/// frame per repeated element, so an open-ended `\d+` or `\s*` overflows the
/// stack on long digit or whitespace runs.
inline constexpr std::string_view AMOUNT_FRAGMENT =
    R"((?:\d{1,3}(?:[ ,.]\d{3}){1,5}(?:[.,]\d{1,2})?|\d{1,15}(?:[.,]\d{1,2})?))";

/// Whitespace allowed between an amount and its currency token.
inline constexpr std::string_view SYMBOL_GAP_FRAGMENT = R"(\s{0,3})";

// ─── Source data ──────────────────────────────────────────────────────────────

/// Recognition data for one currency.
struct CurrencyPatternSpec {
    CurrencyCode             code;
    std::string              symbol;         ///< Display symbol copied into mentions
    std::string              name;           ///< Display name copied into mentions
    std::vector<std::string> prefix_tokens;  ///< Regex fragments before the amount
    std::vector<std::string> suffix_tokens;  ///< Regex fragments after the amount
};

/// Keyword list for one cost category.
struct CategoryKeywordSpec {
    CostCategory             category;
    std::vector<std::string> keywords;       ///< Plain phrases, any case
};

/// Complete, editable recognition data.
struct PatternSpec {
    std::vector<CurrencyPatternSpec> currencies;          ///< Scan order: earlier wins
    std::vector<std::string>         budget_keywords;     ///< Priority order
    std::vector<std::string>         reference_budget_leads;  ///< Regex fragments, terms of reference
    std::vector<std::string>         proposal_budget_leads;   ///< Regex fragments, commercial proposals
    std::vector<CategoryKeywordSpec> categories;          ///< Processing order
    std::vector<std::string>         payment_term_patterns;
    std::vector<std::string>         note_patterns;

    /// Built-in Russian/English data for KGS, RUB, USD, EUR, KZT, UZS, TJS, UAH.
    [[nodiscard]] static PatternSpec builtin();
};

// ─── Compiled table ───────────────────────────────────────────────────────────

/// A currency with its compiled amount+symbol pattern.
struct CompiledCurrency {
    CurrencyCode code;
    std::string  symbol;
    std::string  name;
    std::wregex  pattern;
};

/// A category with its folded keywords.
struct CompiledCategory {
    CostCategory              category;
    std::vector<std::wstring> keywords;
};

/// Immutable compiled pattern data shared by all extraction calls.
class PatternTable {
public:
    /// Compile `spec`. Returns `nullopt` if any regex fragment is malformed
    /// or a keyword is not valid UTF-8.
    [[nodiscard]] static std::optional<PatternTable> compile(const PatternSpec& spec);

    /// The process-wide table compiled from `PatternSpec::builtin()`,
    /// constructed on first use.
    [[nodiscard]] static std::shared_ptr<const PatternTable> builtin();

    /// Assemble the full regex source for one currency entry.
    [[nodiscard]] static std::string currency_regex_source(const CurrencyPatternSpec& spec);

    [[nodiscard]] const std::vector<CompiledCurrency>& currencies() const noexcept {
        return currencies_;
    }
    [[nodiscard]] const std::vector<std::wstring>& budget_keywords() const noexcept {
        return budget_keywords_;
    }
    /// Budget lead-in patterns for `kind`, in priority order. Empty for
    /// `DocumentKind::General`.
    [[nodiscard]] const std::vector<std::wregex>& budget_leads(DocumentKind kind) const noexcept;

    [[nodiscard]] const std::vector<CompiledCategory>& categories() const noexcept {
        return categories_;
    }
    [[nodiscard]] const std::vector<std::wregex>& payment_term_patterns() const noexcept {
        return payment_term_patterns_;
    }
    [[nodiscard]] const std::vector<std::wregex>& note_patterns() const noexcept {
        return note_patterns_;
    }

    /// Look up the compiled entry for `code`; `nullopt` if the table lacks it.
    [[nodiscard]] std::optional<CompiledCurrency> find(CurrencyCode code) const;

private:
    PatternTable() = default;

    std::vector<CompiledCurrency> currencies_;
    std::vector<std::wstring>     budget_keywords_;
    std::vector<std::wregex>      reference_budget_leads_;
    std::vector<std::wregex>      proposal_budget_leads_;
    std::vector<CompiledCategory> categories_;
    std::vector<std::wregex>      payment_term_patterns_;
    std::vector<std::wregex>      note_patterns_;
};

}  // namespace fdx
