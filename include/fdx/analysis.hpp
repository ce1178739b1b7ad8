#pragma once

/// @file include/fdx/analysis.hpp
/// @brief Keyword-proximity analysis: budget identification and cost breakdown.
///
/// # Module: Budget Identifier
///
/// Budget keywords are tried in priority order. For each keyword, its
/// occurrences in the folded text are visited in order, including those
/// inside longer words ("итого" is found in "итоговая"); the first occurrence
/// with a mention inside `budget_window` selects the nearest such mention. If
/// no keyword yields a mention the largest amount wins (first in position
/// order on ties). The budget is always one of the input mentions.
///
/// When the document kind is known, its lead-in patterns run first: the
/// budget is the first mention in the clause after a lead-in ("Бюджет
/// проекта: 1 500 000 руб."), the clause ending at `.`, `;`, `!` or `?`.
///
/// # Module: Cost Breakdown Categorizer
///
/// Categories are processed in table order. Each whole-word keyword
/// occurrence nominates the nearest mention inside `category_window` that no
/// earlier category has taken. A nominee replaces the category's holder only if it is strictly
/// closer, or equally close with a larger amount; the loser goes to `other`.
///
/// ## Proximity
/// A mention starting at or after the keyword is at distance
/// `position − keyword_end` (0 if it overlaps the keyword). A mention
/// before the keyword is at distance `keyword_start − mention_end`. The
/// nearest mention wins in either direction; on equal distance the mention
/// following the keyword wins. Windows are exclusive.

#include "fdx/constants.hpp"
#include "fdx/patterns.hpp"
#include "fdx/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace fdx::analysis {

struct ProximityConfig {
    std::size_t budget_window   = constants::BUDGET_KEYWORD_WINDOW;
    std::size_t category_window = constants::CATEGORY_KEYWORD_WINDOW;
};

/// Span of one keyword occurrence in the folded text.
struct KeywordHit {
    std::size_t start;
    std::size_t end;
};

/// A mention chosen for a keyword, with its proximity distance.
struct Nominee {
    std::size_t index;     ///< Index into the mention list
    std::size_t distance;
};

/// Proximity distance between a keyword occurrence and a mention.
[[nodiscard]] std::size_t keyword_distance(const KeywordHit& hit,
                                           const CurrencyMention& mention) noexcept;

/// Nearest mention to `hit` within `window`, before or after it.
///
/// # Arguments
/// * `mentions` — sorted by position
/// * `taken`    — optional mask (same length as `mentions`); masked entries
///                are skipped
///
/// # Returns
/// `nullopt` if nothing lies inside the window. Ties go to the later mention.
[[nodiscard]] std::optional<Nominee>
nearest_mention(std::span<const CurrencyMention> mentions,
                const KeywordHit& hit,
                std::size_t window,
                const std::vector<bool>* taken = nullptr);

/// Index of the largest amount, first on ties. `nullopt` for an empty list.
[[nodiscard]] std::optional<std::size_t>
largest_mention(std::span<const CurrencyMention> mentions) noexcept;

/// Select the total-budget mention.
///
/// # Arguments
/// * `folded`   — case-folded document text
/// * `mentions` — deduplicated, sorted by position
[[nodiscard]] std::optional<std::size_t>
identify_budget(std::wstring_view folded,
                std::span<const CurrencyMention> mentions,
                const PatternTable& table,
                const ProximityConfig& config = ProximityConfig{});

/// Select the budget of a document of known kind: lead-in clauses for `kind`
/// first, then `identify_budget`. `DocumentKind::General` has no lead-ins.
[[nodiscard]] std::optional<std::size_t>
identify_document_budget(std::wstring_view folded,
                         std::span<const CurrencyMention> mentions,
                         const PatternTable& table,
                         DocumentKind kind,
                         const ProximityConfig& config = ProximityConfig{});

/// Assign mentions to cost categories.
[[nodiscard]] CostBreakdown
categorize_costs(std::wstring_view folded,
                 std::span<const CurrencyMention> mentions,
                 const PatternTable& table,
                 const ProximityConfig& config = ProximityConfig{});

}  // namespace fdx::analysis
