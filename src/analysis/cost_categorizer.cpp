/// @file src/analysis/cost_categorizer.cpp
/// @brief Keyword-proximity assignment of mentions to cost categories.

#include "fdx/analysis.hpp"
#include "fdx/text.hpp"

#include <algorithm>

namespace fdx::analysis {

namespace {

/// Strictly-better ordering: closer, then larger amount.
bool beats(const Nominee& challenger, const Nominee& holder,
           std::span<const CurrencyMention> mentions) noexcept {
    if (challenger.distance != holder.distance) {
        return challenger.distance < holder.distance;
    }
    return mentions[challenger.index].amount > mentions[holder.index].amount;
}

}  // namespace

CostBreakdown
categorize_costs(std::wstring_view folded,
                 std::span<const CurrencyMention> mentions,
                 const PatternTable& table,
                 const ProximityConfig& config) {
    CostBreakdown breakdown;
    if (mentions.empty()) {
        return breakdown;
    }

    std::vector<bool> taken(mentions.size(), false);
    std::vector<bool> lost(mentions.size(), false);

    for (const auto& category : table.categories()) {
        std::optional<Nominee> holder;

        for (const auto& keyword : category.keywords) {
            for (std::size_t start : text::find_whole_word(folded, keyword)) {
                const KeywordHit hit{.start = start, .end = start + keyword.size()};
                auto nominee = nearest_mention(mentions, hit, config.category_window, &taken);
                if (!nominee) {
                    continue;
                }
                if (!holder) {
                    holder = nominee;
                } else if (nominee->index == holder->index) {
                    holder->distance = std::min(holder->distance, nominee->distance);
                } else if (beats(*nominee, *holder, mentions)) {
                    lost[holder->index] = true;
                    holder = nominee;
                } else {
                    lost[nominee->index] = true;
                }
            }
        }

        if (holder) {
            breakdown.named[category.category] = holder->index;
            taken[holder->index] = true;
        }
    }

    for (std::size_t i = 0; i < mentions.size(); ++i) {
        if (lost[i] && !taken[i]) {
            breakdown.other.push_back(i);
        }
    }
    return breakdown;
}

}  // namespace fdx::analysis
