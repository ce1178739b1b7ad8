/// @file src/scanner/deduplicator.cpp
/// @brief Near-duplicate mention suppression.

#include "fdx/scanner.hpp"

#include <algorithm>
#include <cmath>

namespace fdx::scan {

bool is_duplicate(const CurrencyMention& a,
                  const CurrencyMention& b,
                  const DedupConfig& config) noexcept {
    if (a.code != b.code) {
        return false;
    }
    const std::size_t gap = a.position > b.position ? a.position - b.position
                                                    : b.position - a.position;
    if (gap >= config.position_window) {
        return false;
    }
    const double larger = std::max(a.amount, b.amount);
    return std::abs(a.amount - b.amount) < config.amount_tolerance * larger;
}

std::vector<CurrencyMention>
deduplicate(std::span<const CurrencyMention> mentions, const DedupConfig& config) {
    std::vector<CurrencyMention> kept;
    kept.reserve(mentions.size());

    for (const auto& candidate : mentions) {
        // Every kept mention is compared, not only the last one, so that the
        // output contains no duplicate pair and a second pass is a no-op.
        const bool dup = std::any_of(kept.begin(), kept.end(),
            [&](const CurrencyMention& k) { return is_duplicate(k, candidate, config); });
        if (!dup) {
            kept.push_back(candidate);
        }
    }
    return kept;
}

}  // namespace fdx::scan
