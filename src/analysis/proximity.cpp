/// @file src/analysis/proximity.cpp
/// @brief Keyword-to-mention distance and nearest-mention search.

#include "fdx/analysis.hpp"

namespace fdx::analysis {

std::size_t keyword_distance(const KeywordHit& hit,
                             const CurrencyMention& mention) noexcept {
    if (mention.position >= hit.start) {
        return mention.position >= hit.end ? mention.position - hit.end : 0;
    }
    const std::size_t mention_end = mention.end_position();
    return mention_end < hit.start ? hit.start - mention_end : 0;
}

std::optional<Nominee>
nearest_mention(std::span<const CurrencyMention> mentions,
                const KeywordHit& hit,
                std::size_t window,
                const std::vector<bool>* taken) {
    std::optional<Nominee> best;

    for (std::size_t i = 0; i < mentions.size(); ++i) {
        if (taken && i < taken->size() && (*taken)[i]) {
            continue;
        }
        const std::size_t d = keyword_distance(hit, mentions[i]);
        if (d >= window) {
            continue;
        }
        // Ties go to the later mention, i.e. the one following the keyword.
        if (!best || d <= best->distance) {
            best = Nominee{.index = i, .distance = d};
        }
    }
    return best;
}

std::optional<std::size_t>
largest_mention(std::span<const CurrencyMention> mentions) noexcept {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < mentions.size(); ++i) {
        if (!best || mentions[i].amount > mentions[*best].amount) {
            best = i;
        }
    }
    return best;
}

}  // namespace fdx::analysis
