/// @file src/analysis/budget_identifier.cpp
/// @brief Total-budget selection by keyword priority with a largest-amount fallback.

#include "fdx/analysis.hpp"
#include "fdx/text.hpp"

#include <regex>

namespace fdx::analysis {

namespace {

/// Clause punctuation that ends the search after a budget lead-in.
constexpr std::wstring_view CLAUSE_END = L".;!?";

/// First mention starting inside [begin, end).
std::optional<std::size_t>
first_mention_in(std::span<const CurrencyMention> mentions,
                 std::size_t begin, std::size_t end) noexcept {
    for (std::size_t i = 0; i < mentions.size(); ++i) {
        if (mentions[i].position >= begin && mentions[i].position < end) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::size_t>
identify_budget(std::wstring_view folded,
                std::span<const CurrencyMention> mentions,
                const PatternTable& table,
                const ProximityConfig& config) {
    if (mentions.empty()) {
        return std::nullopt;
    }

    for (const auto& keyword : table.budget_keywords()) {
        for (std::size_t start : text::find_all(folded, keyword)) {
            const KeywordHit hit{.start = start, .end = start + keyword.size()};
            if (auto nominee = nearest_mention(mentions, hit, config.budget_window)) {
                return nominee->index;
            }
        }
    }

    return largest_mention(mentions);
}

std::optional<std::size_t>
identify_document_budget(std::wstring_view folded,
                         std::span<const CurrencyMention> mentions,
                         const PatternTable& table,
                         DocumentKind kind,
                         const ProximityConfig& config) {
    if (mentions.empty()) {
        return std::nullopt;
    }

    const wchar_t* begin = folded.data();
    const wchar_t* end   = folded.data() + folded.size();
    for (const auto& lead : table.budget_leads(kind)) {
        for (std::wcregex_iterator it(begin, end, lead), last; it != last; ++it) {
            const auto clause_start = static_cast<std::size_t>(it->position(0) + it->length(0));
            std::size_t clause_end  = folded.find_first_of(CLAUSE_END, clause_start);
            if (clause_end == std::wstring_view::npos) {
                clause_end = folded.size();
            }
            if (auto index = first_mention_in(mentions, clause_start, clause_end)) {
                return index;
            }
        }
    }

    return identify_budget(folded, mentions, table, config);
}

}  // namespace fdx::analysis
