/// @file src/excerpts/excerpt_extractor.cpp
/// @brief Regex-driven excerpt collection with length and similarity filters.

#include "fdx/excerpts.hpp"
#include "fdx/text.hpp"

#include <algorithm>

namespace fdx::excerpt {

std::vector<std::string>
extract_excerpts(std::wstring_view original,
                 std::wstring_view folded,
                 std::span<const std::wregex> patterns,
                 const ExcerptConfig& config) {
    std::vector<std::string> out;
    if (original.size() != folded.size() || folded.empty() || config.max_count == 0) {
        return out;
    }

    std::vector<std::wstring> kept;  // folded, for comparison
    const wchar_t* begin = folded.data();
    const wchar_t* end   = folded.data() + folded.size();

    for (const auto& pattern : patterns) {
        for (std::wcregex_iterator it(begin, end, pattern), last; it != last; ++it) {
            const auto pos = static_cast<std::size_t>(it->position(0));
            const auto len = static_cast<std::size_t>(it->length(0));

            std::wstring excerpt = text::collapse_whitespace(original.substr(pos, len));
            if (excerpt.size() <= config.min_length || excerpt.size() >= config.max_length) {
                continue;
            }

            std::wstring folded_excerpt = text::fold_for_matching(excerpt);
            const bool similar = std::any_of(kept.begin(), kept.end(),
                [&](const std::wstring& k) {
                    return similarity(k, folded_excerpt) > config.similarity_cutoff;
                });
            if (similar) {
                continue;
            }

            out.push_back(text::encode_utf8(excerpt));
            kept.push_back(std::move(folded_excerpt));
            if (out.size() >= config.max_count) {
                return out;
            }
        }
    }
    return out;
}

}  // namespace fdx::excerpt
