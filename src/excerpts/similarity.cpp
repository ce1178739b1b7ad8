/// @file src/excerpts/similarity.cpp
/// @brief Levenshtein distance and normalised string similarity.

#include "fdx/excerpts.hpp"
#include "fdx/text.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace fdx::excerpt {

std::size_t levenshtein(std::wstring_view a, std::wstring_view b) {
    // Keep the shorter string on the column axis.
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    if (b.empty()) {
        return a.size();
    }

    std::vector<std::size_t> prev(b.size() + 1);
    std::vector<std::size_t> curr(b.size() + 1);
    std::iota(prev.begin(), prev.end(), std::size_t{0});

    for (std::size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double similarity(std::wstring_view a, std::wstring_view b) {
    const std::wstring fa = text::fold_for_matching(a);
    const std::wstring fb = text::fold_for_matching(b);
    const std::size_t longer = std::max(fa.size(), fb.size());
    if (longer == 0) {
        return 1.0;
    }
    const std::size_t dist = levenshtein(fa, fb);
    return static_cast<double>(longer - dist) / static_cast<double>(longer);
}

double similarity(std::string_view a, std::string_view b) {
    const auto wa = text::decode_utf8(a);
    const auto wb = text::decode_utf8(b);
    return similarity(wa ? std::wstring_view(*wa) : std::wstring_view{},
                      wb ? std::wstring_view(*wb) : std::wstring_view{});
}

}  // namespace fdx::excerpt
