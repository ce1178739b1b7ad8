/// @file src/scanner/currency_scanner.cpp
/// @brief Pattern-table driven currency mention scanner.

#include "fdx/scanner.hpp"
#include "fdx/amount_parser.hpp"
#include "fdx/text.hpp"

#include <algorithm>
#include <regex>

namespace fdx::scan {

// ─── ClaimSet ─────────────────────────────────────────────────────────────────

void ClaimSet::claim(std::size_t center, std::size_t radius) {
    const std::size_t lo = center > radius ? center - radius : 0;
    intervals_.emplace_back(lo, center + radius);
}

bool ClaimSet::contains(std::size_t pos) const noexcept {
    return std::any_of(intervals_.begin(), intervals_.end(), [pos](const auto& iv) {
        return pos >= iv.first && pos <= iv.second;
    });
}

namespace {

bool is_ascii_digit(wchar_t ch) noexcept {
    return ch >= L'0' && ch <= L'9';
}

/// True if a match at `pos` starts in the middle of a digit run. The amount
/// pattern caps its digit count, so the tail of an over-long number would
/// otherwise be read as an amount of its own.
bool continues_digit_run(std::wstring_view folded, std::size_t pos) noexcept {
    return pos > 0 && is_ascii_digit(folded[pos]) && is_ascii_digit(folded[pos - 1]);
}

}  // namespace

// ─── CurrencyScanner ──────────────────────────────────────────────────────────

CurrencyScanner::CurrencyScanner(std::shared_ptr<const PatternTable> table,
                                 ScanConfig config)
    : table_(std::move(table))
    , config_(config)
{}

std::vector<CurrencyMention>
CurrencyScanner::scan(std::wstring_view original, std::wstring_view folded) const {
    std::vector<CurrencyMention> mentions;
    if (!table_ || original.size() != folded.size() || folded.empty()) {
        return mentions;
    }

    ClaimSet claims;
    const wchar_t* begin = folded.data();
    const wchar_t* end   = folded.data() + folded.size();

    for (const auto& currency : table_->currencies()) {
        for (std::wcregex_iterator it(begin, end, currency.pattern), last; it != last; ++it) {
            const auto& m = *it;
            const auto pos = static_cast<std::size_t>(m.position(0));
            const auto len = static_cast<std::size_t>(m.length(0));
            if (len == 0 || claims.contains(pos) || continues_digit_run(folded, pos)) {
                continue;
            }

            const std::wstring_view matched = original.substr(pos, len);
            const auto amount = parse::parse_amount(matched);
            if (!amount || *amount <= 0.0) {
                continue;
            }

            const std::wstring trimmed = text::collapse_whitespace(matched);
            mentions.push_back(CurrencyMention{
                .code          = currency.code,
                .symbol        = currency.symbol,
                .name          = currency.name,
                .amount        = *amount,
                .original_text = text::encode_utf8(trimmed),
                .position      = pos,
                .length        = len,
            });
            claims.claim(pos, config_.claim_radius);
        }
    }

    std::stable_sort(mentions.begin(), mentions.end(),
                     [](const CurrencyMention& a, const CurrencyMention& b) {
                         return a.position < b.position;
                     });
    return mentions;
}

std::vector<CurrencyMention> CurrencyScanner::scan(std::string_view utf8) const {
    const auto decoded = text::decode_utf8(utf8);
    if (!decoded) {
        return {};
    }
    const std::wstring folded = text::fold_for_matching(*decoded);
    return scan(*decoded, folded);
}

}  // namespace fdx::scan
