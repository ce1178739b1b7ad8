/// @file src/parser/amount_parser.cpp
/// @brief Separator inference and conversion for currency amounts.

#include "fdx/amount_parser.hpp"
#include "fdx/text.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace fdx::parse {

namespace {

[[nodiscard]] bool is_digit(wchar_t ch) noexcept {
    return ch >= L'0' && ch <= L'9';
}

/// Remove every occurrence of `c` from `s`.
[[nodiscard]] std::string strip(std::string s, char c) {
    s.erase(std::remove(s.begin(), s.end(), c), s.end());
    return s;
}

/// Extract the first digit-led run of digits / spaces / ',' / '.', with the
/// whitespace already dropped (rule 1).
[[nodiscard]] std::string numeric_part(std::wstring_view text) {
    std::string out;
    const auto first = std::find_if(text.begin(), text.end(), is_digit);
    for (auto it = first; it != text.end(); ++it) {
        const wchar_t ch = *it;
        if (is_digit(ch) || ch == L',' || ch == L'.') {
            out.push_back(static_cast<char>(ch));
        } else if (!text::is_space(ch)) {
            break;
        }
    }
    return out;
}

}  // namespace

// ─── canonicalize_amount ──────────────────────────────────────────────────────

std::string canonicalize_amount(std::wstring_view text) {
    std::string s = numeric_part(text);
    if (s.empty()) {
        return s;
    }

    // Rules 2 and 3: decide the comma's role from the last comma.
    const auto last_comma = s.rfind(',');
    if (last_comma != std::string::npos) {
        const std::string tail = s.substr(last_comma + 1);
        if (tail.size() <= 2) {
            std::string head = strip(strip(s.substr(0, last_comma), '.'), ',');
            s = head + "." + tail;
        } else {
            s = strip(std::move(s), ',');
        }
    }

    // Rule 4: dots left over. After collapsing to the last dot, that dot is
    // still a grouping separator when more than two digits follow it.
    const auto dots = static_cast<std::size_t>(std::count(s.begin(), s.end(), '.'));
    if (dots > 1) {
        const auto last_dot = s.rfind('.');
        s = strip(s.substr(0, last_dot), '.') + s.substr(last_dot);
    }
    const auto dot = s.find('.');
    if (dot != std::string::npos && s.size() - dot - 1 > 2) {
        s.erase(dot, 1);
    }
    return s;
}

// ─── parse_amount ─────────────────────────────────────────────────────────────

std::optional<double> parse_amount(std::wstring_view text) noexcept {
    const std::string canonical = canonicalize_amount(text);
    if (canonical.empty() || canonical.front() == '.') {
        return std::nullopt;
    }

    double value = 0.0;
    const char* begin = canonical.data();
    const char* end   = canonical.data() + canonical.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value, std::chars_format::fixed);
    if (ec != std::errc{} || ptr == begin) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_amount(std::string_view text) noexcept {
    const auto decoded = text::decode_utf8(text);
    if (!decoded) {
        return std::nullopt;
    }
    return parse_amount(std::wstring_view{*decoded});
}

}  // namespace fdx::parse
