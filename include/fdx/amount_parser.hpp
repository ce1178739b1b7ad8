#pragma once

/// @file include/fdx/amount_parser.hpp
/// @brief Locale-ambiguous numeric amount parsing.
///
/// # Module: Amount Parser
///
/// ## Responsibility
/// Turn the numeric part of a matched currency snippet into a value. Proposal
/// documents mix Russian ("1 000,50"), European ("1.000,50") and English
/// ("1,000.50") conventions, so the role of each separator is inferred:
///
///   1. Whitespace is removed.
///   2. If the part after the last comma has ≤ 2 characters, that comma is the
///      decimal mark; dots and commas before it are grouping separators.
///   3. Otherwise commas are grouping separators.
///   4. If several dots remain, all but the last group digits; a single dot
///      followed by more than two digits also groups digits.
///
/// | input        | value      |
/// |--------------|------------|
/// | "1.000,50"   | 1000.50    |
/// | "1,234.56"   | 1234.56    |
/// | "10 000"     | 10000      |
/// | "1.000.000"  | 1000000    |
/// | "12,5"       | 12.5       |
/// | "12,500"     | 12500      |
///
/// The numeric part is the first run starting with a digit and continuing
/// over digits, whitespace, commas and dots, so currency symbols around it
/// ("$1,234.56", "10 000 руб") are ignored.
///
/// ## Guarantees
/// - Never throws; unparseable input yields `nullopt`
/// - A returned value is finite and ≥ 0 (it may be 0; callers filter)

#include <optional>
#include <string>
#include <string_view>

namespace fdx::parse {

/// Parse the first number in a UTF-8 snippet.
/// `nullopt` if there is no digit, the text is not valid UTF-8, or the
/// canonical form does not parse.
[[nodiscard]] std::optional<double> parse_amount(std::string_view text) noexcept;

/// Parse the first number in a snippet of code points.
[[nodiscard]] std::optional<double> parse_amount(std::wstring_view text) noexcept;

/// Canonical ASCII form ("1000.50") of the first number, before conversion.
/// Exposed for diagnostics and tests. Empty if there is no digit.
[[nodiscard]] std::string canonicalize_amount(std::wstring_view text);

}  // namespace fdx::parse
