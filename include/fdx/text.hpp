#pragma once

/// @file include/fdx/text.hpp
/// @brief UTF-8 decoding, case folding and word search over code points.
///
/// # Module: Text utilities
///
/// ## Responsibility
/// Proposal text arrives as UTF-8 bytes and mixes Latin and Cyrillic script.
/// Every downstream component works on a `std::wstring` of code points so
/// that positions are character offsets and `std::wregex` can match Cyrillic
/// symbols directly.
///
/// ## Folding
/// `fold_for_matching` maps each code point to exactly one code point, so a
/// folded string has the same length as its source and offsets carry over:
///   - ASCII and Latin-1 uppercase  → lowercase
///   - Cyrillic А–Я, Ѐ–Џ, Ґ         → lowercase
///   - U+00A0, U+2007, U+2009, U+202F → U+0020
///
/// ## Guarantees
/// - `decode_utf8` is strict: overlong forms, surrogates, truncated
///   sequences and values above U+10FFFF are rejected
/// - No function throws

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdx::text {

static_assert(sizeof(wchar_t) == 4, "fdx requires a 32-bit wchar_t");

/// Location and cause of the first malformed UTF-8 sequence.
struct DecodeError {
    std::size_t      byte_offset;  ///< Offset of the offending lead byte
    std::string_view reason;       ///< Static description
};

/// Decode UTF-8 into code points. `nullopt` if the input is malformed.
[[nodiscard]] std::optional<std::wstring>
decode_utf8(std::string_view bytes) noexcept;

/// Report the first malformed sequence, or `nullopt` if `bytes` is valid.
[[nodiscard]] std::optional<DecodeError>
find_utf8_error(std::string_view bytes) noexcept;

/// Encode code points as UTF-8.
[[nodiscard]] std::string encode_utf8(std::wstring_view text);

/// Length of a UTF-8 string in code points. Malformed bytes count as one each.
[[nodiscard]] std::size_t code_point_length(std::string_view bytes) noexcept;

/// Fold a single code point (see file comment).
[[nodiscard]] wchar_t fold_char(wchar_t ch) noexcept;

/// Length-preserving case and space folding.
[[nodiscard]] std::wstring fold_for_matching(std::wstring_view text);

/// Convenience: decode a UTF-8 literal and fold it. Malformed input yields "".
[[nodiscard]] std::wstring fold_utf8(std::string_view bytes);

/// Whitespace test covering ASCII, NBSP and the Unicode space separators.
[[nodiscard]] bool is_space(wchar_t ch) noexcept;

/// Letter, digit or underscore in the ASCII, Latin-1 or Cyrillic ranges.
[[nodiscard]] bool is_word_char(wchar_t ch) noexcept;

/// Replace every whitespace run with one space and trim both ends.
[[nodiscard]] std::wstring collapse_whitespace(std::wstring_view text);

/// Start offsets of every occurrence of `needle` in `haystack`, including
/// occurrences inside longer words. Both arguments must already be folded.
[[nodiscard]] std::vector<std::size_t>
find_all(std::wstring_view haystack, std::wstring_view needle);

/// Start offsets of every whole-word occurrence of `needle` in `haystack`.
///
/// Both arguments must already be folded. A match is whole-word when the
/// code points on either side (if any) are not word characters.
[[nodiscard]] std::vector<std::size_t>
find_whole_word(std::wstring_view haystack, std::wstring_view needle);

}  // namespace fdx::text
