#pragma once

/// @file include/fdx/excerpts.hpp
/// @brief Payment-term and financial-note excerpts with fuzzy deduplication.
///
/// # Module: Payment-Terms & Notes Extractor
///
/// ## Responsibility
/// Run a family of regex patterns over the folded document, slice the
/// original text at each match, normalise whitespace and keep the excerpt if
///   - its length lies strictly between `min_length` and `max_length`, and
///   - its similarity to every excerpt already kept is ≤ `similarity_cutoff`.
/// Excerpts are kept in discovery order (pattern by pattern) up to `max_count`.
///
/// ## Similarity
///     similarity(a, b) = (|longer| − levenshtein(longer, shorter)) / |longer|
/// computed on folded code points. Two empty strings have similarity 1.

#include "fdx/constants.hpp"

#include <cstddef>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fdx::excerpt {

// ─── Similarity ───────────────────────────────────────────────────────────────

/// Edit distance (insert, delete, substitute; unit costs).
/// O(|a|·|b|) time, O(min(|a|, |b|)) memory.
[[nodiscard]] std::size_t levenshtein(std::wstring_view a, std::wstring_view b);

/// Normalised similarity in [0, 1] of two strings, folded before comparison.
[[nodiscard]] double similarity(std::wstring_view a, std::wstring_view b);

/// UTF-8 convenience overload. Malformed input compares as empty.
[[nodiscard]] double similarity(std::string_view a, std::string_view b);

// ─── Extraction ───────────────────────────────────────────────────────────────

struct ExcerptConfig {
    std::size_t min_length;         ///< Exclusive lower bound, code points
    std::size_t max_length;         ///< Exclusive upper bound, code points
    std::size_t max_count;
    double      similarity_cutoff;  ///< Reject when similarity exceeds this

    [[nodiscard]] static constexpr ExcerptConfig payment_terms() noexcept {
        return {constants::TERM_MIN_LENGTH, constants::TERM_MAX_LENGTH,
                constants::TERM_MAX_COUNT,  constants::TERM_SIMILARITY_CUTOFF};
    }

    [[nodiscard]] static constexpr ExcerptConfig financial_notes() noexcept {
        return {constants::NOTE_MIN_LENGTH, constants::NOTE_MAX_LENGTH,
                constants::NOTE_MAX_COUNT,  constants::NOTE_SIMILARITY_CUTOFF};
    }
};

/// Collect excerpts matched by `patterns`.
///
/// # Arguments
/// * `original` — decoded document
/// * `folded`   — its folded form (same length)
///
/// # Returns
/// UTF-8 excerpts. Empty if the two views differ in length.
[[nodiscard]] std::vector<std::string>
extract_excerpts(std::wstring_view original,
                 std::wstring_view folded,
                 std::span<const std::wregex> patterns,
                 const ExcerptConfig& config);

}  // namespace fdx::excerpt
