#pragma once

/// @file include/fdx/scanner.hpp
/// @brief Currency mention scanning and near-duplicate suppression.
///
/// # Module: Currency Mention Scanner
///
/// ## Responsibility
/// Find every currency-tagged amount in a document. Each currency pattern in
/// the `PatternTable` runs over the folded text in table order; the start of
/// every accepted match claims a window of ±`claim_radius` code points so that
/// a later currency cannot re-read the same span ("5000 сомони" is not also
/// read as som). Matches whose amount does not parse to a positive value are
/// skipped and claim nothing.
///
/// # Module: Mention Deduplicator
///
/// Two mentions are duplicates when they share a currency code, their
/// amounts differ by less than `amount_tolerance` of the larger amount, and
/// their positions are closer than `position_window`. The first in position
/// order survives. Deduplication is idempotent.
///
/// ## Guarantees
/// - Returned mentions have `amount > 0` and are sorted by position
/// - No function throws on any input text

#include "fdx/constants.hpp"
#include "fdx/patterns.hpp"
#include "fdx/types.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace fdx::scan {

// ─── Configuration ────────────────────────────────────────────────────────────

struct ScanConfig {
    /// Radius of the window claimed around each accepted match start.
    std::size_t claim_radius = constants::CLAIM_RADIUS;
};

struct DedupConfig {
    /// Relative tolerance on the larger of the two amounts.
    double amount_tolerance = constants::DEDUP_AMOUNT_TOLERANCE;

    /// Position distance below which two mentions may be duplicates.
    std::size_t position_window = constants::DEDUP_POSITION_WINDOW;
};

// ─── ClaimSet ─────────────────────────────────────────────────────────────────

/// Incrementally built set of closed offset intervals.
class ClaimSet {
public:
    /// Claim [center − radius, center + radius], clamped at 0.
    void claim(std::size_t center, std::size_t radius);

    /// True if `pos` lies in any claimed interval.
    [[nodiscard]] bool contains(std::size_t pos) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return intervals_.size(); }

private:
    std::vector<std::pair<std::size_t, std::size_t>> intervals_;
};

// ─── CurrencyScanner ──────────────────────────────────────────────────────────

class CurrencyScanner {
public:
    explicit CurrencyScanner(std::shared_ptr<const PatternTable> table,
                             ScanConfig config = ScanConfig{});

    /// Scan a document.
    ///
    /// # Arguments
    /// * `original` — decoded document, used for `original_text`
    /// * `folded`   — `text::fold_for_matching(original)`; same length
    ///
    /// # Returns
    /// Raw mentions sorted by position (not yet deduplicated). Empty if the
    /// two views differ in length.
    [[nodiscard]] std::vector<CurrencyMention>
    scan(std::wstring_view original, std::wstring_view folded) const;

    /// Decode and fold `utf8`, then scan. Empty for malformed UTF-8.
    [[nodiscard]] std::vector<CurrencyMention> scan(std::string_view utf8) const;

private:
    std::shared_ptr<const PatternTable> table_;
    ScanConfig                          config_;
};

// ─── Deduplication ────────────────────────────────────────────────────────────

/// Duplicate test for two mentions (symmetric).
[[nodiscard]] bool is_duplicate(const CurrencyMention& a,
                                const CurrencyMention& b,
                                const DedupConfig& config = DedupConfig{}) noexcept;

/// Keep the first of every group of duplicates.
///
/// # Arguments
/// * `mentions` — sorted by position
[[nodiscard]] std::vector<CurrencyMention>
deduplicate(std::span<const CurrencyMention> mentions,
            const DedupConfig& config = DedupConfig{});

}  // namespace fdx::scan
