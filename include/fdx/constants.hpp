#pragma once

#include <cstddef>

/// @file include/fdx/constants.hpp
/// @brief Default thresholds for the FDX extraction pipeline.
///
/// Window sizes and tolerances were chosen empirically on a small set of
/// Russian-language commercial proposals. They are exposed as defaults for
/// the runtime configuration structs in `fdx/engine.hpp` and should be
/// recalibrated against a labelled corpus.

namespace fdx::constants {

// ─── Scanner ──────────────────────────────────────────────────────────────────

/// Radius (code points) of the window claimed around an accepted match start.
/// A later pattern match starting inside a claimed window is discarded.
static constexpr std::size_t CLAIM_RADIUS = 10;

// ─── Deduplicator ─────────────────────────────────────────────────────────────

/// Relative amount tolerance for two mentions to count as duplicates.
static constexpr double DEDUP_AMOUNT_TOLERANCE = 0.01;

/// Maximum position distance (exclusive) for two mentions to be duplicates.
static constexpr std::size_t DEDUP_POSITION_WINDOW = 50;

// ─── Proximity ────────────────────────────────────────────────────────────────

/// Maximum distance (exclusive) between a budget keyword and its mention.
static constexpr std::size_t BUDGET_KEYWORD_WINDOW = 200;

/// Maximum distance (exclusive) between a category keyword and its mention.
static constexpr std::size_t CATEGORY_KEYWORD_WINDOW = 150;

// ─── Excerpts ─────────────────────────────────────────────────────────────────

/// Payment-term excerpt length bounds (code points, both exclusive).
static constexpr std::size_t TERM_MIN_LENGTH = 15;
static constexpr std::size_t TERM_MAX_LENGTH = 200;

/// Maximum number of payment-term excerpts retained.
static constexpr std::size_t TERM_MAX_COUNT = 10;

/// Candidate term is rejected if similarity to a kept term exceeds this.
static constexpr double TERM_SIMILARITY_CUTOFF = 0.7;

/// Financial-note excerpt length bounds (code points, both exclusive).
static constexpr std::size_t NOTE_MIN_LENGTH = 20;
static constexpr std::size_t NOTE_MAX_LENGTH = 300;

/// Maximum number of financial-note excerpts retained.
static constexpr std::size_t NOTE_MAX_COUNT = 15;

/// Candidate note is rejected if similarity to a kept note exceeds this.
static constexpr double NOTE_SIMILARITY_CUTOFF = 0.6;

// ─── Validator ────────────────────────────────────────────────────────────────

/// Amounts above this are reported as unrealistic.
static constexpr double UNREALISTIC_AMOUNT_MAX = 1e9;

/// Amounts below this are reported as unrealistic.
static constexpr double UNREALISTIC_AMOUNT_MIN = 0.01;

/// The budget must be at least this fraction of the sum of the other mentions.
static constexpr double BUDGET_PARTS_RATIO = 0.8;

static constexpr int PENALTY_NO_CURRENCIES     = 30;
static constexpr int PENALTY_UNREALISTIC       = 10;
static constexpr int PENALTY_BUDGET_VS_PARTS   = 15;
static constexpr int PENALTY_NO_BREAKDOWN      = 5;

/// `is_valid` requires at least this confidence ...
static constexpr int VALID_MIN_CONFIDENCE = 60;

/// ... and strictly fewer issues than this.
static constexpr std::size_t VALID_MAX_ISSUES = 3;

// ─── Budget comparison ────────────────────────────────────────────────────────

/// Absolute deviation (percent) thresholds for BudgetStatus.
static constexpr double DEVIATION_EXCELLENT_PCT = 5.0;
static constexpr double DEVIATION_GOOD_PCT      = 15.0;
static constexpr double DEVIATION_WARNING_PCT   = 30.0;

}  // namespace fdx::constants
