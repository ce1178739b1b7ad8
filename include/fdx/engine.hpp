#pragma once

/// @file include/fdx/engine.hpp
/// @brief Extraction Engine public API.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate the extraction pipeline over one document:
///   UTF-8 text → decode + fold → CurrencyScanner → deduplicate →
///   identify_document_budget + categorize_costs + extract_excerpts →
///   ExtractedFinancials → compute_statistics + validate
///
/// ## Usage
/// ```cpp
/// fdx::Engine engine;
/// auto analysis = engine.analyze(text);
/// if (analysis) fmt::print("{}\n", analysis->to_string());
/// ```
///
/// ## Guarantees
/// - Zero panics: the only failure is invalid input, reported as `nullopt`
/// - Thread-safe: every method is const and the pattern table is immutable
/// - Deterministic: equal input and configuration give equal output

#include "fdx/analysis.hpp"
#include "fdx/excerpts.hpp"
#include "fdx/patterns.hpp"
#include "fdx/scanner.hpp"
#include "fdx/statistics.hpp"
#include "fdx/types.hpp"
#include "fdx/validator.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fdx {

// ─── Errors ───────────────────────────────────────────────────────────────────

enum class ErrorKind {
    InvalidInput,  ///< Null text or malformed UTF-8
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

struct ExtractionError {
    ErrorKind   kind;
    std::string message;
    std::size_t byte_offset = 0;  ///< First offending byte, for malformed UTF-8
};

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Runtime thresholds for every pipeline stage.
struct EngineConfig {
    scan::ScanConfig               scan{};
    scan::DedupConfig              dedup{};
    analysis::ProximityConfig      proximity{};
    excerpt::ExcerptConfig         terms = excerpt::ExcerptConfig::payment_terms();
    excerpt::ExcerptConfig         notes = excerpt::ExcerptConfig::financial_notes();
    validation::ValidatorConfig    validator{};

    /// If true, emit per-stage diagnostics to stderr.
    bool verbose = false;
};

// ─── FinancialAnalysis ────────────────────────────────────────────────────────

/// Extraction result together with its statistics and validation.
struct FinancialAnalysis {
    ExtractedFinancials          financials;
    stats::CurrencyStatistics    statistics;
    validation::ValidationReport validation;

    /// Multi-line plain-text report.
    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Construct with optional configuration and pattern table.
    /// A null `table` falls back to `PatternTable::builtin()`.
    explicit Engine(EngineConfig config = EngineConfig{},
                    std::shared_ptr<const PatternTable> table = PatternTable::builtin());

    /// Classify why `text` would be rejected; `nullopt` if it is acceptable.
    [[nodiscard]] std::optional<ExtractionError> validate_input(std::string_view text) const;
    [[nodiscard]] std::optional<ExtractionError> validate_input(const char* text) const;

    /// Extract financial data from one document.
    ///
    /// # Arguments
    /// * `kind` — selects the budget lead-ins tried before the general
    ///            keyword search (see `analysis::identify_document_budget`)
    ///
    /// # Returns
    /// `nullopt` only if the input is invalid (see `validate_input`). A
    /// document without any financial content yields an empty result.
    [[nodiscard]] std::optional<ExtractedFinancials>
    extract(std::string_view text, DocumentKind kind = DocumentKind::General) const;

    /// Null-safe overload for C-string callers.
    [[nodiscard]] std::optional<ExtractedFinancials> extract(const char* text) const;

    /// `extract` followed by statistics and validation.
    [[nodiscard]] std::optional<FinancialAnalysis> analyze(std::string_view text) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const PatternTable& patterns() const noexcept { return *table_; }

private:
    EngineConfig                        config_;
    std::shared_ptr<const PatternTable> table_;
    scan::CurrencyScanner               scanner_;
};

}  // namespace fdx
