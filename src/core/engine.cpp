/// @file src/core/engine.cpp
/// @brief Extraction Engine.

#include "fdx/engine.hpp"
#include "fdx/text.hpp"

#include <fmt/core.h>

namespace fdx {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput: return "invalid input";
    }
    return "unknown error";
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config, std::shared_ptr<const PatternTable> table)
    : config_(std::move(config))
    , table_(table ? std::move(table) : PatternTable::builtin())
    , scanner_(table_, config_.scan)
{}

// ─── Engine::validate_input ───────────────────────────────────────────────────

std::optional<ExtractionError> Engine::validate_input(std::string_view text) const {
    if (const auto err = text::find_utf8_error(text)) {
        return ExtractionError{
            .kind        = ErrorKind::InvalidInput,
            .message     = fmt::format("malformed UTF-8 at byte {}: {}",
                                       err->byte_offset, err->reason),
            .byte_offset = err->byte_offset,
        };
    }
    return std::nullopt;
}

std::optional<ExtractionError> Engine::validate_input(const char* text) const {
    if (text == nullptr) {
        return ExtractionError{
            .kind        = ErrorKind::InvalidInput,
            .message     = "text is null",
            .byte_offset = 0,
        };
    }
    return validate_input(std::string_view(text));
}

// ─── Engine::extract ──────────────────────────────────────────────────────────

std::optional<ExtractedFinancials> Engine::extract(std::string_view text,
                                                   DocumentKind kind) const {
    auto decoded = text::decode_utf8(text);
    if (!decoded) {
        if (config_.verbose) {
            if (const auto err = validate_input(text)) {
                fmt::print(stderr, "[fdx] rejected: {}\n", err->message);
            }
        }
        return std::nullopt;
    }
    const std::wstring& original = *decoded;
    const std::wstring  folded   = text::fold_for_matching(original);

    ExtractedFinancials out;

    // ── Step 1: Scan and deduplicate ──────────────────────────────────────────
    const auto raw = scanner_.scan(original, folded);
    out.currencies = scan::deduplicate(raw, config_.dedup);
    if (config_.verbose) {
        fmt::print(stderr, "[fdx] scan: {} code points, {} raw mentions, {} after dedup\n",
                   original.size(), raw.size(), out.currencies.size());
    }

    // ── Step 2: Budget and breakdown ──────────────────────────────────────────
    out.total_budget   = analysis::identify_document_budget(folded, out.currencies, *table_,
                                                            kind, config_.proximity);
    out.cost_breakdown = analysis::categorize_costs(folded, out.currencies, *table_,
                                                    config_.proximity);
    if (config_.verbose) {
        if (const auto b = out.budget()) {
            fmt::print(stderr, "[fdx] budget ({}): {} {} at {}\n",
                       to_string(kind), b->amount, to_string(b->code), b->position);
        } else {
            fmt::print(stderr, "[fdx] budget ({}): none\n", to_string(kind));
        }
        fmt::print(stderr, "[fdx] breakdown: {} categories, {} other\n",
                   out.cost_breakdown.named.size(), out.cost_breakdown.other.size());
    }

    // ── Step 3: Excerpts ──────────────────────────────────────────────────────
    out.payment_terms   = excerpt::extract_excerpts(original, folded,
                                                    table_->payment_term_patterns(),
                                                    config_.terms);
    out.financial_notes = excerpt::extract_excerpts(original, folded,
                                                    table_->note_patterns(),
                                                    config_.notes);
    if (config_.verbose) {
        fmt::print(stderr, "[fdx] excerpts: {} payment terms, {} notes\n",
                   out.payment_terms.size(), out.financial_notes.size());
    }

    return out;
}

std::optional<ExtractedFinancials> Engine::extract(const char* text) const {
    if (text == nullptr) {
        if (config_.verbose) {
            fmt::print(stderr, "[fdx] rejected: text is null\n");
        }
        return std::nullopt;
    }
    return extract(std::string_view(text));
}

// ─── Engine::analyze ──────────────────────────────────────────────────────────

std::optional<FinancialAnalysis> Engine::analyze(std::string_view text) const {
    auto financials = extract(text);
    if (!financials) {
        return std::nullopt;
    }

    FinancialAnalysis out;
    out.statistics = stats::compute_statistics(financials->currencies);
    out.validation = validation::validate(*financials, config_.validator);
    out.financials = std::move(*financials);

    if (config_.verbose) {
        fmt::print(stderr, "[fdx] validation: confidence={} issues={} valid={}\n",
                   out.validation.confidence, out.validation.issues.size(),
                   out.validation.is_valid);
    }
    return out;
}

}  // namespace fdx
