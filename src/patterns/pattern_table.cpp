/// @file src/patterns/pattern_table.cpp
/// @brief Compilation of PatternSpec into an immutable PatternTable.

#include "fdx/patterns.hpp"
#include "fdx/text.hpp"

#include <fmt/core.h>

namespace fdx {

namespace {

constexpr auto REGEX_FLAGS = std::regex_constants::ECMAScript |
                             std::regex_constants::optimize;

/// Join fragments as a non-capturing alternation: (?:a|b|c).
std::string alternation(const std::vector<std::string>& tokens) {
    std::string out = "(?:";
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += '|';
        out += tokens[i];
    }
    out += ')';
    return out;
}

/// Decode a UTF-8 regex source and compile it. `nullopt` on either failure.
std::optional<std::wregex> compile_regex(const std::string& source) {
    auto wide = text::decode_utf8(source);
    if (!wide) {
        return std::nullopt;
    }
    try {
        return std::wregex(*wide, REGEX_FLAGS);
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

std::optional<std::vector<std::wregex>>
compile_all(const std::vector<std::string>& sources) {
    std::vector<std::wregex> out;
    out.reserve(sources.size());
    for (const auto& src : sources) {
        auto re = compile_regex(src);
        if (!re) {
            return std::nullopt;
        }
        out.push_back(std::move(*re));
    }
    return out;
}

std::optional<std::wstring> fold_keyword(const std::string& keyword) {
    auto wide = text::decode_utf8(keyword);
    if (!wide || wide->empty()) {
        return std::nullopt;
    }
    return text::fold_for_matching(*wide);
}

}  // namespace

// ─── currency_regex_source ────────────────────────────────────────────────────

std::string PatternTable::currency_regex_source(const CurrencyPatternSpec& spec) {
    const std::string amount(AMOUNT_FRAGMENT);
    const std::string gap(SYMBOL_GAP_FRAGMENT);
    std::string out;
    if (!spec.prefix_tokens.empty()) {
        out += alternation(spec.prefix_tokens) + gap + amount;
    }
    if (!spec.suffix_tokens.empty()) {
        if (!out.empty()) out += '|';
        out += amount + gap + alternation(spec.suffix_tokens);
    }
    return out;
}

// ─── compile ──────────────────────────────────────────────────────────────────

std::optional<PatternTable> PatternTable::compile(const PatternSpec& spec) {
    PatternTable table;

    table.currencies_.reserve(spec.currencies.size());
    for (const auto& c : spec.currencies) {
        if (c.prefix_tokens.empty() && c.suffix_tokens.empty()) {
            return std::nullopt;
        }
        auto re = compile_regex(currency_regex_source(c));
        if (!re) {
            return std::nullopt;
        }
        table.currencies_.push_back(CompiledCurrency{
            .code    = c.code,
            .symbol  = c.symbol,
            .name    = c.name,
            .pattern = std::move(*re),
        });
    }

    for (const auto& kw : spec.budget_keywords) {
        auto folded = fold_keyword(kw);
        if (!folded) {
            return std::nullopt;
        }
        table.budget_keywords_.push_back(std::move(*folded));
    }

    for (const auto& cat : spec.categories) {
        CompiledCategory compiled{.category = cat.category, .keywords = {}};
        for (const auto& kw : cat.keywords) {
            auto folded = fold_keyword(kw);
            if (!folded) {
                return std::nullopt;
            }
            compiled.keywords.push_back(std::move(*folded));
        }
        table.categories_.push_back(std::move(compiled));
    }

    auto reference_leads = compile_all(spec.reference_budget_leads);
    auto proposal_leads  = compile_all(spec.proposal_budget_leads);
    if (!reference_leads || !proposal_leads) {
        return std::nullopt;
    }
    table.reference_budget_leads_ = std::move(*reference_leads);
    table.proposal_budget_leads_  = std::move(*proposal_leads);

    auto terms = compile_all(spec.payment_term_patterns);
    auto notes = compile_all(spec.note_patterns);
    if (!terms || !notes) {
        return std::nullopt;
    }
    table.payment_term_patterns_ = std::move(*terms);
    table.note_patterns_         = std::move(*notes);

    return table;
}

// ─── builtin ──────────────────────────────────────────────────────────────────

std::shared_ptr<const PatternTable> PatternTable::builtin() {
    static const std::shared_ptr<const PatternTable> table = [] {
        auto compiled = compile(PatternSpec::builtin());
        if (!compiled) {
            fmt::print(stderr, "[fdx] built-in pattern table failed to compile\n");
            return std::make_shared<const PatternTable>(PatternTable{});
        }
        return std::make_shared<const PatternTable>(std::move(*compiled));
    }();
    return table;
}

// ─── budget_leads ─────────────────────────────────────────────────────────────

const std::vector<std::wregex>& PatternTable::budget_leads(DocumentKind kind) const noexcept {
    static const std::vector<std::wregex> none;
    switch (kind) {
        case DocumentKind::TermsOfReference: return reference_budget_leads_;
        case DocumentKind::Proposal:         return proposal_budget_leads_;
        case DocumentKind::General:          break;
    }
    return none;
}

// ─── find ─────────────────────────────────────────────────────────────────────

std::optional<CompiledCurrency> PatternTable::find(CurrencyCode code) const {
    for (const auto& c : currencies_) {
        if (c.code == code) {
            return c;
        }
    }
    return std::nullopt;
}

}  // namespace fdx
