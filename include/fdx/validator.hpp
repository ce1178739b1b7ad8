#pragma once

/// @file include/fdx/validator.hpp
/// @brief Confidence scoring of an extraction result.
///
/// # Module: Validator
///
/// Confidence starts at 100 and each failed check subtracts a penalty:
///
/// | check                                     | penalty | issue | suggestion |
/// |-------------------------------------------|---------|-------|------------|
/// | no currency found                         | 30      | yes   | yes        |
/// | amount > 1e9 or < 0.01 (any mention)      | 10      | yes   | yes        |
/// | budget < 0.8 × sum of the other mentions  | 15      | yes   | yes        |
/// | no named cost category populated          | 5       | no    | yes        |
///
/// The budget check compares values in the reference currency. The result is
/// valid when confidence ≥ 60, there are fewer than 3 issues and at least one
/// currency was found. Confidence is clamped to [0, 100].

#include "fdx/constants.hpp"
#include "fdx/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fdx::validation {

struct ValidatorConfig {
    double      unrealistic_max        = constants::UNREALISTIC_AMOUNT_MAX;
    double      unrealistic_min        = constants::UNREALISTIC_AMOUNT_MIN;
    double      budget_parts_ratio     = constants::BUDGET_PARTS_RATIO;
    int         penalty_no_currencies  = constants::PENALTY_NO_CURRENCIES;
    int         penalty_unrealistic    = constants::PENALTY_UNREALISTIC;
    int         penalty_budget_parts   = constants::PENALTY_BUDGET_VS_PARTS;
    int         penalty_no_breakdown   = constants::PENALTY_NO_BREAKDOWN;
    int         valid_min_confidence   = constants::VALID_MIN_CONFIDENCE;
    std::size_t valid_max_issues       = constants::VALID_MAX_ISSUES;
};

struct ValidationReport {
    bool                     is_valid   = false;
    int                      confidence = 0;   ///< 0–100
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;

    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] ValidationReport
validate(const ExtractedFinancials& data,
         const ValidatorConfig& config = ValidatorConfig{});

}  // namespace fdx::validation
