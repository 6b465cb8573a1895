/**
 * @file Error.cpp
 * @brief Error code names and diagnostic helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tpo/core/Error.hpp"

#include <algorithm>

namespace tpo::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                   return "none";
        case ErrorCode::kInvalidArgument:        return "invalid_argument";
        case ErrorCode::kInvalidState:           return "invalid_state";
        case ErrorCode::kNotFound:               return "not_found";
        case ErrorCode::kAlreadyExists:          return "already_exists";
        case ErrorCode::kOutOfRange:             return "out_of_range";
        case ErrorCode::kInsufficientData:       return "insufficient_data";
        case ErrorCode::kDataGap:                return "data_gap";
        case ErrorCode::kPoorFit:                return "poor_fit";
        case ErrorCode::kInvalidConstraintState: return "invalid_constraint_state";
        case ErrorCode::kRuleViolation:          return "rule_violation";
        case ErrorCode::kProposalConflict:       return "proposal_conflict";
        case ErrorCode::kStalePlan:              return "stale_plan";
        case ErrorCode::kCalibrationFailed:      return "calibration_failed";
        case ErrorCode::kCancelled:              return "cancelled";
        case ErrorCode::kInternalError:          return "internal_error";
    }
    return "unknown";
}

bool hasDiagnostic(const Diagnostics &list, ErrorCode code) noexcept
{
    return std::any_of(list.begin(), list.end(),
                       [code](const Diagnostic &d) { return d.code == code; });
}

} // namespace tpo::core
