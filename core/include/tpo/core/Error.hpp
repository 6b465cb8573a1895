/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the coaching error codes, the Error value type carried by
 * Expected<T>, and the Diagnostic record attached to outputs whose quality
 * was degraded without failing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_ERROR_HPP
    #define TPO_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <vector>

namespace tpo::core {

/**
 * @brief Engine-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kAlreadyExists,
    kOutOfRange,

    kInsufficientData,
    kDataGap,
    kPoorFit,
    kInvalidConstraintState,

    kRuleViolation,
    kProposalConflict,
    kStalePlan,

    kCalibrationFailed,
    kCancelled,

    kInternalError,
};

/**
 * @brief Returns a stable, lower-case name for @p code.
 */
[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

/**
 * @brief Non-fatal data-quality note attached to a successful result.
 */
struct Diagnostic {
    ErrorCode   code{ErrorCode::kNone};
    std::string message;

    [[nodiscard]] bool operator==(const Diagnostic &) const = default;
};

using Diagnostics = std::vector<Diagnostic>;

/// @brief True when @p list holds at least one entry with @p code.
[[nodiscard]] bool hasDiagnostic(const Diagnostics &list, ErrorCode code) noexcept;

} // namespace tpo::core

#endif // TPO_CORE_ERROR_HPP
