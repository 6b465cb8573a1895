/**
 * @file ConstraintDetector.hpp
 * @brief Detection of layoffs and injuries that cap near-term training.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_BANK_CONSTRAINT_DETECTOR_HPP
    #define TPO_BANK_CONSTRAINT_DETECTOR_HPP

    #include <tpo/core/Constants.hpp>
    #include <tpo/core/Date.hpp>
    #include <tpo/core/Error.hpp>
    #include <tpo/session/Session.hpp>

    #include <optional>
    #include <span>
    #include <string_view>

namespace tpo::bank {

enum class ConstraintType : core::u8 {
    kReturningFromLayoff = 0,
    kInjury
};

enum class ConstraintOrigin : core::u8 {
    kExplicit = 0,
    kInferred
};

[[nodiscard]] std::string_view constraintTypeName(ConstraintType type) noexcept;

struct Constraint {
    ConstraintType   type{ConstraintType::kReturningFromLayoff};
    ConstraintOrigin origin{ConstraintOrigin::kInferred};
    core::Date       detectedAt{};
    core::f64        severity{0.0};      ///< 0 (negligible) .. 1 (full rebuild).
    core::Date       estimatedExpiry{};
    core::f64        referenceWeeklyVolume{0.0}; ///< Weekly metres before the interruption.

    [[nodiscard]] bool operator==(const Constraint &) const = default;
};

/**
 * @brief A logged injury or layoff.
 */
struct ConstraintSignal {
    ConstraintType            type{ConstraintType::kInjury};
    core::Date                reportedAt{};
    std::optional<core::Date> resolvedAt;
    std::optional<core::Date> expectedReturn;
    core::f64                 severity{0.5};
};

struct ConstraintOptions {
    core::i32 minGapDays{core::kConstraintGapDays};
    core::f64 resumeFraction{core::kConstraintResumeFraction};
    core::f64 recoverFraction{core::kConstraintRecoverFraction};
    core::u32 recoverWeeks{core::kConstraintRecoverWeeks};
    core::f64 defaultRebuildRatio{core::kDefaultRebuildRatio};
};

struct ConstraintResolution {
    std::optional<Constraint> active;
    core::Diagnostics         diagnostics;
};

/**
 * @brief Days needed per gap day to regain the pre-gap volume.
 *
 * Averaged over completed rebuilds in the history, or
 * @ref ConstraintOptions::defaultRebuildRatio when there are none.
 */
[[nodiscard]] core::f64 historicalRebuildRatio(
    std::span<const session::Session> sessions,
    core::Date before,
    const ConstraintOptions &options = {});

/**
 * @brief Resolves the athlete's active constraint on @p today.
 *
 * Explicit signals take precedence over inference; among explicit
 * signals the most recent wins. Overlaps are reported as
 * kInvalidConstraintState diagnostics rather than failures.
 */
[[nodiscard]] ConstraintResolution detectConstraint(
    std::span<const session::Session> sessions,
    core::Date today,
    std::span<const ConstraintSignal> signals = {},
    const ConstraintOptions &options = {});

} // namespace tpo::bank

#endif // TPO_BANK_CONSTRAINT_DETECTOR_HPP
