/**
 * @file FitnessBank.hpp
 * @brief Recency-aware record of an athlete's proven peak capabilities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_BANK_FITNESS_BANK_HPP
    #define TPO_BANK_FITNESS_BANK_HPP

    #include <tpo/core/Constants.hpp>
    #include <tpo/core/Date.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/session/Session.hpp>

    #include <optional>
    #include <span>
    #include <string_view>

namespace tpo::bank {

/**
 * @brief One capability metric with the evidence backing it.
 */
struct CapabilityEvidence {
    core::f64                 value{0.0};     ///< Metres.
    std::optional<core::Date> evidenceDate;   ///< End of the window that set the peak.
    core::u32                 sampleCount{0}; ///< Efforts in that window within reach of the peak.
    bool                      confirmed{false};

    [[nodiscard]] bool operator==(const CapabilityEvidence &) const = default;
};

enum class ExperienceLevel : core::u8 {
    kBeginner = 0,
    kIntermediate,
    kExperienced,
    kElite
};

[[nodiscard]] std::string_view experienceLevelName(ExperienceLevel level) noexcept;

struct FitnessBank {
    CapabilityEvidence       peakWeeklyVolume;
    CapabilityEvidence       peakLongRun;
    CapabilityEvidence       peakLongRunAtGoalPace;
    core::f64                currentWeeklyVolume{0.0};  ///< Trailing four-week mean.
    core::f64                currentLongRun{0.0};       ///< Longest run in the last four weeks.
    std::optional<core::f64> bestRaceVdot;
    ExperienceLevel          experience{ExperienceLevel::kBeginner};
    core::Date               asOf{};

    /// @brief Peak weekly volume the plan may build towards.
    [[nodiscard]] core::f64 sustainableWeeklyVolume() const noexcept;

    [[nodiscard]] bool operator==(const FitnessBank &) const = default;
};

struct BankOptions {
    core::u32 windowWeeks{core::kBankWindowWeeks};
    core::u32 confirmationWeeks{core::kConfirmationWeeks};
    core::f64 comparableFraction{core::kComparableFraction};
};

/**
 * @brief Slides a trailing window over the history and records peaks.
 *
 * Weekly volume is the mean over each window; long runs are the longest
 * single effort in it. A peak is confirmed when a comparable effort falls
 * in the last @ref BankOptions::confirmationWeeks weeks before @p today.
 */
[[nodiscard]] FitnessBank computeFitnessBank(
    std::span<const session::Session> sessions,
    core::Date today,
    std::span<const session::RaceResult> races = {},
    const BankOptions &options = {});

/**
 * @brief Folds a fresh computation into a stored bank.
 *
 * Peaks only move upward. A peak carried over from @p prior is confirmed
 * only when the fresh window reaches it, and never while a constraint is
 * active.
 */
[[nodiscard]] FitnessBank mergeFitnessBank(
    const FitnessBank &prior,
    const FitnessBank &fresh,
    bool constraintActive,
    const BankOptions &options = {});

} // namespace tpo::bank

#endif // TPO_BANK_FITNESS_BANK_HPP
