/**
 * @file PlanSynthesizer.hpp
 * @brief Week-by-week, day-by-day plan generation under coaching rules.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_PLAN_SYNTHESIZER_HPP
    #define TPO_PLAN_PLAN_SYNTHESIZER_HPP

    #include "Plan.hpp"
    #include "RuleSet.hpp"

    #include <tpo/bank/ConstraintDetector.hpp>
    #include <tpo/bank/FitnessBank.hpp>
    #include <tpo/model/ResponseModel.hpp>
    #include <tpo/model/Vdot.hpp>

    #include <optional>
    #include <span>

namespace tpo::plan {

struct PlanRequest {
    core::AthleteId     athleteId;
    core::Date          startDate{};   ///< The plan starts on this date's Monday.
    core::Date          raceDate{};
    core::f64           raceDistanceM{model::kMarathonM};
    session::VolumeTier volumeTier{session::VolumeTier::kMid};
    core::u32           daysPerWeek{5};
    core::u32           age{35};
};

/**
 * @brief Relaxation applied at one step of the retry ladder.
 */
struct SynthesisRelaxation {
    std::optional<core::u32> maxQualitySessions;
    bool                     allowGoalPaceLongRuns{true};
    core::f64                volumeScale{1.0};
};

/// @brief Relaxation for ladder step @p level (0 = rules as configured).
[[nodiscard]] SynthesisRelaxation relaxationForLevel(core::u32 level) noexcept;

inline constexpr core::u32 kRetryLevels = 4;

/**
 * @brief Constraint return ramp for week @p weekIndex of a plan starting on
 *        @p planStart.
 *
 * Starts at 1 − 0.6·severity of the peak and reaches the full peak once the
 * constraint's estimated expiry is reached. Week 0 is always below 1.
 */
[[nodiscard]] core::f64 constraintRampFactor(const bank::Constraint &constraint, core::Date planStart,
                                             core::u32 weekIndex) noexcept;

/// @brief Profiles that take a cutback week every third week.
[[nodiscard]] bool isHigherRisk(bool constraintActive, core::u32 age, session::VolumeTier tier,
                                const RuleSet &rules) noexcept;

/**
 * @brief Builds a plan for @p phases (one label per week, race week last).
 *
 * Every week is validated by WeekRuleChain::standard. When a week is
 * rejected the synthesis retries down the relaxation ladder.
 *
 * @return kInvalidArgument for inconsistent inputs, kRuleViolation when
 *         every ladder step still breaks a rule.
 */
[[nodiscard]] core::Expected<Plan> synthesizePlan(
    const model::ResponseModel &model,
    const bank::FitnessBank &bank,
    const std::optional<bank::Constraint> &constraint,
    std::span<const phase::PhaseLabel> phases,
    const PlanRequest &request,
    const RuleSet &rules = RuleSet::defaults());

} // namespace tpo::plan

#endif // TPO_PLAN_PLAN_SYNTHESIZER_HPP
