/**
 * @file Proposal.hpp
 * @brief Reviewable plan edits computed before any mutation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_PROPOSAL_HPP
    #define TPO_PLAN_PROPOSAL_HPP

    #include "Plan.hpp"
    #include "RuleSet.hpp"

    #include <tpo/core/Expected.hpp>

    #include <optional>
    #include <string>
    #include <vector>

namespace tpo::plan {

enum class ChangeKind : core::u8 {
    kSwapDays = 0,
    kSkip,
    kRestore,
    kAdjustLoad,
    kAddWorkout,
    kReplaceType
};

enum class LoadAdjustment : core::u8 {
    kReduceLight = 0,
    kReduceModerate,
    kIncreaseLight
};

[[nodiscard]] std::string_view changeKindName(ChangeKind kind) noexcept;

/// @brief Distance multiplier of @p adjustment.
[[nodiscard]] core::f64 loadAdjustmentFactor(LoadAdjustment adjustment) noexcept;

/**
 * @brief A coach action requested against a plan.
 *
 * Build through the named factories; each one fills the fields its kind
 * reads.
 */
struct ChangeRequest {
    ChangeKind      kind{ChangeKind::kSkip};
    core::WorkoutId workoutId;
    core::WorkoutId otherWorkoutId;   ///< kSwapDays.
    core::Date      date{};           ///< kAddWorkout.
    WorkoutType     type{WorkoutType::kEasy};
    core::f64       distanceM{0.0};   ///< kAddWorkout.
    LoadAdjustment  adjustment{LoadAdjustment::kReduceLight};
    std::string     reason;

    [[nodiscard]] static ChangeRequest swapDays(core::WorkoutId first, core::WorkoutId second);
    [[nodiscard]] static ChangeRequest skip(core::WorkoutId id);
    [[nodiscard]] static ChangeRequest restore(core::WorkoutId id);
    [[nodiscard]] static ChangeRequest adjustLoad(core::WorkoutId id, LoadAdjustment adjustment);
    [[nodiscard]] static ChangeRequest addWorkout(core::Date date, WorkoutType type, core::f64 distanceM);
    [[nodiscard]] static ChangeRequest replaceType(core::WorkoutId id, WorkoutType type);

    [[nodiscard]] bool operator==(const ChangeRequest &) const = default;
};

enum class ProposalStatus : core::u8 {
    kProposed = 0,
    kConfirmed,
    kRejected,
    kApplied,
    kFailed
};

[[nodiscard]] std::string_view proposalStatusName(ProposalStatus status) noexcept;

/// @brief Rejected, applied and failed proposals never change again.
[[nodiscard]] constexpr bool isTerminal(ProposalStatus status) noexcept
{
    return status == ProposalStatus::kRejected
        || status == ProposalStatus::kApplied
        || status == ProposalStatus::kFailed;
}

/**
 * @brief One workout before and after the change. Added workouts have no
 *        @c before, removed ones no @c after.
 */
struct WorkoutChange {
    std::optional<Workout> before;
    std::optional<Workout> after;

    [[nodiscard]] bool operator==(const WorkoutChange &) const = default;
};

struct PlanProposal {
    core::ProposalId           id;
    core::AthleteId            athleteId;
    core::u32                  planRevision{0};
    ChangeRequest              request;
    std::vector<WorkoutChange> diff;
    std::vector<std::string>   riskNotes;
    ProposalStatus             status{ProposalStatus::kProposed};
    std::string                statusReason;

    [[nodiscard]] bool operator==(const PlanProposal &) const = default;
};

/**
 * @brief Computes the minimal diff for @p request without touching @p plan.
 *
 * The affected weeks are re-validated: a rejection is returned as
 * kRuleViolation, warnings become risk notes.
 *
 * @return kNotFound for unknown workouts, kInvalidState for a skip/restore
 *         that does not match the workout's status, kOutOfRange for a date
 *         outside the plan, kInvalidArgument for malformed requests.
 */
[[nodiscard]] core::Expected<PlanProposal> proposeChange(
    const Plan &plan,
    const ChangeRequest &request,
    core::ProposalId id,
    const RuleSet &rules = RuleSet::defaults());

/**
 * @brief Applies a proposal's diff to @p plan and bumps its revision.
 * @return Number of workout actions applied, or kStalePlan when the plan
 *         moved on since the proposal was computed. @p plan is untouched
 *         on error.
 */
[[nodiscard]] core::Expected<core::u32> applyProposal(Plan &plan, const PlanProposal &proposal);

} // namespace tpo::plan

#endif // TPO_PLAN_PROPOSAL_HPP
