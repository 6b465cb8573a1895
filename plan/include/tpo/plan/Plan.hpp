/**
 * @file Plan.hpp
 * @brief Build → Week → Workout plan hierarchy.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_PLAN_HPP
    #define TPO_PLAN_PLAN_HPP

    #include <tpo/core/Date.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/phase/Phase.hpp>

    #include <optional>
    #include <string>
    #include <string_view>
    #include <vector>

namespace tpo::plan {

enum class WorkoutType : core::u8 {
    kEasy = 0,
    kRecovery,
    kLong,
    kMarathonPace,
    kThreshold,
    kInterval,
    kRace
};

enum class WorkoutStatus : core::u8 {
    kPlanned = 0,
    kCompleted,
    kSkipped,
    kModified
};

[[nodiscard]] std::string_view workoutTypeName(WorkoutType type) noexcept;
[[nodiscard]] std::string_view workoutStatusName(WorkoutStatus status) noexcept;

/// @brief Threshold, interval and marathon-pace sessions.
[[nodiscard]] constexpr bool isQuality(WorkoutType type) noexcept
{
    return type == WorkoutType::kThreshold
        || type == WorkoutType::kInterval
        || type == WorkoutType::kMarathonPace;
}

struct Workout {
    core::WorkoutId id;
    core::Date      date{};
    WorkoutType     type{WorkoutType::kEasy};
    core::f64       targetDistanceM{0.0};
    core::f64       targetDurationS{0.0};
    core::f64       workDistanceM{0.0};  ///< Portion run at the session's prescribed intensity.
    WorkoutStatus   status{WorkoutStatus::kPlanned};

    /// @brief Long run carrying a marathon-pace segment.
    [[nodiscard]] bool isWorkoutLong() const noexcept
    {
        return type == WorkoutType::kLong && workDistanceM > 0.0;
    }

    /// @brief Counts against the hard-session stacking rules.
    [[nodiscard]] bool isHard() const noexcept
    {
        return status != WorkoutStatus::kSkipped && (isQuality(type) || isWorkoutLong() || type == WorkoutType::kRace);
    }

    [[nodiscard]] bool operator==(const Workout &) const = default;
};

struct Week {
    core::u32             index{0};
    core::Date            weekStart{};
    phase::PhaseLabel     label{phase::PhaseLabel::kBase};
    bool                  cutback{false};
    core::f64             volumeCeilingM{0.0};
    core::f64             longRunCeilingM{0.0};
    std::vector<Workout>  workouts;     ///< Ordered by date.
    std::vector<std::string> riskNotes;

    /// @brief Planned distance excluding skipped workouts and races.
    [[nodiscard]] core::f64 volume() const noexcept;

    /// @brief The week's long run, if any is scheduled and not skipped.
    [[nodiscard]] const Workout *longRun() const noexcept;

    /// @brief Non-skipped threshold/interval/marathon-pace sessions.
    [[nodiscard]] core::u32 qualityCount() const noexcept;

    [[nodiscard]] bool operator==(const Week &) const = default;
};

struct Plan {
    core::AthleteId   athleteId;
    core::u32         revision{1};
    core::u32         ruleSetVersion{0};
    core::u32         retryLevel{0};   ///< Relaxation step the synthesis settled on.
    core::Date        raceDate{};
    core::f64         raceDistanceM{0.0};
    core::f64         vdot{0.0};
    std::vector<Week> weeks;

    [[nodiscard]] Workout *findWorkout(std::string_view id) noexcept;
    [[nodiscard]] const Workout *findWorkout(std::string_view id) const noexcept;

    /// @brief Week whose Monday-based span contains @p date.
    [[nodiscard]] Week *weekContaining(core::Date date) noexcept;
    [[nodiscard]] const Week *weekContaining(core::Date date) const noexcept;

    [[nodiscard]] bool operator==(const Plan &) const = default;
};

} // namespace tpo::plan

#endif // TPO_PLAN_PLAN_HPP
