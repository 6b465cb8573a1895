/**
 * @file Plan.cpp
 * @brief Plan hierarchy accessors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/plan/Plan.hpp>

namespace tpo::plan {

std::string_view workoutTypeName(WorkoutType type) noexcept
{
    switch (type)
    {
    case WorkoutType::kEasy: return "easy";
    case WorkoutType::kRecovery: return "recovery";
    case WorkoutType::kLong: return "long";
    case WorkoutType::kMarathonPace: return "marathon_pace";
    case WorkoutType::kThreshold: return "threshold";
    case WorkoutType::kInterval: return "interval";
    case WorkoutType::kRace: return "race";
    }
    return "unknown";
}

std::string_view workoutStatusName(WorkoutStatus status) noexcept
{
    switch (status)
    {
    case WorkoutStatus::kPlanned: return "planned";
    case WorkoutStatus::kCompleted: return "completed";
    case WorkoutStatus::kSkipped: return "skipped";
    case WorkoutStatus::kModified: return "modified";
    }
    return "unknown";
}

core::f64 Week::volume() const noexcept
{
    core::f64 total = 0.0;
    for (const auto &w : workouts)
    {
        if (w.status != WorkoutStatus::kSkipped && w.type != WorkoutType::kRace)
            total += w.targetDistanceM;
    }
    return total;
}

const Workout *Week::longRun() const noexcept
{
    const Workout *best = nullptr;
    for (const auto &w : workouts)
    {
        if (w.type != WorkoutType::kLong || w.status == WorkoutStatus::kSkipped)
            continue;
        if (!best || w.targetDistanceM > best->targetDistanceM)
            best = &w;
    }
    return best;
}

core::u32 Week::qualityCount() const noexcept
{
    core::u32 count = 0;
    for (const auto &w : workouts)
    {
        if (isQuality(w.type) && w.status != WorkoutStatus::kSkipped)
            ++count;
    }
    return count;
}

Workout *Plan::findWorkout(std::string_view id) noexcept
{
    for (auto &week : weeks)
        for (auto &w : week.workouts)
            if (w.id == id)
                return &w;
    return nullptr;
}

const Workout *Plan::findWorkout(std::string_view id) const noexcept
{
    for (const auto &week : weeks)
        for (const auto &w : week.workouts)
            if (w.id == id)
                return &w;
    return nullptr;
}

Week *Plan::weekContaining(core::Date date) noexcept
{
    const core::Date monday = core::weekStart(date);
    for (auto &week : weeks)
        if (week.weekStart == monday)
            return &week;
    return nullptr;
}

const Week *Plan::weekContaining(core::Date date) const noexcept
{
    const core::Date monday = core::weekStart(date);
    for (const auto &week : weeks)
        if (week.weekStart == monday)
            return &week;
    return nullptr;
}

} // namespace tpo::plan
