/**
 * @file Paces.cpp
 * @brief Training speed table.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/plan/Paces.hpp>

#include <tpo/model/Vdot.hpp>

#include <algorithm>

namespace tpo::plan {

namespace {

constexpr core::f64 kRecoveryFraction = 0.92;

} // namespace

TrainingPaces TrainingPaces::fromVdot(core::f64 vdot) noexcept
{
    TrainingPaces paces;
    paces.vdot      = vdot;
    paces.easy      = model::zoneSpeed(vdot, model::PaceZone::kEasy);
    paces.recovery  = paces.easy * kRecoveryFraction;
    paces.marathon  = model::zoneSpeed(vdot, model::PaceZone::kMarathon);
    paces.threshold = model::zoneSpeed(vdot, model::PaceZone::kThreshold);
    paces.interval  = model::zoneSpeed(vdot, model::PaceZone::kInterval);
    return paces;
}

core::f64 workoutDuration(const Workout &workout, const TrainingPaces &paces)
{
    const core::f64 work = std::clamp(workout.workDistanceM, 0.0, workout.targetDistanceM);
    const core::f64 rest = workout.targetDistanceM - work;

    core::f64 workSpeed = paces.easy;
    switch (workout.type)
    {
    case WorkoutType::kRecovery:
        return paces.recovery > 0.0 ? workout.targetDistanceM / paces.recovery : 0.0;
    case WorkoutType::kEasy:
        break;
    case WorkoutType::kLong:
    case WorkoutType::kMarathonPace:
        workSpeed = paces.marathon;
        break;
    case WorkoutType::kThreshold:
        workSpeed = paces.threshold;
        break;
    case WorkoutType::kInterval:
        workSpeed = paces.interval;
        break;
    case WorkoutType::kRace: {
        const auto raceTime = model::raceTimeForVdot(paces.vdot, workout.targetDistanceM);
        if (raceTime)
            return *raceTime;
        return paces.marathon > 0.0 ? workout.targetDistanceM / paces.marathon : 0.0;
    }
    }
    if (paces.easy <= 0.0 || workSpeed <= 0.0)
        return 0.0;
    return work / workSpeed + rest / paces.easy;
}

} // namespace tpo::plan
