/**
 * @file Vdot.cpp
 * @brief Oxygen-cost and sustainable-fraction formulas.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/model/Vdot.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace tpo::model {

namespace {

constexpr core::f64 kCostA = 0.000104;
constexpr core::f64 kCostB = 0.182258;
constexpr core::f64 kCostC = -4.60;

constexpr core::f64 kFastestMPerMin = 600.0;
constexpr core::f64 kSlowestMPerMin = 50.0;

/// ml/kg/min needed at @p metresPerMin.
core::f64 oxygenCost(core::f64 metresPerMin) noexcept
{
    return kCostC + kCostB * metresPerMin + kCostA * metresPerMin * metresPerMin;
}

/// Fraction of VO2max sustainable for @p minutes.
core::f64 sustainableFraction(core::f64 minutes) noexcept
{
    return 0.8 + 0.1894393 * std::exp(-0.012778 * minutes) + 0.2989558 * std::exp(-0.1932605 * minutes);
}

core::f64 rawVdot(core::f64 distanceM, core::f64 minutes) noexcept
{
    return oxygenCost(distanceM / minutes) / sustainableFraction(minutes);
}

core::f64 zoneFraction(PaceZone zone) noexcept
{
    switch (zone)
    {
        case PaceZone::kEasy:      return 0.70;
        case PaceZone::kMarathon:  return 0.80;
        case PaceZone::kThreshold: return 0.88;
        case PaceZone::kInterval:  return 0.975;
    }
    return 0.70;
}

} // namespace

core::Expected<core::f64> vdotFromRace(core::f64 distanceM, core::f64 timeS)
{
    if (distanceM <= 0.0 || timeS <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("race needs positive distance and time ({} m, {} s)", distanceM, timeS));

    return std::clamp(rawVdot(distanceM, timeS / 60.0), kVdotMin, kVdotMax);
}

core::Expected<core::f64> raceTimeForVdot(core::f64 vdot, core::f64 distanceM)
{
    if (distanceM <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("distance must be positive, got {} m", distanceM));

    const core::f64 target = std::clamp(vdot, kVdotMin, kVdotMax);

    // rawVdot falls as the time grows; bracket between very fast and walking.
    core::f64 fast = distanceM / kFastestMPerMin;
    core::f64 slow = distanceM / kSlowestMPerMin;
    if (target >= rawVdot(distanceM, fast))
        return fast * 60.0;
    if (target <= rawVdot(distanceM, slow))
        return slow * 60.0;

    for (int i = 0; i < 100 && (slow - fast) > 1e-9; ++i)
    {
        const core::f64 mid = 0.5 * (fast + slow);
        if (rawVdot(distanceM, mid) > target)
            fast = mid;
        else
            slow = mid;
    }
    return 0.5 * (fast + slow) * 60.0;
}

core::f64 zoneSpeed(core::f64 vdot, PaceZone zone) noexcept
{
    const core::f64 cost = std::clamp(vdot, kVdotMin, kVdotMax) * zoneFraction(zone) - kCostC;
    const core::f64 metresPerMin = (-kCostB + std::sqrt(kCostB * kCostB + 4.0 * kCostA * cost)) / (2.0 * kCostA);
    return metresPerMin / 60.0;
}

} // namespace tpo::model
