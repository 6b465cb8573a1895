/**
 * @file TrainingLoad.cpp
 * @brief Heart-rate and type-estimated training stress.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/session/TrainingLoad.hpp>

#include <algorithm>
#include <cmath>

namespace tpo::session {

namespace {

constexpr core::f64 kThresholdReserve = 0.88;
constexpr core::f64 kMinIntensity     = 0.30;
constexpr core::f64 kMaxIntensity     = 1.30;

core::f64 trimpRate(core::f64 reserve) noexcept
{
    return reserve * 0.75 * std::exp(1.8 * reserve);
}

} // namespace

core::f64 estimatedIntensityFactor(SessionType type) noexcept
{
    switch (type)
    {
        case SessionType::kRecovery:     return 0.65;
        case SessionType::kEasy:         return 0.70;
        case SessionType::kLong:         return 0.75;
        case SessionType::kMarathonPace: return 0.85;
        case SessionType::kThreshold:    return 0.90;
        case SessionType::kInterval:     return 0.95;
        case SessionType::kRace:         return 1.00;
        case SessionType::kOther:        return 0.78;
    }
    return 0.78;
}

std::optional<core::f64> heartRateIntensityFactor(const Session &session, const Athlete &athlete) noexcept
{
    if (!session.avgHeartRate || !athlete.maxHeartRate || !athlete.restingHeartRate)
        return std::nullopt;

    const core::f64 span = *athlete.maxHeartRate - *athlete.restingHeartRate;
    if (span <= 0.0 || *session.avgHeartRate <= *athlete.restingHeartRate)
        return std::nullopt;

    const core::f64 reserve = std::clamp((*session.avgHeartRate - *athlete.restingHeartRate) / span, 0.0, 1.0);
    const core::f64 factor  = std::sqrt(trimpRate(reserve) / trimpRate(kThresholdReserve));
    return std::clamp(factor, kMinIntensity, kMaxIntensity);
}

core::f64 computeTrainingLoad(const Session &session, const Athlete &athlete) noexcept
{
    if (session.durationS <= 0.0)
        return 0.0;

    const core::f64 intensity = heartRateIntensityFactor(session, athlete)
                                    .value_or(estimatedIntensityFactor(session.type));
    const core::f64 hours = session.durationS / 3600.0;
    return hours * intensity * intensity * 100.0;
}

} // namespace tpo::session
