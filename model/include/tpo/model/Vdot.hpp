/**
 * @file Vdot.hpp
 * @brief Race-equivalent aerobic capacity (VDOT) conversions.
 *
 * Performance is expressed on the VDOT scale: the oxygen cost of the race
 * speed divided by the fraction of VO2max sustainable for its duration.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MODEL_VDOT_HPP
    #define TPO_MODEL_VDOT_HPP

    #include <tpo/core/Expected.hpp>
    #include <tpo/core/Types.hpp>

namespace tpo::model {

inline constexpr core::f64 kVdotMin = 20.0;
inline constexpr core::f64 kVdotMax = 85.0;

inline constexpr core::f64 kMarathonM     = 42'195.0;
inline constexpr core::f64 kHalfMarathonM = 21'097.5;

/**
 * @brief Training intensity zones expressed as a fraction of VO2max.
 */
enum class PaceZone : core::u8 {
    kEasy = 0,
    kMarathon,
    kThreshold,
    kInterval
};

/**
 * @brief VDOT of a race result, clamped to [kVdotMin, kVdotMax].
 * @return kInvalidArgument for non-positive distance or time.
 */
[[nodiscard]] core::Expected<core::f64> vdotFromRace(core::f64 distanceM, core::f64 timeS);

/**
 * @brief Race time (seconds) over @p distanceM at capacity @p vdot.
 *
 * Inverts vdotFromRace by bisection on time; @p vdot is clamped to the
 * supported range first.
 */
[[nodiscard]] core::Expected<core::f64> raceTimeForVdot(core::f64 vdot, core::f64 distanceM);

/// @brief Running speed (m/s) for @p zone at capacity @p vdot.
[[nodiscard]] core::f64 zoneSpeed(core::f64 vdot, PaceZone zone) noexcept;

} // namespace tpo::model

#endif // TPO_MODEL_VDOT_HPP
