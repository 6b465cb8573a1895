/**
 * @file TrainingLoad.hpp
 * @brief Scalar training load from duration and intensity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_SESSION_TRAINING_LOAD_HPP
    #define TPO_SESSION_TRAINING_LOAD_HPP

    #include "Session.hpp"

    #include <optional>

namespace tpo::session {

/// @brief Intensity factor assumed for @p type when heart rate is unusable.
[[nodiscard]] core::f64 estimatedIntensityFactor(SessionType type) noexcept;

/**
 * @brief Heart-rate based intensity factor.
 *
 * Uses a TRIMP weighting of the heart-rate reserve, normalised so that a
 * reserve of 0.88 (lactate threshold) maps to 1.0.
 *
 * @return std::nullopt when the session or athlete lacks heart-rate data.
 */
[[nodiscard]] std::optional<core::f64> heartRateIntensityFactor(
    const Session &session,
    const Athlete &athlete) noexcept;

/**
 * @brief Training stress of one session (100 = one hour at threshold).
 */
[[nodiscard]] core::f64 computeTrainingLoad(const Session &session, const Athlete &athlete) noexcept;

} // namespace tpo::session

#endif // TPO_SESSION_TRAINING_LOAD_HPP
