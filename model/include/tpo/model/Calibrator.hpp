/**
 * @file Calibrator.hpp
 * @brief Per-athlete calibration of the response model from race results.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MODEL_CALIBRATOR_HPP
    #define TPO_MODEL_CALIBRATOR_HPP

    #include "ResponseModel.hpp"

    #include <tpo/core/Constants.hpp>
    #include <tpo/core/Expected.hpp>
    #include <tpo/session/Session.hpp>

    #include <span>

namespace tpo::model {

struct CalibrationOptions {
    core::u32 minRaceObservations{core::kMinRaceObservations};
    core::u32 previousVersion{0};   ///< Version of the model being replaced.
    core::f64 priorStrength{1.0};   ///< Shrinkage towards population constants.
};

/**
 * @brief Confidence of a calibration.
 *
 * A pure function of observation count, residual standard deviation and
 * history length; non-decreasing in @p observations for fixed other
 * arguments.
 */
[[nodiscard]] core::ConfidenceLabel calibrationConfidence(
    core::u32 observations,
    core::f64 residualStdDev,
    core::i32 historyDays) noexcept;

/**
 * @brief Fits (tau1, tau2, k1, k2, baseline) to the athlete's races.
 *
 * With fewer than @ref CalibrationOptions::minRaceObservations usable
 * races the population constants are kept and only the baseline moves
 * to the athlete's mean residual. No ordering between tau1 and tau2 is
 * imposed.
 *
 * @param sessions Chronological, deduplicated sessions with loads.
 * @param races    Race results, in any order.
 * @return kInvalidArgument for a race with non-positive distance or time.
 */
[[nodiscard]] core::Expected<ResponseModel> calibrate(
    std::span<const session::Session> sessions,
    std::span<const session::RaceResult> races,
    const CalibrationOptions &options = {});

} // namespace tpo::model

#endif // TPO_MODEL_CALIBRATOR_HPP
