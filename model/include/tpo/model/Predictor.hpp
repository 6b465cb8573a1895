/**
 * @file Predictor.hpp
 * @brief Race-time prediction with an honest confidence band.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MODEL_PREDICTOR_HPP
    #define TPO_MODEL_PREDICTOR_HPP

    #include "ResponseModel.hpp"

    #include <tpo/core/Constants.hpp>
    #include <tpo/core/Expected.hpp>

namespace tpo::model {

struct Prediction {
    core::Date            targetDate{};
    core::f64             distanceM{0.0};
    core::f64             predictedTimeS{0.0};
    core::f64             fastestTimeS{0.0};   ///< Lower edge of the 80 % interval.
    core::f64             slowestTimeS{0.0};   ///< Upper edge of the 80 % interval.
    core::f64             predictedVdot{0.0};
    core::f64             vdotStdDev{0.0};
    core::ConfidenceLabel confidence{core::ConfidenceLabel::kInsufficient};
    core::u32             taperWeeks{0};
    core::Date            taperStart{};
    core::u32             modelVersion{0};     ///< Calibration the prediction came from.
    core::u32             observationCount{0}; ///< Race observations behind that calibration.
    core::Diagnostics     diagnostics;

    [[nodiscard]] bool operator==(const Prediction &) const = default;
};

struct PredictOptions {
    core::u32 maxTaperWeeks{core::kDefaultMaxTaperWeeks};
};

/**
 * @brief Predicts the race time over @p distanceM on @p targetDate.
 *
 * Deterministic in its arguments. Unexplained gaps of a week or more in
 * the last six recorded weeks widen the interval and lower the label
 * instead of being extrapolated silently.
 *
 * @return kInvalidArgument for a non-positive distance or a target
 *         before the series start.
 */
[[nodiscard]] core::Expected<Prediction> predict(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date targetDate,
    core::f64 distanceM,
    const PredictOptions &options = {});

} // namespace tpo::model

#endif // TPO_MODEL_PREDICTOR_HPP
