/**
 * @file ResponseModel.hpp
 * @brief Fitness-fatigue impulse-response model.
 *
 * performance(t) = baseline + k1 * fitness(t) - k2 * fatigue(t), where
 * fitness and fatigue are causal exponentially-weighted sums of the daily
 * loads before day t with time constants tau1 and tau2.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MODEL_RESPONSE_MODEL_HPP
    #define TPO_MODEL_RESPONSE_MODEL_HPP

    #include <tpo/core/Confidence.hpp>
    #include <tpo/core/Date.hpp>
    #include <tpo/core/Error.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/session/DailyLoadSeries.hpp>

    #include <optional>
    #include <span>
    #include <string_view>
    #include <vector>

namespace tpo::model {

/**
 * @brief Where the active constants came from.
 */
enum class ModelSource : core::u8 {
    kPopulationDefault = 0,
    kIndividual
};

[[nodiscard]] std::string_view modelSourceName(ModelSource source) noexcept;

struct ResponseModel {
    core::f64 tau1{0.0};     ///< Fitness decay constant (days).
    core::f64 tau2{0.0};     ///< Fatigue decay constant (days).
    core::f64 k1{0.0};
    core::f64 k2{0.0};
    core::f64 baseline{0.0}; ///< VDOT with no training history.

    core::ConfidenceLabel     confidence{core::ConfidenceLabel::kInsufficient};
    ModelSource               source{ModelSource::kPopulationDefault};
    core::u32                 version{0};
    core::u32                 observationCount{0}; ///< Races and race-type sessions.
    core::u32                 keySessionCount{0};  ///< Lower-weight efficiency markers.
    core::i32                 trainingDays{0};
    core::f64                 residualVariance{0.0};
    core::f64                 rSquared{0.0};
    std::optional<core::Date> lastObservation;
    core::Diagnostics         diagnostics;

    [[nodiscard]] bool operator==(const ResponseModel &) const = default;
};

/// @brief Population constants with no athlete evidence attached.
[[nodiscard]] ResponseModel populationDefaults() noexcept;

struct ResponseState {
    core::f64 fitness{0.0};
    core::f64 fatigue{0.0};
};

/**
 * @brief Fitness and fatigue entering each of @p dates.
 *
 * Loads before the series start and after its end count as zero.
 *
 * @param dates Evaluation days in any order.
 * @return One state per date, in the order given.
 */
[[nodiscard]] std::vector<ResponseState> responseStates(
    const session::DailyLoadSeries &series,
    std::span<const core::Date> dates,
    core::f64 tau1,
    core::f64 tau2);

/// @brief baseline + k1 * fitness - k2 * fatigue.
[[nodiscard]] core::f64 performanceFromState(const ResponseModel &model, const ResponseState &state) noexcept;

/// @brief Model performance entering @p day.
[[nodiscard]] core::f64 performanceAt(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date day);

} // namespace tpo::model

#endif // TPO_MODEL_RESPONSE_MODEL_HPP
