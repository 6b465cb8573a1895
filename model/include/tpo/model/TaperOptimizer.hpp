/**
 * @file TaperOptimizer.hpp
 * @brief Discrete search for the taper length maximising race-day form.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MODEL_TAPER_OPTIMIZER_HPP
    #define TPO_MODEL_TAPER_OPTIMIZER_HPP

    #include "ResponseModel.hpp"

    #include <tpo/core/Constants.hpp>

    #include <vector>

namespace tpo::model {

struct TaperCandidate {
    core::u32 weeks{0};
    core::f64 performance{0.0};

    [[nodiscard]] bool operator==(const TaperCandidate &) const = default;
};

struct TaperPlan {
    core::u32                   taperWeeks{0};
    core::Date                  taperStart{};  ///< First reduced day (race day when no taper).
    core::f64                   performance{0.0};
    std::vector<TaperCandidate> candidates;

    [[nodiscard]] bool operator==(const TaperPlan &) const = default;
};

/**
 * @brief Daily loads leading up to @p raceDate under a taper of
 *        @p taperWeeks weeks.
 *
 * Days after the series end are filled with the trailing 28-day mean
 * load; days inside the taper window (and after the series end) are
 * scaled linearly down to 40 % on the eve of the race.
 */
[[nodiscard]] session::DailyLoadSeries projectLoads(
    const session::DailyLoadSeries &series,
    core::Date raceDate,
    core::u32 taperWeeks);

/// @brief Race-day performance under a taper of @p taperWeeks weeks.
[[nodiscard]] core::f64 taperPerformance(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date raceDate,
    core::u32 taperWeeks);

/**
 * @brief Evaluates every feasible taper length up to @p maxWeeks.
 *
 * A taper is feasible when its window starts after the last recorded day.
 * The strictly best candidate wins; ties go to the shorter taper.
 */
[[nodiscard]] TaperPlan optimalTaper(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date raceDate,
    core::u32 maxWeeks = core::kDefaultMaxTaperWeeks);

} // namespace tpo::model

#endif // TPO_MODEL_TAPER_OPTIMIZER_HPP
