/**
 * @file TaperOptimizer.cpp
 * @brief Load projection and taper search.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/model/TaperOptimizer.hpp>

#include <tpo/core/Log.hpp>

#include <algorithm>
#include <format>

namespace tpo::model {

session::DailyLoadSeries projectLoads(
    const session::DailyLoadSeries &series,
    core::Date raceDate,
    core::u32 taperWeeks)
{
    if (series.empty())
        return series;

    const core::Date lastRecorded = series.end();
    const core::Date eve          = core::addDays(raceDate, -1);
    if (eve <= lastRecorded)
        return series;

    const core::f64 fill = series.trailingMean(lastRecorded, core::kTrailingLoadDays);
    std::vector<core::f64> loads(series.values().begin(), series.values().end());
    loads.resize(static_cast<core::usize>(core::daysBetween(series.start(), eve) + 1), fill);

    const core::i32 window = static_cast<core::i32>(taperWeeks) * core::kDaysPerWeek;
    for (core::i32 d = 1; d <= window; ++d)
    {
        const core::Date day = core::addDays(raceDate, -d);
        if (day <= lastRecorded)
            break;

        // d == 1 is race eve and gets the floor; the window start is barely reduced.
        const core::f64 progress = static_cast<core::f64>(window - d + 1) / static_cast<core::f64>(window);
        const core::f64 factor   = 1.0 - (1.0 - core::kTaperFloorFraction) * progress;
        loads[static_cast<core::usize>(core::daysBetween(series.start(), day))] *= factor;
    }
    return session::DailyLoadSeries{series.start(), std::move(loads)};
}

core::f64 taperPerformance(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date raceDate,
    core::u32 taperWeeks)
{
    return performanceAt(model, projectLoads(series, raceDate, taperWeeks), raceDate);
}

TaperPlan optimalTaper(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date raceDate,
    core::u32 maxWeeks)
{
    TaperPlan plan;
    plan.taperStart = raceDate;

    const core::i32 daysAhead = series.empty() ? 0 : core::daysBetween(series.end(), raceDate);

    for (core::u32 weeks = 0; weeks <= maxWeeks; ++weeks)
    {
        if (weeks > 0 && static_cast<core::i32>(weeks) * core::kDaysPerWeek >= daysAhead)
            break;

        const core::f64 perf = taperPerformance(model, series, raceDate, weeks);
        plan.candidates.push_back({weeks, perf});

        if (weeks == 0 || perf > plan.performance)
        {
            plan.taperWeeks  = weeks;
            plan.performance = perf;
            plan.taperStart  = core::addDays(raceDate, -static_cast<core::i32>(weeks) * core::kDaysPerWeek);
        }
    }

    core::Log::debug("TaperOptimizer", std::format("race {} best taper {} week(s), performance {:.2f}",
                                                   core::toString(raceDate), plan.taperWeeks, plan.performance));
    return plan;
}

} // namespace tpo::model
