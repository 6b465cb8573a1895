/**
 * @file ResponseModel.cpp
 * @brief Impulse-response state evaluation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/model/ResponseModel.hpp>

#include <tpo/core/Constants.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace tpo::model {

std::string_view modelSourceName(ModelSource source) noexcept
{
    switch (source)
    {
        case ModelSource::kPopulationDefault: return "population_default";
        case ModelSource::kIndividual:        return "individual";
    }
    return "unknown";
}

ResponseModel populationDefaults() noexcept
{
    ResponseModel model;
    model.tau1             = core::kPopulationTau1;
    model.tau2             = core::kPopulationTau2;
    model.k1               = core::kPopulationK1;
    model.k2               = core::kPopulationK2;
    model.baseline         = core::kPopulationBaseline;
    model.residualVariance = core::kPopulationResidualVar;
    return model;
}

std::vector<ResponseState> responseStates(
    const session::DailyLoadSeries &series,
    std::span<const core::Date> dates,
    core::f64 tau1,
    core::f64 tau2)
{
    std::vector<ResponseState> out(dates.size());
    if (dates.empty() || series.empty())
        return out;

    std::vector<core::usize> order(dates.size());
    std::iota(order.begin(), order.end(), core::usize{0});
    std::sort(order.begin(), order.end(),
              [&](core::usize a, core::usize b) { return dates[a] < dates[b]; });

    const core::f64 decay1 = std::exp(-1.0 / tau1);
    const core::f64 decay2 = std::exp(-1.0 / tau2);

    // state(d + 1) = decay * (state(d) + load(d)), state(start) = 0.
    ResponseState state;
    core::Date    day = series.start();
    const auto    loads = series.values();

    for (core::usize idx : order)
    {
        const core::Date target = dates[idx];
        if (target <= series.start())
            continue;

        while (day < target)
        {
            const core::i32 offset = core::daysBetween(series.start(), day);
            const core::f64 load   = static_cast<core::usize>(offset) < loads.size()
                ? loads[static_cast<core::usize>(offset)]
                : 0.0;
            state.fitness = decay1 * (state.fitness + load);
            state.fatigue = decay2 * (state.fatigue + load);
            day = core::addDays(day, 1);
        }
        out[idx] = state;
    }
    return out;
}

core::f64 performanceFromState(const ResponseModel &model, const ResponseState &state) noexcept
{
    return model.baseline + model.k1 * state.fitness - model.k2 * state.fatigue;
}

core::f64 performanceAt(const ResponseModel &model, const session::DailyLoadSeries &series, core::Date day)
{
    const core::Date dates[] = {day};
    return performanceFromState(model, responseStates(series, dates, model.tau1, model.tau2).front());
}

} // namespace tpo::model
