/**
 * @file Calibrator.cpp
 * @brief Bounded nonlinear least-squares calibration with shrinkage.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/model/Calibrator.hpp>

#include <tpo/core/Log.hpp>
#include <tpo/math/LeastSquares.hpp>
#include <tpo/math/Statistics.hpp>
#include <tpo/model/Vdot.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <map>
#include <utility>
#include <vector>

namespace tpo::model {

namespace {

constexpr std::string_view kTag = "Calibrator";

constexpr core::f64 kTauScale             = 10.0;
constexpr core::f64 kK1Scale              = 0.002;
constexpr core::f64 kK2Scale              = 0.005;
constexpr core::f64 kMinResidualVariance  = 0.25;
constexpr core::f64 kPoorFitStdDev        = 2.0;
constexpr core::f64 kVeryPoorFitStdDev    = 4.0;
constexpr core::f64 kObservationHalfLife  = 365.0;
constexpr core::f64 kKeySessionWeight     = 0.5;
constexpr core::usize kMinMonthlyHrRuns   = 5;

enum Param : Eigen::Index { kTau1 = 0, kTau2, kK1, kK2, kBaseline, kParamCount };

struct Observation {
    core::Date date;
    core::f64  performance{0.0};
    core::f64  weight{1.0};
};

ResponseModel withParams(ResponseModel model, const Eigen::VectorXd &p)
{
    model.tau1     = p[kTau1];
    model.tau2     = p[kTau2];
    model.k1       = p[kK1];
    model.k2       = p[kK2];
    model.baseline = p[kBaseline];
    return model;
}

/// Model minus observed performance for every observation.
std::vector<core::f64> rawResiduals(
    const session::DailyLoadSeries &series,
    const std::vector<core::Date> &dates,
    const std::vector<Observation> &obs,
    const ResponseModel &model)
{
    const auto states = responseStates(series, dates, model.tau1, model.tau2);
    std::vector<core::f64> out(obs.size());
    for (core::usize i = 0; i < obs.size(); ++i)
        out[i] = performanceFromState(model, states[i]) - obs[i].performance;
    return out;
}

core::f64 residualVarianceOf(const std::vector<core::f64> &residuals, core::usize dof)
{
    if (residuals.size() < 2)
        return core::kPopulationResidualVar;

    core::f64 ssr = 0.0;
    for (core::f64 r : residuals)
        ssr += r * r;
    return std::max(ssr / static_cast<core::f64>(std::max<core::usize>(dof, 1)), kMinResidualVariance);
}

core::f64 rSquaredOf(const std::vector<core::f64> &residuals, const std::vector<Observation> &obs)
{
    std::vector<core::f64> perf(obs.size());
    std::transform(obs.begin(), obs.end(), perf.begin(), [](const Observation &o) { return o.performance; });
    const core::f64 mean = math::Statistics::mean(perf);

    core::f64 sst = 0.0;
    core::f64 ssr = 0.0;
    for (core::usize i = 0; i < obs.size(); ++i)
    {
        sst += (perf[i] - mean) * (perf[i] - mean);
        ssr += residuals[i] * residuals[i];
    }
    return sst > 0.0 ? 1.0 - ssr / sst : 0.0;
}

/**
 * Population constants; the baseline absorbs the athlete's mean residual.
 */
ResponseModel populationModel(
    ResponseModel model,
    const session::DailyLoadSeries &series,
    const std::vector<core::Date> &dates,
    const std::vector<Observation> &obs)
{
    model.source = ModelSource::kPopulationDefault;
    if (obs.empty())
        return model;

    auto residuals = rawResiduals(series, dates, obs, model);
    core::f64 shift       = 0.0;
    core::f64 totalWeight = 0.0;
    for (core::usize i = 0; i < residuals.size(); ++i)
    {
        shift       += obs[i].weight * residuals[i];
        totalWeight += obs[i].weight;
    }
    shift /= totalWeight;

    model.baseline = std::clamp(model.baseline - shift, core::kBaselineMin, core::kBaselineMax);
    residuals = rawResiduals(series, dates, obs, model);

    model.residualVariance = residualVarianceOf(residuals, residuals.size() - 1);
    model.rSquared         = rSquaredOf(residuals, obs);
    return model;
}

/**
 * Key-session evidence: one pseudo-VDOT per calendar month with enough
 * heart-rate runs, from the mean of pace (s/km) over average heart rate.
 * Each marker is dated at the month's middle run.
 */
std::vector<std::pair<core::Date, core::f64>> efficiencyMarkers(
    std::span<const session::Session> sessions,
    core::Date after)
{
    std::map<std::chrono::year_month, std::vector<const session::Session *>> months;
    for (const auto &s : sessions)
    {
        if (s.type == session::SessionType::kRace || !s.avgHeartRate || *s.avgHeartRate <= 0.0
            || s.distanceM <= 0.0 || s.durationS <= 0.0)
            continue;
        const std::chrono::year_month_day ymd{s.date};
        months[ymd.year() / ymd.month()].push_back(&s);
    }

    std::vector<std::pair<core::Date, core::f64>> markers;
    for (const auto &[month, runs] : months)
    {
        if (runs.size() < kMinMonthlyHrRuns)
            continue;

        core::f64 sum = 0.0;
        for (const auto *run : runs)
            sum += (run->durationS / (run->distanceM / 1000.0)) / *run->avgHeartRate;
        const core::f64 efficiency = sum / static_cast<core::f64>(runs.size());

        const core::Date date = runs[runs.size() / 2]->date;
        if (date <= after)
            continue;
        markers.emplace_back(date, std::clamp(80.0 - 10.0 * efficiency, core::kBaselineMin, core::kBaselineMax));
    }
    return markers;
}

} // namespace

core::ConfidenceLabel calibrationConfidence(
    core::u32 observations,
    core::f64 residualStdDev,
    core::i32 historyDays) noexcept
{
    using core::ConfidenceLabel;

    if (observations == 0)
        return ConfidenceLabel::kInsufficient;

    ConfidenceLabel label = observations >= 6 ? ConfidenceLabel::kHigh
                          : observations >= 3 ? ConfidenceLabel::kModerate
                                              : ConfidenceLabel::kLow;

    if (residualStdDev > kVeryPoorFitStdDev)
        label = core::downgrade(label, 2, ConfidenceLabel::kLow);
    else if (residualStdDev > kPoorFitStdDev)
        label = core::downgrade(label, 1, ConfidenceLabel::kLow);

    if (historyDays < core::kMinHistoryDaysForHigh)
        label = std::min(label, ConfidenceLabel::kLow);
    return label;
}

core::Expected<ResponseModel> calibrate(
    std::span<const session::Session> sessions,
    std::span<const session::RaceResult> races,
    const CalibrationOptions &options)
{
    ResponseModel model = populationDefaults();
    model.version = options.previousVersion + 1;

    std::vector<core::f64> raceVdots;
    raceVdots.reserve(races.size());
    for (const auto &race : races)
        raceVdots.push_back(TPO_TRY(vdotFromRace(race.distanceM, race.timeS)));

    if (sessions.empty())
    {
        if (!raceVdots.empty())
            model.baseline = std::clamp(math::Statistics::mean(raceVdots), core::kBaselineMin, core::kBaselineMax);
        model.diagnostics.push_back({core::ErrorCode::kInsufficientData, "no training history; population model"});
        core::Log::warn(kTag, "no sessions supplied, using population defaults");
        return model;
    }

    core::Date firstDay = sessions.front().date;
    core::Date lastDay  = sessions.front().date;
    for (const auto &s : sessions)
    {
        firstDay = std::min(firstDay, s.date);
        lastDay  = std::max(lastDay, s.date);
    }
    for (const auto &race : races)
        lastDay = std::max(lastDay, race.date);

    const auto series = session::DailyLoadSeries::fromSessions(sessions, lastDay);
    model.trainingDays = static_cast<core::i32>(series.size());

    std::vector<Observation> obs;
    std::vector<core::Date>  dates;
    const auto observe = [&](core::Date date, core::f64 performance, core::f64 scale) {
        const core::f64 age = static_cast<core::f64>(core::daysBetween(date, lastDay));
        obs.push_back({date, performance,
                       scale * (0.5 + 0.5 * math::Statistics::halfLifeWeight(age, kObservationHalfLife))});
        dates.push_back(date);
    };

    core::u32 excluded = 0;
    for (core::usize i = 0; i < races.size(); ++i)
    {
        if (races[i].date <= firstDay)
        {
            ++excluded;
            continue;
        }
        observe(races[i].date, raceVdots[i], 1.0);
    }

    // Race-type sessions without a matching result count as races.
    for (const auto &s : sessions)
    {
        if (s.type != session::SessionType::kRace)
            continue;
        if (std::any_of(races.begin(), races.end(), [&](const session::RaceResult &r) { return r.date == s.date; }))
            continue;
        if (s.date <= firstDay)
        {
            ++excluded;
            continue;
        }
        const auto vdot = vdotFromRace(s.distanceM, s.durationS);
        if (!vdot)
        {
            core::Log::debug(kTag, std::format("race session {} skipped: {}", s.id, vdot.error().message()));
            continue;
        }
        observe(s.date, *vdot, 1.0);
    }
    if (excluded > 0)
        model.diagnostics.push_back({core::ErrorCode::kInsufficientData,
                                     std::format("{} race(s) precede the training history and were ignored", excluded)});

    const auto n = static_cast<core::u32>(obs.size());
    model.observationCount = n;
    if (!dates.empty())
        model.lastObservation = *std::max_element(dates.begin(), dates.end());

    if (n < options.minRaceObservations)
    {
        for (const auto &[date, vdot] : efficiencyMarkers(sessions, firstDay))
            observe(date, vdot, kKeySessionWeight);
        model.keySessionCount = static_cast<core::u32>(obs.size()) - n;
        if (model.keySessionCount > 0)
            model.diagnostics.push_back({core::ErrorCode::kInsufficientData,
                                         std::format("{} race(s); {} efficiency marker(s) added at reduced weight",
                                                     n, model.keySessionCount)});
    }

    const auto m = static_cast<core::u32>(obs.size());
    if (m < options.minRaceObservations)
    {
        model = populationModel(std::move(model), series, dates, obs);
        model.confidence = std::min(
            calibrationConfidence(n, std::sqrt(model.residualVariance), model.trainingDays),
            core::ConfidenceLabel::kLow);
        model.diagnostics.push_back({core::ErrorCode::kInsufficientData,
                                     std::format("{} usable observation(s), {} required for an individual fit",
                                                 m, options.minRaceObservations)});
        core::Log::info(kTag, std::format("population defaults with {} observation(s), baseline {:.1f}",
                                          m, model.baseline));
        return model;
    }

    Eigen::VectorXd lower(kParamCount);
    Eigen::VectorXd upper(kParamCount);
    lower << core::kTauMin, core::kTauMin, core::kK1Min, core::kK2Min, core::kBaselineMin;
    upper << core::kTauMax, core::kTauMax, core::kK1Max, core::kK2Max, core::kBaselineMax;

    const core::f64 priorWeight = options.priorStrength / std::sqrt(static_cast<core::f64>(m));

    const math::ResidualFunction residualFn = [&](const Eigen::VectorXd &p) -> Eigen::VectorXd {
        const auto raw = rawResiduals(series, dates, obs, withParams(model, p));

        Eigen::VectorXd r(static_cast<Eigen::Index>(m) + 4);
        for (core::u32 i = 0; i < m; ++i)
            r[i] = std::sqrt(obs[i].weight) * raw[i];
        r[m + 0] = priorWeight * (p[kTau1] - core::kPopulationTau1) / kTauScale;
        r[m + 1] = priorWeight * (p[kTau2] - core::kPopulationTau2) / kTauScale;
        r[m + 2] = priorWeight * (p[kK1] - core::kPopulationK1) / kK1Scale;
        r[m + 3] = priorWeight * (p[kK2] - core::kPopulationK2) / kK2Scale;
        return r;
    };

    const math::BoundedLevenbergMarquardt solver(lower, upper);
    const core::f64 seeds[][2] = {{42.0, 7.0}, {25.0, 10.0}, {50.0, 15.0}, {12.0, 30.0}};

    std::optional<math::LmResult> best;
    for (const auto &seed : seeds)
    {
        ResponseModel start = model;
        start.tau1 = seed[0];
        start.tau2 = seed[1];
        start = populationModel(std::move(start), series, dates, obs);

        Eigen::VectorXd x0(kParamCount);
        x0 << start.tau1, start.tau2, start.k1, start.k2, start.baseline;

        auto fit = solver.minimize(residualFn, x0);
        if (!fit)
        {
            core::Log::debug(kTag, std::format("seed ({}, {}) failed: {}", seed[0], seed[1], fit.error().message()));
            continue;
        }
        if (!best || fit->cost < best->cost)
            best = std::move(*fit);
    }

    if (!best)
    {
        model = populationModel(std::move(model), series, dates, obs);
        model.confidence = std::min(
            calibrationConfidence(n, std::sqrt(model.residualVariance), model.trainingDays),
            core::ConfidenceLabel::kLow);
        model.diagnostics.push_back({core::ErrorCode::kCalibrationFailed, "least-squares fit failed from every seed"});
        core::Log::warn(kTag, "individual fit failed, falling back to population defaults");
        return model;
    }

    model = withParams(std::move(model), best->params);
    model.source = ModelSource::kIndividual;

    const auto residuals = rawResiduals(series, dates, obs, model);
    model.residualVariance = residualVarianceOf(residuals, residuals.size() - 1);
    model.rSquared         = rSquaredOf(residuals, obs);

    const core::f64 sd = std::sqrt(model.residualVariance);
    model.confidence = calibrationConfidence(n, sd, model.trainingDays);
    if (n < options.minRaceObservations)
        model.confidence = std::min(model.confidence, core::ConfidenceLabel::kLow);
    if (sd > kPoorFitStdDev)
        model.diagnostics.push_back({core::ErrorCode::kPoorFit,
                                     std::format("residual std-dev {:.2f} VDOT", sd)});
    if (model.trainingDays < core::kMinHistoryDaysForHigh)
        model.diagnostics.push_back({core::ErrorCode::kInsufficientData,
                                     std::format("only {} days of training history", model.trainingDays)});

    core::Log::info(kTag, std::format(
        "fit n={}+{} tau1={:.1f} tau2={:.1f} k1={:.4f} k2={:.4f} baseline={:.1f} sd={:.2f} ({})",
        n, model.keySessionCount, model.tau1, model.tau2, model.k1, model.k2, model.baseline, sd,
        core::confidenceLabelName(model.confidence)));
    return model;
}

} // namespace tpo::model
