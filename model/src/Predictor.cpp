/**
 * @file Predictor.cpp
 * @brief Race-time prediction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/model/Predictor.hpp>

#include <tpo/core/Log.hpp>
#include <tpo/model/TaperOptimizer.hpp>
#include <tpo/model/Vdot.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace tpo::model {

namespace {

constexpr std::string_view kTag = "Predictor";
constexpr core::f64 kGapWidening = 1.5;

core::f64 baseVariance(const ResponseModel &model) noexcept
{
    if (model.observationCount == 0)
        return 2.0 * core::kPopulationResidualVar;
    return model.residualVariance * (1.0 + 1.0 / static_cast<core::f64>(model.observationCount));
}

} // namespace

core::Expected<Prediction> predict(
    const ResponseModel &model,
    const session::DailyLoadSeries &series,
    core::Date targetDate,
    core::f64 distanceM,
    const PredictOptions &options)
{
    if (distanceM <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("race distance must be positive, got {} m", distanceM));
    if (!series.empty() && targetDate < series.start())
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("target {} precedes the load history ({})",
                                           core::toString(targetDate), core::toString(series.start())));

    Prediction p;
    p.targetDate       = targetDate;
    p.distanceM        = distanceM;
    p.confidence       = model.confidence;
    p.taperStart       = targetDate;
    p.modelVersion     = model.version;
    p.observationCount = model.observationCount;

    if (model.confidence == core::ConfidenceLabel::kInsufficient)
        p.diagnostics.push_back({core::ErrorCode::kInsufficientData, "model has no race observations"});

    if (series.empty())
    {
        p.predictedVdot = model.baseline;
        p.diagnostics.push_back({core::ErrorCode::kInsufficientData, "no training load history"});
    }
    else if (targetDate <= core::addDays(series.end(), 1))
    {
        p.predictedVdot = performanceAt(model, series, targetDate);
    }
    else
    {
        const TaperPlan taper = optimalTaper(model, series, targetDate, options.maxTaperWeeks);
        p.predictedVdot = taper.performance;
        p.taperWeeks    = taper.taperWeeks;
        p.taperStart    = taper.taperStart;
    }
    p.predictedVdot = std::clamp(p.predictedVdot, kVdotMin, kVdotMax);

    core::f64 sd = std::sqrt(baseVariance(model));

    if (model.lastObservation)
    {
        const auto age = std::max(0, core::daysBetween(*model.lastObservation, targetDate));
        sd *= 1.0 + static_cast<core::f64>(age) / static_cast<core::f64>(core::kRecencyScaleDays);
    }

    if (!series.empty())
    {
        const auto horizon = std::max(0, core::daysBetween(series.end(), targetDate));
        sd *= 1.0 + static_cast<core::f64>(horizon) / static_cast<core::f64>(core::kHorizonScaleDays);

        const core::Date from = std::max(series.start(), core::addDays(series.end(), 1 - core::kGapLookbackDays));
        const auto gaps = series.gaps(from, series.end(), core::kGapThresholdDays);
        if (!gaps.empty())
        {
            core::i32 gapDays = 0;
            for (const auto &g : gaps)
                gapDays += g.days();

            sd *= kGapWidening;
            p.confidence = core::downgrade(p.confidence);
            p.diagnostics.push_back({core::ErrorCode::kDataGap,
                                     std::format("{} unexplained gap(s) totalling {} day(s) in the last {} days",
                                                 gaps.size(), gapDays, core::kGapLookbackDays)});
            core::Log::warn(kTag, p.diagnostics.back().message);
        }
    }
    p.vdotStdDev = sd;

    const core::f64 halfWidth = core::kInterval80Z * sd;
    p.predictedTimeS = TPO_TRY(raceTimeForVdot(p.predictedVdot, distanceM));
    p.fastestTimeS   = TPO_TRY(raceTimeForVdot(p.predictedVdot + halfWidth, distanceM));
    p.slowestTimeS   = TPO_TRY(raceTimeForVdot(p.predictedVdot - halfWidth, distanceM));
    return p;
}

} // namespace tpo::model
