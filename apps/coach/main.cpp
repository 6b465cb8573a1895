/**
 * @file main.cpp
 * @brief Coaching demo: one synthetic athlete from history to plan.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tpo/core/Log.hpp>
#include <tpo/engine/CoachEngine.hpp>
#include <tpo/sim/SyntheticHistory.hpp>

#include <cstdlib>
#include <format>

using namespace tpo;

namespace {

constexpr const char *kTag = "Coach";

int fail(const core::Error &error)
{
    core::Log::error(kTag, std::format("{}: {}", core::errorCodeName(error.code()), error.message()));
    return EXIT_FAILURE;
}

} // namespace

// ─── MAIN ─────────────────────────────────────────────────────

int main()
{
    core::Log::info(kTag, "=== Tempo coach ===");

    // 1. Start the engine
    engine::CoachEngine coach{engine::Config::Builder{}.workerThreads(2).logLevel(core::LogLevel::kInfo).build()};
    if (auto started = coach.init(); !started)
        return fail(started.error());

    // 2. Generate and record six months of training
    sim::SyntheticHistory generator{42};
    const auto data = generator.generate("demo-athlete");
    if (!data)
        return fail(data.error());

    const core::AthleteId &id = data->athlete.id;
    if (auto registered = coach.registerAthlete(data->athlete); !registered)
        return fail(registered.error());
    for (const auto &s : data->sessions)
    {
        if (auto recorded = coach.recordSession(id, s); !recorded)
            return fail(recorded.error());
    }
    for (const auto &race : data->races)
    {
        if (auto recorded = coach.recordRace(id, race); !recorded)
            return fail(recorded.error());
    }
    core::Log::info(kTag, std::format("{} sessions and {} races up to {}", data->sessions.size(), data->races.size(),
                                      core::toString(data->lastDay)));

    // 3. Calibrate and predict
    const auto fitted = coach.calibrate(id);
    if (!fitted)
        return fail(fitted.error());
    core::Log::info(kTag, std::format("tau1 {:.1f} d, tau2 {:.1f} d, baseline {:.1f} VDOT ({})", fitted->tau1,
                                      fitted->tau2, fitted->baseline,
                                      core::confidenceLabelName(fitted->confidence)));

    const core::Date raceDay = core::addDays(data->lastDay, 17 * core::kDaysPerWeek - 1);
    const auto prediction    = coach.predict(id, raceDay, model::kMarathonM);
    if (!prediction)
        return fail(prediction.error());
    core::Log::info(kTag, std::format("marathon on {}: {:.0f} s (80% {:.0f}-{:.0f} s, {}), taper {} weeks",
                                      core::toString(raceDay), prediction->predictedTimeS, prediction->fastestTimeS,
                                      prediction->slowestTimeS, core::confidenceLabelName(prediction->confidence),
                                      prediction->taperWeeks));
    for (const auto &diagnostic : prediction->diagnostics)
        core::Log::warn(kTag, diagnostic.message);

    // 4. Where the athlete stands
    const auto snapshot = coach.analyse(id, data->lastDay);
    if (!snapshot)
        return fail(snapshot.error());
    core::Log::info(kTag, std::format("peak week {:.1f} km, peak long run {:.1f} km, {}",
                                      snapshot->fitness.peakWeeklyVolume.value / 1000.0,
                                      snapshot->fitness.peakLongRun.value / 1000.0,
                                      bank::experienceLevelName(snapshot->fitness.experience)));
    for (const auto &p : snapshot->phases)
        core::Log::info(kTag, std::format("  {} {} .. {}", phase::phaseLabelName(p.label), core::toString(p.startDate),
                                          core::toString(p.endDate)));
    if (snapshot->constraint.active)
        core::Log::info(kTag, std::format("active constraint: {}",
                                          bank::constraintTypeName(snapshot->constraint.active->type)));

    // 5. Plan the race
    const core::Date planStart = core::addDays(data->lastDay, 1);
    const auto built           = coach.synthesizePlan(id, planStart, raceDay);
    if (!built)
        return fail(built.error());
    for (const auto &week : built->weeks)
        core::Log::info(kTag, std::format("  week {:2} {} {:8} {:5.1f} km{}", week.index, core::toString(week.weekStart),
                                          phase::phaseLabelName(week.label), week.volume() / 1000.0,
                                          week.cutback ? " (cutback)" : ""));

    // 6. Propose a change and confirm it
    const auto &firstWeek = built->weeks.front();
    if (const auto *longRun = firstWeek.longRun())
    {
        const auto proposal =
            coach.proposeChange(id, plan::ChangeRequest::adjustLoad(longRun->id, plan::LoadAdjustment::kReduceLight));
        if (!proposal)
            return fail(proposal.error());

        const auto text = coach.explainProposal(proposal->id, std::stop_token{});
        if (!text)
            return fail(text.error());
        core::Log::info(kTag, *text);

        const auto outcome = coach.confirm(proposal->id, "demo-confirm-1", planStart);
        if (!outcome)
            return fail(outcome.error());
        core::Log::info(kTag, std::format("proposal {}: {} ({} actions)", proposal->id,
                                          plan::proposalStatusName(outcome->status),
                                          outcome->receipt ? outcome->receipt->actionsApplied : 0));
    }

    // 7. Insights
    const auto feed = coach.insights(id, data->lastDay);
    if (!feed)
        return fail(feed.error());
    if (feed->empty())
        core::Log::info(kTag, "no insights today");
    for (const auto &insight : *feed)
    {
        core::Log::info(kTag, std::format("[{:5.1f}] {} ({})", insight.priority, insight.title,
                                          core::confidenceLabelName(insight.confidence)));
    }

    // 8. Shut down
    coach.shutdown();
    return EXIT_SUCCESS;
}
