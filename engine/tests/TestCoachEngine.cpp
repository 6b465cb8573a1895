/**
 * @file TestCoachEngine.cpp
 * @brief Integration tests for the coaching façade.
 */

#include <catch2/catch_test_macros.hpp>

#include "tpo/engine/CoachEngine.hpp"
#include "tpo/model/Vdot.hpp"
#include "tpo/sim/SyntheticHistory.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace tpo::engine {

namespace {

const core::Date kPlanStart = core::makeDate(2024, 6, 17);
const core::Date kRaceDay   = core::makeDate(2024, 10, 13);

Config testConfig()
{
    return Config::Builder{}.workerThreads(2).logLevel(core::LogLevel::kWarn).build();
}

sim::SyntheticData synthetic(const core::AthleteId &id, core::u64 seed)
{
    sim::SyntheticHistory generator{seed};
    auto data = generator.generate(id);
    REQUIRE(data.has_value());
    return std::move(*data);
}

void feed(CoachEngine &engine, const sim::SyntheticData &data)
{
    REQUIRE(engine.registerAthlete(data.athlete).has_value());
    for (const auto &s : data.sessions)
        REQUIRE(engine.recordSession(data.athlete.id, s).has_value());
    for (const auto &race : data.races)
        REQUIRE(engine.recordRace(data.athlete.id, race).has_value());
}

session::Session easyRun(core::i32 offset, core::f64 load)
{
    session::Session s;
    s.id           = "s" + std::to_string(offset);
    s.date         = core::addDays(core::makeDate(2024, 1, 1), offset);
    s.type         = session::SessionType::kEasy;
    s.distanceM    = 8000.0;
    s.durationS    = 8000.0 / 3.0;
    s.trainingLoad = load;
    return s;
}

/// First workout of the plan's second week that a proposal may touch.
core::WorkoutId editableWorkout(const plan::Plan &plan)
{
    REQUIRE(plan.weeks.size() > 1);
    const auto &workouts = plan.weeks[1].workouts;
    const auto it        = std::ranges::find_if(workouts, [](const plan::Workout &w) {
        return w.type != plan::WorkoutType::kRace && w.status == plan::WorkoutStatus::kPlanned;
    });
    REQUIRE(it != workouts.end());
    return it->id;
}

} // namespace

TEST_CASE("engine lifecycle", "[engine]")
{
    SECTION("nothing runs before init")
    {
        CoachEngine engine{testConfig()};
        REQUIRE_FALSE(engine.isInitialised());

        session::Athlete athlete;
        athlete.id = "ath-1";
        REQUIRE(engine.registerAthlete(athlete).error().code() == core::ErrorCode::kInvalidState);
        REQUIRE(engine.submitCalibrate("ath-1").get().error().code() == core::ErrorCode::kInvalidState);
    }

    SECTION("an invalid configuration refuses to start")
    {
        CoachEngine engine{Config::Builder{}.maxTaperWeeks(0).build()};
        REQUIRE(engine.init().error().code() == core::ErrorCode::kInvalidArgument);
        REQUIRE_FALSE(engine.isInitialised());
    }

    SECTION("init once, shutdown twice")
    {
        CoachEngine engine{testConfig()};
        REQUIRE(engine.init().has_value());
        REQUIRE(engine.isInitialised());
        REQUIRE(engine.init().error().code() == core::ErrorCode::kInvalidState);

        engine.shutdown();
        engine.shutdown();
        REQUIRE_FALSE(engine.isInitialised());
        REQUIRE(engine.calibrate("ath-1").error().code() == core::ErrorCode::kInvalidState);
    }
}

TEST_CASE("athlete registration and data intake", "[engine]")
{
    CoachEngine engine{testConfig()};
    REQUIRE(engine.init().has_value());

    session::Athlete athlete;
    athlete.id = "ath-1";
    REQUIRE(engine.registerAthlete(athlete).has_value());
    REQUIRE(engine.registerAthlete(athlete).error().code() == core::ErrorCode::kAlreadyExists);

    session::Athlete lazy;
    lazy.id          = "ath-2";
    lazy.daysPerWeek = 2;
    REQUIRE(engine.registerAthlete(lazy).error().code() == core::ErrorCode::kInvalidArgument);

    REQUIRE(engine.recordSession("nobody", easyRun(0, 50.0)).error().code() == core::ErrorCode::kNotFound);
    REQUIRE(engine.recordSession("ath-1", easyRun(0, 0.0)).has_value());
    REQUIRE(engine.recordSession("ath-1", easyRun(0, 50.0)).error().code() == core::ErrorCode::kAlreadyExists);

    REQUIRE(engine.recordRace("ath-1", {core::makeDate(2024, 1, 6), 0.0, 1200.0}).error().code() ==
            core::ErrorCode::kInvalidArgument);

    bank::ConstraintSignal backwards;
    backwards.reportedAt = core::makeDate(2024, 2, 1);
    backwards.resolvedAt = core::makeDate(2024, 1, 1);
    REQUIRE(engine.reportConstraint("ath-1", backwards).error().code() == core::ErrorCode::kInvalidArgument);

    REQUIRE(engine.activePlan("ath-1").error().code() == core::ErrorCode::kNotFound);
    REQUIRE(engine.proposeChange("ath-1", plan::ChangeRequest::skip("w01d1")).error().code() ==
            core::ErrorCode::kNotFound);
}

TEST_CASE("calibrate, predict and analyse a synthetic athlete", "[engine]")
{
    CoachEngine engine{testConfig()};
    REQUIRE(engine.init().has_value());
    const auto data = synthetic("ath-1", 11);
    feed(engine, data);

    const auto first = engine.calibrate("ath-1");
    REQUIRE(first.has_value());
    REQUIRE(first->tau1 > 0.0);
    REQUIRE(first->tau2 > 0.0);
    REQUIRE(first->version == 1);
    REQUIRE(engine.calibrate("ath-1")->version == 2);

    const auto prediction = engine.predict("ath-1", core::makeDate(2024, 7, 14), 10'000.0);
    REQUIRE(prediction.has_value());
    REQUIRE(prediction->predictedTimeS > 0.0);
    REQUIRE(prediction->fastestTimeS <= prediction->predictedTimeS);
    REQUIRE(prediction->slowestTimeS >= prediction->predictedTimeS);

    const auto snapshot = engine.analyse("ath-1", data.lastDay);
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->fitness.peakWeeklyVolume.value > 0.0);
    REQUIRE(snapshot->fitness.peakLongRun.value > 0.0);
    REQUIRE_FALSE(snapshot->phases.empty());
    REQUIRE_FALSE(snapshot->constraint.active.has_value());

    SECTION("a reported injury becomes the active constraint")
    {
        bank::ConstraintSignal injury;
        injury.type       = bank::ConstraintType::kInjury;
        injury.reportedAt = core::addDays(data.lastDay, -3);
        REQUIRE(engine.reportConstraint("ath-1", injury).has_value());

        const auto hurt = engine.analyse("ath-1", data.lastDay);
        REQUIRE(hurt.has_value());
        REQUIRE(hurt->constraint.active.has_value());
        REQUIRE(hurt->constraint.active->type == bank::ConstraintType::kInjury);
        REQUIRE(hurt->constraint.active->origin == bank::ConstraintOrigin::kExplicit);
    }
}

TEST_CASE("new race results replace the stored model", "[engine]")
{
    CoachEngine engine{testConfig()};
    REQUIRE(engine.init().has_value());

    sim::SyntheticHistory generator{23};
    sim::SyntheticProfile profile;
    profile.raceEveryWeeks = 0;
    generator.setProfile(profile);
    const auto data = generator.generate("ath-r");
    REQUIRE(data.has_value());
    feed(engine, *data);

    const core::Date raceDay = core::addDays(data->lastDay, 28);
    const auto before        = engine.predict("ath-r", raceDay, 10'000.0);
    REQUIRE(before.has_value());
    REQUIRE(before->modelVersion == 1);
    REQUIRE(before->observationCount == 0);
    REQUIRE(before->confidence == core::ConfidenceLabel::kInsufficient);

    const core::Date firstMonday = core::weekStart(profile.start);
    for (core::u32 week : {6u, 12u, 18u})
    {
        const core::Date date = core::addDays(firstMonday, static_cast<core::i32>(week) * core::kDaysPerWeek + 5);
        const auto timeS      = model::raceTimeForVdot(generator.vdotAt(week), 10'000.0);
        REQUIRE(timeS.has_value());
        REQUIRE(engine.recordRace("ath-r", {date, 10'000.0, *timeS}).has_value());
    }

    const auto after = engine.predict("ath-r", raceDay, 10'000.0);
    REQUIRE(after.has_value());
    REQUIRE(after->modelVersion == 2);
    REQUIRE(after->observationCount == 3);
    REQUIRE(after->confidence != core::ConfidenceLabel::kInsufficient);

    SECTION("an unchanged history reuses the stored model")
    {
        REQUIRE(engine.predict("ath-r", raceDay, 10'000.0)->modelVersion == 2);
    }

    SECTION("a race-type session also triggers recalibration")
    {
        session::Session race;
        race.id           = "ath-r-race";
        race.date         = core::addDays(data->lastDay, 1);
        race.type         = session::SessionType::kRace;
        race.distanceM    = 5'000.0;
        race.durationS    = 21.0 * 60.0;
        race.avgHeartRate = 175.0;
        REQUIRE(engine.recordSession("ath-r", race).has_value());

        const auto refreshed = engine.predict("ath-r", raceDay, 10'000.0);
        REQUIRE(refreshed.has_value());
        REQUIRE(refreshed->modelVersion == 3);
        REQUIRE(refreshed->observationCount == 4);
    }

    SECTION("four more weeks of training trigger recalibration")
    {
        for (core::i32 d = 1; d <= core::kRecalibrationCadenceDays + 1; d += 2)
        {
            session::Session run;
            run.id           = "ath-r-late-" + std::to_string(d);
            run.date         = core::addDays(data->lastDay, d);
            run.type         = session::SessionType::kEasy;
            run.distanceM    = 8'000.0;
            run.durationS    = 8'000.0 / 3.0;
            run.avgHeartRate = 140.0;
            REQUIRE(engine.recordSession("ath-r", run).has_value());
        }
        REQUIRE(engine.predict("ath-r", core::addDays(raceDay, 28), 10'000.0)->modelVersion == 3);
    }
}

TEST_CASE("plan, propose and confirm once", "[engine][plan]")
{
    CoachEngine engine{testConfig()};
    REQUIRE(engine.init().has_value());
    feed(engine, synthetic("ath-1", 21));

    const auto built = engine.synthesizePlan("ath-1", kPlanStart, kRaceDay);
    REQUIRE(built.has_value());
    REQUIRE(built->weeks.size() == 17);
    REQUIRE(built->revision == 1);
    REQUIRE(built->weeks.back().label == phase::PhaseLabel::kRace);
    REQUIRE(engine.activePlan("ath-1").value() == *built);

    const core::WorkoutId target = editableWorkout(*built);
    const auto proposal          = engine.proposeChange("ath-1", plan::ChangeRequest::skip(target));
    REQUIRE(proposal.has_value());
    REQUIRE(proposal->planRevision == 1);
    REQUIRE(engine.proposal(proposal->id)->status == plan::ProposalStatus::kProposed);

    const auto applied = engine.confirm(proposal->id, "key-1", kPlanStart);
    REQUIRE(applied.has_value());
    REQUIRE(applied->status == plan::ProposalStatus::kApplied);
    REQUIRE_FALSE(applied->conflict);
    REQUIRE(applied->receipt->actionsApplied == 1);

    const auto afterFirst = engine.activePlan("ath-1").value();
    REQUIRE(afterFirst.revision == 2);
    REQUIRE(afterFirst.findWorkout(target)->status == plan::WorkoutStatus::kSkipped);

    SECTION("a retried confirm applies nothing")
    {
        const auto retry = engine.confirm(proposal->id, "key-1", core::addDays(kPlanStart, 1));
        REQUIRE(retry.has_value());
        REQUIRE(retry->receipt == applied->receipt);
        REQUIRE(engine.activePlan("ath-1").value() == afterFirst);

        const auto late = engine.reject(proposal->id, "too late");
        REQUIRE(late->conflict);
        REQUIRE(late->status == plan::ProposalStatus::kApplied);
    }

    SECTION("a new plan leaves older proposals stale")
    {
        const auto restore = engine.proposeChange("ath-1", plan::ChangeRequest::restore(target));
        REQUIRE(restore.has_value());

        const auto rebuilt = engine.synthesizePlan("ath-1", kPlanStart, kRaceDay);
        REQUIRE(rebuilt.has_value());
        REQUIRE(rebuilt->revision == 3);

        const auto stale = engine.confirm(restore->id, "key-2", kPlanStart);
        REQUIRE(stale.has_value());
        REQUIRE(stale->status == plan::ProposalStatus::kFailed);
        REQUIRE(engine.activePlan("ath-1").value() == *rebuilt);
    }

    SECTION("the proposal can be explained")
    {
        const auto text = engine.explainProposal(proposal->id, std::stop_token{});
        REQUIRE(text.has_value());
        REQUIRE(text->starts_with("Proposed change: skip"));
        REQUIRE(text->ends_with("computed against plan revision 1."));
    }

    SECTION("proposals are out of reach after shutdown")
    {
        engine.shutdown();
        REQUIRE(engine.proposal(proposal->id).error().code() == core::ErrorCode::kInvalidState);
        REQUIRE(engine.explainProposal(proposal->id, std::stop_token{}).error().code() ==
                core::ErrorCode::kInvalidState);
        REQUIRE(engine.explain(insight::Insight{}, std::stop_token{}).error().code() ==
                core::ErrorCode::kInvalidState);
        REQUIRE(engine.confirm("unknown-p9", "key-3", kPlanStart).error().code() == core::ErrorCode::kInvalidState);
        REQUIRE(engine.reject(proposal->id, "late").error().code() == core::ErrorCode::kInvalidState);
    }

    SECTION("a race before the start is refused")
    {
        REQUIRE(engine.synthesizePlan("ath-1", kRaceDay, kPlanStart).error().code() ==
                core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("insight feed honours dismissals", "[engine][insight]")
{
    CoachEngine engine{testConfig()};
    REQUIRE(engine.init().has_value());

    session::Athlete athlete;
    athlete.id = "ath-1";
    REQUIRE(engine.registerAthlete(athlete).has_value());
    for (core::i32 d = 0; d < 28; ++d)
        REQUIRE(engine.recordSession("ath-1", easyRun(d, d < 21 ? 50.0 : 150.0)).has_value());

    const core::Date today = core::makeDate(2024, 1, 28);
    const auto feed        = engine.insights("ath-1", today);
    REQUIRE(feed.has_value());
    REQUIRE(feed->size() <= core::kDefaultInsightTopK);
    REQUIRE(std::ranges::is_sorted(*feed, std::ranges::greater{}, &insight::Insight::priority));

    const auto hasSignature = [](const std::vector<insight::Insight> &insights, std::string_view signature) {
        return std::ranges::any_of(insights, [&](const insight::Insight &i) { return i.signature == signature; });
    };
    REQUIRE(hasSignature(*feed, "fatigue_warning:load_ratio"));

    const auto loadRatio = std::ranges::find(*feed, std::string{"fatigue_warning:load_ratio"},
                                             &insight::Insight::signature);
    REQUIRE(engine.explain(*loadRatio, std::stop_token{}).has_value());

    REQUIRE(engine.recordFeedback("ath-1", "fatigue_warning:load_ratio", insight::FeedbackAction::kDismiss, today)
                .has_value());
    const auto later = engine.insights("ath-1", today);
    REQUIRE(later.has_value());
    REQUIRE_FALSE(hasSignature(*later, "fatigue_warning:load_ratio"));
}

TEST_CASE("athletes are analysed in parallel", "[engine][concurrency]")
{
    CoachEngine engine{testConfig()};
    REQUIRE(engine.init().has_value());

    std::vector<sim::SyntheticData> athletes;
    for (core::u64 seed = 1; seed <= 4; ++seed)
    {
        athletes.push_back(synthetic("ath-" + std::to_string(seed), seed));
        feed(engine, athletes.back());
    }

    std::vector<std::future<core::Expected<model::ResponseModel>>> models;
    std::vector<std::future<core::Expected<std::vector<insight::Insight>>>> feeds;
    for (const auto &data : athletes)
    {
        models.push_back(engine.submitCalibrate(data.athlete.id));
        feeds.push_back(engine.submitInsights(data.athlete.id, data.lastDay));
        // Same athlete twice: the second call waits for the first.
        models.push_back(engine.submitCalibrate(data.athlete.id));
    }

    std::vector<core::u32> versions;
    for (auto &f : models)
    {
        const auto fitted = f.get();
        REQUIRE(fitted.has_value());
        versions.push_back(fitted->version);
    }
    for (auto &f : feeds)
        REQUIRE(f.get().has_value());

    for (core::usize i = 0; i < athletes.size(); ++i)
    {
        const core::u32 a = versions[2 * i];
        const core::u32 b = versions[2 * i + 1];
        REQUIRE(std::min(a, b) == 1);
        REQUIRE(std::max(a, b) == 2);
    }

    auto prediction = engine.submitPredict("ath-1", core::makeDate(2024, 7, 14), 10'000.0);
    REQUIRE(prediction.get().has_value());
}

} // namespace tpo::engine
