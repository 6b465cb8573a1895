/**
 * @file TestPlanSynthesizer.cpp
 * @brief Unit tests for plan synthesis, week rules and the retry ladder.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "PlanFixtures.hpp"
#include "tpo/plan/WeekRules.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace tpo::plan {

using Catch::Matchers::WithinAbs;

TEST_CASE("a layoff constraint caps the first week below the banked peak and ramps up", "[plan]")
{
    const bank::FitnessBank fitness = test::bankWith(113.0, 40.0, 32.0);
    bank::Constraint layoff;
    layoff.type                  = bank::ConstraintType::kReturningFromLayoff;
    layoff.origin                = bank::ConstraintOrigin::kInferred;
    layoff.detectedAt            = core::addDays(test::kPlanStart, -10);
    layoff.severity              = 0.4;
    layoff.estimatedExpiry       = core::addDays(test::kPlanStart, 50);
    layoff.referenceWeeklyVolume = 113'000.0;

    const auto phases = phase::planPhases(16, 2);
    const auto plan   = synthesizePlan(model::populationDefaults(), fitness, layoff, phases,
                                       test::requestFor(16, session::VolumeTier::kHigh, 6));

    REQUIRE(plan.has_value());
    REQUIRE(plan->weeks.size() == 16);
    REQUIRE(plan->weeks[0].volume() < 113'000.0);
    REQUIRE(plan->weeks[1].volume() > plan->weeks[0].volume());
    REQUIRE(plan->weeks[2].cutback);
    REQUIRE(plan->weeks[3].volume() > plan->weeks[1].volume());
    for (const auto &week : plan->weeks)
    {
        REQUIRE(week.volumeCeilingM <= 113'000.0 * 1.1);
        if (const Workout *longRun = week.longRun())
            REQUIRE(longRun->targetDistanceM <= 32'000.0);
    }
}

TEST_CASE("constraint ramp starts below the peak and reaches it at expiry", "[plan]")
{
    bank::Constraint c;
    c.severity        = 0.4;
    c.estimatedExpiry = core::addDays(test::kPlanStart, 50);

    REQUIRE_THAT(constraintRampFactor(c, test::kPlanStart, 0), WithinAbs(0.76, 1e-12));
    REQUIRE_THAT(constraintRampFactor(c, test::kPlanStart, 4), WithinAbs(0.88, 1e-12));
    REQUIRE_THAT(constraintRampFactor(c, test::kPlanStart, 8), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(constraintRampFactor(c, test::kPlanStart, 20), WithinAbs(1.0, 1e-12));

    c.severity = 0.0;
    REQUIRE(constraintRampFactor(c, test::kPlanStart, 0) < 1.0);
}

TEST_CASE("synthesised plans satisfy the structural invariants", "[plan]")
{
    const Plan plan       = test::standardPlan();
    const RuleSet rules   = RuleSet::defaults();
    const auto chain      = WeekRuleChain::standard(rules);

    REQUIRE(plan.revision == 1);
    REQUIRE(plan.retryLevel == 0);
    REQUIRE(plan.ruleSetVersion == 1);

    for (const auto &week : plan.weeks)
    {
        REQUIRE(chain.evaluate(week).verdict != RuleVerdict::kReject);

        if (week.label == phase::PhaseLabel::kBase)
            REQUIRE(week.qualityCount() == 0);

        if (const Workout *longRun = week.longRun())
        {
            REQUIRE(longRun->targetDistanceM <= 0.30 * week.volume() + 1.0);
            REQUIRE(longRun->targetDurationS <= 3.0 * 3600.0);
            if (longRun->isWorkoutLong())
                REQUIRE(week.qualityCount() <= 1);
        }
        REQUIRE(std::ranges::is_sorted(week.workouts, {}, &Workout::date));
    }

    const Week &race = plan.weeks.back();
    REQUIRE(race.label == phase::PhaseLabel::kRace);
    REQUIRE(std::ranges::any_of(race.workouts, [&](const Workout &w) {
        return w.type == WorkoutType::kRace && w.date == plan.raceDate;
    }));
}

TEST_CASE("weekly progression respects the build limit and cutback cadence", "[plan]")
{
    const Plan plan     = test::standardPlan();
    const RuleSet rules = RuleSet::defaults();

    core::f64 previous = 0.0;
    for (const auto &week : plan.weeks)
    {
        const bool progressing = week.label == phase::PhaseLabel::kBase || week.label == phase::PhaseLabel::kBuild ||
                                 week.label == phase::PhaseLabel::kPeak;
        if (!progressing)
            break;
        REQUIRE(week.cutback == (week.index > 0 && (week.index + 1) % rules.cutbackEvery == 0));
        if (previous > 0.0 && !week.cutback)
            REQUIRE(week.volume() <= previous * (1.0 + rules.maxWeeklyIncrease) + 100.0);
        if (!week.cutback)
            previous = week.volume();
    }
}

TEST_CASE("build weeks alternate quality-day and workout-long structures", "[plan]")
{
    const Plan plan = test::standardPlan();

    std::vector<bool> workoutLong;
    for (const auto &week : plan.weeks)
        if (week.label == phase::PhaseLabel::kBuild && !week.cutback)
            workoutLong.push_back(week.longRun()->isWorkoutLong());

    REQUIRE(workoutLong.size() >= 2);
    for (core::usize i = 1; i < workoutLong.size(); ++i)
        REQUIRE(workoutLong[i] != workoutLong[i - 1]);
}

TEST_CASE("higher-risk profiles take more frequent cutbacks", "[plan]")
{
    const RuleSet rules = RuleSet::defaults();
    REQUIRE(isHigherRisk(true, 30, session::VolumeTier::kMid, rules));
    REQUIRE(isHigherRisk(false, 55, session::VolumeTier::kMid, rules));
    REQUIRE(isHigherRisk(false, 30, session::VolumeTier::kBuilder, rules));
    REQUIRE_FALSE(isHigherRisk(false, 30, session::VolumeTier::kHigh, rules));

    auto request = test::requestFor(16, session::VolumeTier::kMid, 5);
    request.age  = 55;
    const auto plan = synthesizePlan(model::populationDefaults(), test::bankWith(70.0, 60.0, 28.0), std::nullopt,
                                     phase::planPhases(16, 2), request);
    REQUIRE(plan.has_value());
    REQUIRE(plan->weeks[2].cutback);
    REQUIRE_FALSE(plan->weeks[3].cutback);
}

TEST_CASE("a rule set that rejects the first layout falls down the relaxation ladder", "[plan]")
{
    RuleSet strict = RuleSet::defaults();
    strict.phases[static_cast<core::usize>(phase::PhaseLabel::kBuild)].minEasyShare = 0.85;
    REQUIRE(strict.validate().has_value());

    const auto plan = synthesizePlan(model::populationDefaults(), test::bankWith(70.0, 60.0, 28.0), std::nullopt,
                                     phase::planPhases(16, 2), test::requestFor(16, session::VolumeTier::kMid, 5),
                                     strict);
    REQUIRE(plan.has_value());
    REQUIRE(plan->retryLevel == 2);
    for (const auto &week : plan->weeks)
    {
        REQUIRE(week.qualityCount() <= 1);
        if (const Workout *longRun = week.longRun())
            REQUIRE_FALSE(longRun->isWorkoutLong());
    }

    SECTION("an unsatisfiable rule set is a rule violation")
    {
        RuleSet impossible = strict;
        impossible.phases[static_cast<core::usize>(phase::PhaseLabel::kBuild)].minEasyShare = 1.0;
        const auto failed = synthesizePlan(model::populationDefaults(), test::bankWith(70.0, 60.0, 28.0),
                                           std::nullopt, phase::planPhases(16, 2),
                                           test::requestFor(16, session::VolumeTier::kMid, 3), impossible);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error().code() == core::ErrorCode::kRuleViolation);
    }
}

TEST_CASE("synthesis rejects inconsistent inputs", "[plan]")
{
    const auto phases  = phase::planPhases(12, 2);
    const auto fitness = test::bankWith(70.0, 60.0, 28.0);

    auto request = test::requestFor(12, session::VolumeTier::kMid, 2);
    auto result  = synthesizePlan(model::populationDefaults(), fitness, std::nullopt, phases, request);
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);

    request          = test::requestFor(12, session::VolumeTier::kMid, 5);
    request.raceDate = core::addDays(request.raceDate, 7);
    result           = synthesizePlan(model::populationDefaults(), fitness, std::nullopt, phases, request);
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);

    result = synthesizePlan(model::populationDefaults(), fitness, std::nullopt, {}, test::requestFor(12, session::VolumeTier::kMid, 5));
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("volume tiers are contiguous bands with a peak at or above their ceiling", "[plan]")
{
    using session::VolumeTier;
    const VolumeTier tiers[] = {VolumeTier::kBuilder, VolumeTier::kLow, VolumeTier::kMid, VolumeTier::kHigh,
                                VolumeTier::kElite};

    for (core::usize i = 0; i < std::size(tiers); ++i)
    {
        const TierVolume band = tierVolume(tiers[i]);
        REQUIRE(band.minKm < band.maxKm);
        REQUIRE(band.peakKm >= band.maxKm);
        if (i > 0)
        {
            REQUIRE(band.minKm == tierVolume(tiers[i - 1]).maxKm);
        }
    }

    const TierVolume elite = tierVolume(VolumeTier::kElite);
    REQUIRE(elite.minKm == 113.0);
    REQUIRE(elite.maxKm == 180.0);
    REQUIRE(elite.peakKm == 180.0);
}

TEST_CASE("rule set validation", "[plan]")
{
    REQUIRE(RuleSet::defaults().validate().has_value());

    RuleSet rules = RuleSet::defaults();
    rules.phases[static_cast<core::usize>(phase::PhaseLabel::kBase)].maxQualitySessions = 1;
    REQUIRE(rules.validate().error().code() == core::ErrorCode::kInvalidArgument);

    rules = RuleSet::defaults();
    rules.longRunShareCap = 1.5;
    REQUIRE_FALSE(rules.validate().has_value());

    rules = RuleSet::defaults();
    rules.higherRiskCutbackEvery = 5;
    REQUIRE_FALSE(rules.validate().has_value());
}

TEST_CASE("week rule chain verdicts", "[plan]")
{
    const RuleSet rules = RuleSet::defaults();
    const auto chain    = WeekRuleChain::standard(rules);
    REQUIRE(chain.ruleCount() == 8);

    Week week;
    week.label     = phase::PhaseLabel::kBuild;
    week.weekStart = test::kPlanStart;
    auto add = [&](core::i32 day, WorkoutType type, core::f64 km, core::f64 workKm = 0.0) {
        Workout w;
        w.id              = std::format("t{}", day);
        w.date            = core::addDays(test::kPlanStart, day);
        w.type            = type;
        w.targetDistanceM = km * 1000.0;
        w.workDistanceM   = workKm * 1000.0;
        w.targetDurationS = km * 300.0;
        week.workouts.push_back(w);
    };
    add(1, WorkoutType::kThreshold, 9.0, 6.0);
    add(2, WorkoutType::kInterval, 9.0, 6.0);
    add(3, WorkoutType::kEasy, 12.0);
    add(4, WorkoutType::kEasy, 12.0);
    add(6, WorkoutType::kLong, 18.0);

    const WeekEvaluation warned = chain.evaluate(week);
    REQUIRE(warned.verdict == RuleVerdict::kWarn);
    REQUIRE(warned.notes.size() == 1);
    REQUIRE(warned.notes.front().find("within 48h") != std::string::npos);

    week.workouts[3].type            = WorkoutType::kThreshold;
    week.workouts[3].workDistanceM   = 5'000.0;
    const WeekEvaluation rejected    = chain.evaluate(week);
    REQUIRE(rejected.verdict == RuleVerdict::kReject);
    REQUIRE(rejected.rejectedBy == "QualityCountRule");
}

} // namespace tpo::plan
