/**
 * @file TestFitnessBank.cpp
 * @brief Unit tests for peak capability tracking.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "BankFixtures.hpp"
#include "tpo/bank/FitnessBank.hpp"

namespace tpo::bank {

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("computeFitnessBank records sustained peaks", "[bank][fitness]")
{
    std::vector<session::Session> sessions;
    test::appendWeeks(sessions, 0, 12, 60.0);
    test::appendWeeks(sessions, 12, 4, 80.0);
    const core::Date today = core::addDays(test::kStart, 16 * 7 - 1);

    const FitnessBank bank = computeFitnessBank(sessions, today);

    REQUIRE_THAT(bank.peakWeeklyVolume.value, WithinRel((4.0 * 80000.0 + 2.0 * 60000.0) / 6.0, 1e-9));
    REQUIRE(bank.peakWeeklyVolume.evidenceDate == today);
    REQUIRE(bank.peakWeeklyVolume.confirmed);
    REQUIRE(bank.peakWeeklyVolume.sampleCount == 4);
    REQUIRE_THAT(bank.peakLongRun.value, WithinRel(0.35 * 80000.0, 1e-9));
    REQUIRE(bank.peakLongRun.confirmed);
    REQUIRE_THAT(bank.currentWeeklyVolume, WithinRel(80000.0, 1e-9));
    REQUIRE_THAT(bank.currentLongRun, WithinRel(28000.0, 1e-9));
    REQUIRE(bank.experience == ExperienceLevel::kExperienced);
    REQUIRE(bank.peakLongRunAtGoalPace.value == 0.0);
    REQUIRE_FALSE(bank.peakLongRunAtGoalPace.confirmed);
}

TEST_CASE("old peaks are flagged unconfirmed", "[bank][fitness]")
{
    std::vector<session::Session> sessions;
    test::appendWeeks(sessions, 0, 8, 100.0);
    test::appendWeeks(sessions, 8, 12, 40.0);
    const core::Date today = core::addDays(test::kStart, 20 * 7 - 1);

    const FitnessBank bank = computeFitnessBank(sessions, today);

    REQUIRE_THAT(bank.peakWeeklyVolume.value, WithinRel(100000.0, 1e-9));
    REQUIRE(bank.peakWeeklyVolume.evidenceDate == core::addDays(test::kStart, 6 * 7 - 1));
    REQUIRE_FALSE(bank.peakWeeklyVolume.confirmed);
    REQUIRE_THAT(bank.sustainableWeeklyVolume(), WithinRel(92000.0, 1e-9));
    REQUIRE_THAT(bank.currentWeeklyVolume, WithinRel(40000.0, 1e-9));
}

TEST_CASE("goal-pace long runs and races are tracked", "[bank][fitness]")
{
    std::vector<session::Session> sessions;
    test::appendWeeks(sessions, 0, 6, 70.0);
    sessions.push_back(test::run(38, 16.0, session::SessionType::kMarathonPace));
    const core::Date today = core::addDays(test::kStart, 41);

    const std::vector<session::RaceResult> races = {{core::addDays(test::kStart, 20), 5000.0, 1200.0}};
    const FitnessBank bank = computeFitnessBank(sessions, today, races);

    REQUIRE_THAT(bank.peakLongRunAtGoalPace.value, WithinRel(16000.0, 1e-9));
    REQUIRE(bank.peakLongRunAtGoalPace.confirmed);
    REQUIRE(bank.bestRaceVdot.has_value());
    REQUIRE_THAT(*bank.bestRaceVdot, WithinAbs(49.8, 0.1));
}

TEST_CASE("mergeFitnessBank only moves peaks upward", "[bank][fitness]")
{
    FitnessBank prior;
    prior.peakWeeklyVolume = {100000.0, core::addDays(test::kStart, 40), 5, true};

    FitnessBank fresh;
    fresh.peakWeeklyVolume = {70000.0, core::addDays(test::kStart, 200), 4, true};

    SECTION("a lower fresh peak keeps the stored one but cannot confirm it")
    {
        const auto merged = mergeFitnessBank(prior, fresh, false);
        REQUIRE(merged.peakWeeklyVolume.value == 100000.0);
        REQUIRE(merged.peakWeeklyVolume.evidenceDate == core::addDays(test::kStart, 40));
        REQUIRE_FALSE(merged.peakWeeklyVolume.confirmed);
    }

    SECTION("a comparable fresh effort confirms the stored peak")
    {
        fresh.peakWeeklyVolume.value = 90000.0;
        REQUIRE(mergeFitnessBank(prior, fresh, false).peakWeeklyVolume.confirmed);
    }

    SECTION("an active constraint invalidates recency")
    {
        fresh.peakWeeklyVolume.value = 90000.0;
        REQUIRE_FALSE(mergeFitnessBank(prior, fresh, true).peakWeeklyVolume.confirmed);
    }

    SECTION("a higher fresh peak replaces the stored one")
    {
        fresh.peakWeeklyVolume.value = 120000.0;
        const auto merged = mergeFitnessBank(prior, fresh, false);
        REQUIRE(merged.peakWeeklyVolume.value == 120000.0);
        REQUIRE(merged.experience == ExperienceLevel::kElite);
    }
}

} // namespace tpo::bank
