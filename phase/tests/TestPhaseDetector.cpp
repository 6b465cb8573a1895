/**
 * @file TestPhaseDetector.cpp
 * @brief Unit tests for phase labelling and forward layout.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tpo/phase/PhaseDetector.hpp"

#include <algorithm>
#include <vector>

namespace tpo::phase {

using Catch::Matchers::WithinAbs;

namespace {

const core::Date kMonday = core::makeDate(2024, 1, 1);

core::Date weekAt(core::u32 index) { return core::addDays(kMonday, static_cast<core::i32>(index) * 7); }

session::WeeklyAggregate week(core::u32 index, core::f64 km, core::f64 qualityKm = 0.0, core::f64 longKm = 18.0,
                              bool race = false)
{
    session::WeeklyAggregate w{};
    w.weekStart        = weekAt(index);
    w.distanceM        = km * 1000.0;
    w.qualityDistanceM = qualityKm * 1000.0;
    w.qualityCount     = qualityKm > 0.0 ? 1u : 0u;
    w.longestRunM      = longKm * 1000.0;
    w.sessionCount     = km > 0.0 ? 5u : 0u;
    w.hasRace          = race;
    return w;
}

std::vector<PhaseLabel> labels(const std::vector<WeekPhase> &weeks)
{
    std::vector<PhaseLabel> out;
    for (const auto &w : weeks)
        out.push_back(w.label);
    return out;
}

} // namespace

TEST_CASE("a single noisy week does not flip the phase", "[phase]")
{
    const std::vector<session::WeeklyAggregate> weeks{week(0, 60), week(1, 60), week(2, 60, 6.0),
                                                      week(3, 60), week(4, 60)};
    const auto labelled = labelWeeks(weeks, std::nullopt);

    REQUIRE(labels(labelled) == std::vector<PhaseLabel>(5, PhaseLabel::kBase));
    REQUIRE(labelled[2].basis == WeekPhase::Basis::kInherited);
    REQUIRE_THAT(labelled[2].confidence, WithinAbs(0.5, 1e-12));
}

TEST_CASE("a sustained trend switches on its second week", "[phase]")
{
    const std::vector<session::WeeklyAggregate> weeks{week(0, 60), week(1, 60), week(2, 60),
                                                      week(3, 70, 8.0, 22.0), week(4, 70, 8.0, 22.0),
                                                      week(5, 80, 14.0, 26.0), week(6, 80, 14.0, 26.0)};
    const auto labelled = labelWeeks(weeks, std::nullopt);

    REQUIRE(labels(labelled) == std::vector<PhaseLabel>{PhaseLabel::kBase, PhaseLabel::kBase, PhaseLabel::kBase,
                                                        PhaseLabel::kBase, PhaseLabel::kBuild, PhaseLabel::kBuild,
                                                        PhaseLabel::kPeak});
    REQUIRE(labelled[4].basis == WeekPhase::Basis::kTransition);
    REQUIRE_THAT(labelled[4].confidence, WithinAbs(0.8, 1e-12));
    REQUIRE_THAT(labelled[0].confidence, WithinAbs(0.7, 1e-12));
}

TEST_CASE("race proximity forces taper and a one-week race phase", "[phase]")
{
    std::vector<session::WeeklyAggregate> weeks;
    for (core::u32 i = 0; i < 8; ++i)
        weeks.push_back(week(i, 70, 8.0, 22.0));
    const core::Date raceDay = core::addDays(weekAt(7), 6);

    const auto phases = detectPhases(weeks, raceDay);

    REQUIRE(phases.size() == 3);
    REQUIRE(phases[1].label == PhaseLabel::kTaper);
    REQUIRE(phases[1].firstWeek == 5);
    REQUIRE(phases[1].lastWeek == 6);
    REQUIRE_THAT(phases[1].detectionConfidence, WithinAbs(1.0, 1e-12));
    REQUIRE(phases[2].label == PhaseLabel::kRace);
    REQUIRE(phases[2].weekCount() == 1);
    REQUIRE(phases[2].endDate == raceDay);
}

TEST_CASE("a sharply reduced week after a race is recovery", "[phase]")
{
    const std::vector<session::WeeklyAggregate> weeks{week(0, 60), week(1, 60), week(2, 60), week(3, 60),
                                                      week(4, 50, 0.0, 21.1, true), week(5, 20),
                                                      week(6, 60)};
    const auto labelled = labelWeeks(weeks, std::nullopt);

    REQUIRE(labelled[5].label == PhaseLabel::kRecovery);
    REQUIRE(labelled[6].label == PhaseLabel::kBase);

    SECTION("a normal week after a race is not recovery")
    {
        auto steady = weeks;
        steady[5]   = week(5, 55);
        REQUIRE(labelWeeks(steady, std::nullopt)[5].label == PhaseLabel::kBase);
    }
}

TEST_CASE("an override replaces only its own week", "[phase]")
{
    const std::vector<session::WeeklyAggregate> weeks{week(0, 60), week(1, 60), week(2, 60), week(3, 60)};
    const std::vector<PhaseOverride> overrides{{core::addDays(weekAt(1), 3), PhaseLabel::kBuild}};

    const auto labelled = labelWeeks(weeks, std::nullopt, overrides);

    REQUIRE(labels(labelled) == std::vector<PhaseLabel>{PhaseLabel::kBase, PhaseLabel::kBuild, PhaseLabel::kBase,
                                                        PhaseLabel::kBase});
    REQUIRE(labelled[1].basis == WeekPhase::Basis::kOverride);
}

TEST_CASE("phases partition the weeks without gaps", "[phase]")
{
    std::vector<session::WeeklyAggregate> weeks;
    for (core::u32 i = 0; i < 6; ++i)
        weeks.push_back(week(i, 60));
    for (core::u32 i = 6; i < 14; ++i)
        weeks.push_back(week(i, 75, 10.0, 24.0));
    const auto phases = detectPhases(weeks, core::addDays(weekAt(13), 6));

    REQUIRE_FALSE(phases.empty());
    REQUIRE(phases.front().firstWeek == 0);
    REQUIRE(phases.back().lastWeek == 13);
    for (core::usize i = 1; i < phases.size(); ++i)
    {
        REQUIRE(phases[i].firstWeek == phases[i - 1].lastWeek + 1);
        REQUIRE(phases[i].label != phases[i - 1].label);
    }
}

TEST_CASE("an empty history yields no phases", "[phase]")
{
    REQUIRE(detectPhases({}, std::nullopt).empty());
}

TEST_CASE("planPhases lays out a forward build", "[phase]")
{
    const auto layout = planPhases(16, 2);
    REQUIRE(layout.size() == 16);

    auto count = [&](PhaseLabel label) { return std::count(layout.begin(), layout.end(), label); };
    REQUIRE(count(PhaseLabel::kBase) == 4);
    REQUIRE(count(PhaseLabel::kBuild) == 6);
    REQUIRE(count(PhaseLabel::kPeak) == 3);
    REQUIRE(count(PhaseLabel::kTaper) == 2);
    REQUIRE(layout.front() == PhaseLabel::kBase);
    REQUIRE(layout.back() == PhaseLabel::kRace);

    REQUIRE(planPhases(3, 2) == std::vector<PhaseLabel>{PhaseLabel::kTaper, PhaseLabel::kTaper, PhaseLabel::kRace});
    REQUIRE(planPhases(1, 2) == std::vector<PhaseLabel>{PhaseLabel::kRace});
    REQUIRE(planPhases(0, 2).empty());
}

TEST_CASE("planPhases skips the base block for an athlete already building", "[phase]")
{
    const auto layout = planPhases(16, 2, PhaseLabel::kBuild);
    REQUIRE(std::count(layout.begin(), layout.end(), PhaseLabel::kBase) == 0);
    REQUIRE(std::count(layout.begin(), layout.end(), PhaseLabel::kBuild) == 10);
    REQUIRE(layout.front() == PhaseLabel::kBuild);
}

} // namespace tpo::phase
