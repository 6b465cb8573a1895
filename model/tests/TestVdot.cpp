/**
 * @file TestVdot.cpp
 * @brief Unit tests for VDOT conversions.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tpo/model/Vdot.hpp"

namespace tpo::model {

using Catch::Matchers::WithinAbs;

TEST_CASE("vdotFromRace matches the published tables", "[model][vdot]")
{
    // 5 km in 20:00 is just under VDOT 50.
    auto v = vdotFromRace(5000.0, 20.0 * 60.0);
    REQUIRE(v.has_value());
    REQUIRE_THAT(*v, WithinAbs(49.8, 0.1));

    SECTION("results are clamped to the supported range")
    {
        REQUIRE(*vdotFromRace(5000.0, 3600.0) == kVdotMin);
        REQUIRE(*vdotFromRace(5000.0, 600.0) == kVdotMax);
    }

    SECTION("invalid races are rejected")
    {
        REQUIRE(vdotFromRace(0.0, 100.0).error().code() == core::ErrorCode::kInvalidArgument);
        REQUIRE(vdotFromRace(5000.0, -1.0).error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("raceTimeForVdot inverts vdotFromRace", "[model][vdot]")
{
    for (double distance : {5000.0, 10000.0, kHalfMarathonM, kMarathonM})
    {
        const double time = distance * 0.3;    // 5:00 per km
        const double vdot = *vdotFromRace(distance, time);
        auto back = raceTimeForVdot(vdot, distance);
        REQUIRE(back.has_value());
        REQUIRE_THAT(*back, WithinAbs(time, 0.5));
    }

    SECTION("higher capacity runs faster")
    {
        REQUIRE(*raceTimeForVdot(55.0, kMarathonM) < *raceTimeForVdot(45.0, kMarathonM));
    }
}

TEST_CASE("zoneSpeed orders training zones", "[model][vdot]")
{
    const double easy      = zoneSpeed(50.0, PaceZone::kEasy);
    const double marathon  = zoneSpeed(50.0, PaceZone::kMarathon);
    const double threshold = zoneSpeed(50.0, PaceZone::kThreshold);
    const double interval  = zoneSpeed(50.0, PaceZone::kInterval);

    REQUIRE(easy < marathon);
    REQUIRE(marathon < threshold);
    REQUIRE(threshold < interval);
    // Threshold pace around 4:15 per km at VDOT 50.
    REQUIRE_THAT(1000.0 / threshold, WithinAbs(255.0, 5.0));
}

} // namespace tpo::model
