/**
 * @file TestCalibrator.cpp
 * @brief Unit tests for response-model calibration.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "ModelFixtures.hpp"
#include "tpo/model/Calibrator.hpp"

#include <algorithm>
#include <cmath>

namespace tpo::model {

using Catch::Matchers::WithinAbs;
using core::ConfidenceLabel;

namespace {

const std::vector<double> kBlocks = {0.7, 1.0, 1.3, 0.8, 1.2, 0.6, 1.4};

double rmsResidual(const ResponseModel &model,
                   const std::vector<session::Session> &sessions,
                   const std::vector<session::RaceResult> &races)
{
    const auto series = session::DailyLoadSeries::fromSessions(sessions, races.back().date);
    double sum = 0.0;
    for (const auto &race : races)
    {
        const double r = performanceAt(model, series, race.date) - *vdotFromRace(race.distanceM, race.timeS);
        sum += r * r;
    }
    return std::sqrt(sum / static_cast<double>(races.size()));
}

} // namespace

TEST_CASE("calibrationConfidence never decreases with more observations", "[model][calibration]")
{
    for (double sd : {0.5, 2.5, 5.0})
    {
        for (core::i32 days : {30, 400})
        {
            ConfidenceLabel previous = ConfidenceLabel::kInsufficient;
            for (core::u32 n = 0; n <= 12; ++n)
            {
                const ConfidenceLabel label = calibrationConfidence(n, sd, days);
                REQUIRE(label >= previous);
                previous = label;
            }
        }
    }

    REQUIRE(calibrationConfidence(0, 0.5, 400) == ConfidenceLabel::kInsufficient);
    REQUIRE(calibrationConfidence(2, 0.5, 400) == ConfidenceLabel::kLow);
    REQUIRE(calibrationConfidence(4, 0.5, 400) == ConfidenceLabel::kModerate);
    REQUIRE(calibrationConfidence(8, 0.5, 400) == ConfidenceLabel::kHigh);
    REQUIRE(calibrationConfidence(8, 3.0, 400) == ConfidenceLabel::kModerate);
    REQUIRE(calibrationConfidence(8, 0.5, 30) == ConfidenceLabel::kLow);
}

TEST_CASE("calibrate without races keeps population constants", "[model][calibration]")
{
    const auto sessions = test::blockHistory(120);
    auto model = calibrate(sessions, {});

    REQUIRE(model.has_value());
    REQUIRE(model->source == ModelSource::kPopulationDefault);
    REQUIRE(model->confidence == ConfidenceLabel::kInsufficient);
    REQUIRE(model->tau1 == core::kPopulationTau1);
    REQUIRE(model->tau2 == core::kPopulationTau2);
    REQUIRE(model->version == 1);
    REQUIRE(core::hasDiagnostic(model->diagnostics, core::ErrorCode::kInsufficientData));
}

TEST_CASE("a single race eight weeks ago is never high confidence", "[model][calibration]")
{
    const auto sessions = test::blockHistory(200, kBlocks);
    ResponseModel truth = populationDefaults();
    truth.baseline = 40.0;
    const auto races = test::racesFrom(truth, sessions, {200 - 56});

    auto model = calibrate(sessions, races);
    REQUIRE(model.has_value());
    REQUIRE(model->observationCount == 1);
    REQUIRE(model->confidence <= ConfidenceLabel::kLow);
    REQUIRE(model->tau1 > 0.0);
    REQUIRE(model->tau2 > 0.0);

    SECTION("the baseline absorbs the athlete's offset")
    {
        REQUIRE_THAT(model->baseline, WithinAbs(40.0, 0.05));
    }
}

TEST_CASE("calibrate recovers a well-observed athlete", "[model][calibration]")
{
    const auto sessions = test::blockHistory(200, kBlocks);
    ResponseModel truth = populationDefaults();
    truth.baseline = 40.0;
    const auto races = test::racesFrom(truth, sessions, {30, 50, 70, 90, 110, 125, 140, 160, 180, 199});

    auto model = calibrate(sessions, races, {.previousVersion = 3});
    REQUIRE(model.has_value());
    REQUIRE(model->source == ModelSource::kIndividual);
    REQUIRE(model->observationCount == 10);
    REQUIRE(model->version == 4);
    REQUIRE(model->confidence == ConfidenceLabel::kHigh);
    REQUIRE_THAT(model->tau1, WithinAbs(truth.tau1, 1.0));
    REQUIRE_THAT(model->tau2, WithinAbs(truth.tau2, 1.0));
    REQUIRE(rmsResidual(*model, sessions, races) < 0.1);
    REQUIRE(model->lastObservation == races.back().date);
}

TEST_CASE("calibrate keeps a fatigue constant longer than the fitness constant", "[model][calibration]")
{
    const auto sessions = test::blockHistory(240, kBlocks);

    ResponseModel truth = populationDefaults();
    truth.tau1     = 15.0;
    truth.tau2     = 30.0;
    truth.k1       = 0.012;
    truth.k2       = 0.005;
    truth.baseline = 35.0;

    std::vector<core::i32> raceDays;
    for (core::i32 d = 20; d < 240; d += 18)
        raceDays.push_back(d);
    const auto races = test::racesFrom(truth, sessions, raceDays);

    auto model = calibrate(sessions, races, {.priorStrength = 0.0});
    REQUIRE(model.has_value());
    REQUIRE(model->tau1 >= core::kTauMin);
    REQUIRE(model->tau2 <= core::kTauMax);
    REQUIRE(model->tau2 > model->tau1);
    REQUIRE(rmsResidual(*model, sessions, races) < 0.3);
}

TEST_CASE("race-type sessions are calibration observations", "[model][calibration]")
{
    const auto sessions = test::blockHistory(200, kBlocks);
    ResponseModel truth = populationDefaults();
    truth.baseline = 40.0;
    const auto races = test::racesFrom(truth, sessions, {30, 50, 72, 90, 110, 125, 145, 160, 180, 199});

    auto raced = sessions;
    for (const auto &race : races)
    {
        const auto it = std::ranges::find_if(raced, [&](const session::Session &s) { return s.date == race.date; });
        REQUIRE(it != raced.end());
        it->type      = session::SessionType::kRace;
        it->distanceM = race.distanceM;
        it->durationS = race.timeS;
    }

    const auto fromResults  = calibrate(sessions, races);
    const auto fromSessions = calibrate(raced, {});
    REQUIRE(fromResults.has_value());
    REQUIRE(fromSessions.has_value());
    REQUIRE(fromSessions->source == ModelSource::kIndividual);
    REQUIRE(fromSessions->observationCount == 10);
    REQUIRE(fromSessions->keySessionCount == 0);
    REQUIRE_THAT(fromSessions->baseline, WithinAbs(fromResults->baseline, 1e-6));
    REQUIRE_THAT(fromSessions->tau1, WithinAbs(fromResults->tau1, 1e-6));

    SECTION("a session on the day of a recorded result is not counted twice")
    {
        REQUIRE(calibrate(raced, races)->observationCount == 10);
    }
}

TEST_CASE("efficiency markers inform a fit with scarce races", "[model][calibration]")
{
    const auto sessions = test::blockHistory(200, kBlocks);
    ResponseModel truth = populationDefaults();
    truth.baseline = 40.0;
    const auto races = test::racesFrom(truth, sessions, {144});

    auto withHeartRate = sessions;
    for (auto &s : withHeartRate)
        s.avgHeartRate = core::daysBetween(test::kStart, s.date) < 100 ? 155.0 : 135.0;

    const auto plain  = calibrate(sessions, races);
    const auto marked = calibrate(withHeartRate, races);
    REQUIRE(plain.has_value());
    REQUIRE(marked.has_value());

    REQUIRE(plain->keySessionCount == 0);
    REQUIRE(marked->observationCount == 1);
    REQUIRE(marked->keySessionCount == 7);
    REQUIRE(marked->source == ModelSource::kIndividual);
    REQUIRE(marked->confidence <= ConfidenceLabel::kLow);
    REQUIRE(core::hasDiagnostic(marked->diagnostics, core::ErrorCode::kInsufficientData));

    const auto series = session::DailyLoadSeries::fromSessions(sessions, races.back().date);
    REQUIRE(performanceAt(*marked, series, races.back().date) > performanceAt(*plain, series, races.back().date) + 1.0);

    SECTION("three races make the markers unnecessary")
    {
        const auto enough = test::racesFrom(truth, sessions, {60, 120, 180});
        REQUIRE(calibrate(withHeartRate, enough)->keySessionCount == 0);
    }
}

TEST_CASE("calibrate validates race results", "[model][calibration]")
{
    const auto sessions = test::blockHistory(60);
    const std::vector<session::RaceResult> races = {{core::addDays(test::kStart, 30), 10000.0, 0.0}};

    auto model = calibrate(sessions, races);
    REQUIRE_FALSE(model.has_value());
    REQUIRE(model.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("calibrate without sessions centres on the race results", "[model][calibration]")
{
    const std::vector<session::RaceResult> races = {{test::kStart, 5000.0, 20.0 * 60.0}};

    auto model = calibrate({}, races);
    REQUIRE(model.has_value());
    REQUIRE_THAT(model->baseline, WithinAbs(49.8, 0.1));
    REQUIRE(model->confidence == ConfidenceLabel::kInsufficient);
}

} // namespace tpo::model
