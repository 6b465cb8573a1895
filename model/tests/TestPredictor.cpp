/**
 * @file TestPredictor.cpp
 * @brief Unit tests for race-time prediction.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "ModelFixtures.hpp"
#include "tpo/model/Predictor.hpp"

#include <algorithm>

namespace tpo::model {

using core::ConfidenceLabel;

namespace {

ResponseModel moderateModel()
{
    ResponseModel model = populationDefaults();
    model.confidence       = ConfidenceLabel::kModerate;
    model.observationCount = 4;
    model.residualVariance = 1.0;
    model.lastObservation  = core::addDays(test::kStart, 100);
    return model;
}

} // namespace

TEST_CASE("predict is deterministic", "[model][predict]")
{
    const auto series = session::DailyLoadSeries::fromSessions(test::blockHistory(120));
    const auto target = core::addDays(series.end(), 28);

    auto a = predict(moderateModel(), series, target, kMarathonM);
    auto b = predict(moderateModel(), series, target, kMarathonM);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
}

TEST_CASE("predict brackets the predicted time", "[model][predict]")
{
    const auto series = session::DailyLoadSeries::fromSessions(test::blockHistory(120));
    auto p = predict(moderateModel(), series, core::addDays(series.end(), 28), kHalfMarathonM);

    REQUIRE(p.has_value());
    REQUIRE(p->fastestTimeS < p->predictedTimeS);
    REQUIRE(p->predictedTimeS < p->slowestTimeS);
    REQUIRE(p->taperWeeks >= 1);
    REQUIRE(p->confidence == ConfidenceLabel::kModerate);
    REQUIRE(p->diagnostics.empty());
}

TEST_CASE("predict narrows with more observations", "[model][predict]")
{
    const auto series = session::DailyLoadSeries::fromSessions(test::blockHistory(120));
    const auto target = core::addDays(series.end(), 21);

    ResponseModel few  = moderateModel();
    ResponseModel many = moderateModel();
    many.observationCount = 12;

    REQUIRE(predict(many, series, target, 10000.0)->vdotStdDev < predict(few, series, target, 10000.0)->vdotStdDev);

    SECTION("and with a more recent observation")
    {
        ResponseModel recent = moderateModel();
        recent.lastObservation = core::addDays(series.end(), -3);
        REQUIRE(predict(recent, series, target, 10000.0)->vdotStdDev
                < predict(few, series, target, 10000.0)->vdotStdDev);
    }
}

TEST_CASE("predict degrades confidence over unexplained gaps", "[model][predict]")
{
    auto sessions = test::blockHistory(120);
    const auto clean = session::DailyLoadSeries::fromSessions(sessions);

    // Drop ten days of sync from the last six weeks.
    const core::Date gapFrom = core::addDays(clean.end(), -25);
    const core::Date gapTo   = core::addDays(clean.end(), -16);
    std::erase_if(sessions, [&](const session::Session &s) { return s.date >= gapFrom && s.date <= gapTo; });
    const auto gappy = session::DailyLoadSeries::fromSessions(sessions);
    REQUIRE(gappy.end() == clean.end());

    const auto target = core::addDays(clean.end(), 28);
    auto a = predict(moderateModel(), clean, target, 10000.0);
    auto b = predict(moderateModel(), gappy, target, 10000.0);

    REQUIRE(b->confidence < a->confidence);
    REQUIRE(core::hasDiagnostic(b->diagnostics, core::ErrorCode::kDataGap));
    REQUIRE(b->vdotStdDev > a->vdotStdDev * 1.4);
}

TEST_CASE("predict validates its arguments", "[model][predict]")
{
    const auto series = session::DailyLoadSeries::fromSessions(test::blockHistory(60));

    REQUIRE(predict(moderateModel(), series, series.end(), 0.0).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(predict(moderateModel(), series, core::addDays(series.start(), -1), 5000.0).error().code()
            == core::ErrorCode::kInvalidArgument);

    SECTION("an empty history still yields a qualified prediction")
    {
        auto p = predict(populationDefaults(), session::DailyLoadSeries{}, test::kStart, 5000.0);
        REQUIRE(p.has_value());
        REQUIRE(p->confidence == ConfidenceLabel::kInsufficient);
        REQUIRE(core::hasDiagnostic(p->diagnostics, core::ErrorCode::kInsufficientData));
    }
}

} // namespace tpo::model
