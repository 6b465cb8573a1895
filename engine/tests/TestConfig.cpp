/**
 * @file TestConfig.cpp
 * @brief Unit tests for the engine configuration builder.
 */

#include <catch2/catch_test_macros.hpp>

#include "tpo/engine/Config.hpp"

namespace tpo::engine {

TEST_CASE("builder defaults", "[engine][config]")
{
    const Config cfg = Config::Builder{}.build();

    REQUIRE(cfg.workerThreads() == 0);
    REQUIRE(cfg.logLevel() == core::LogLevel::kInfo);
    REQUIRE(cfg.maxTaperWeeks() == core::kDefaultMaxTaperWeeks);
    REQUIRE(cfg.insights().topK == core::kDefaultInsightTopK);
    REQUIRE(cfg.insights().cooldownDays == core::kDefaultCooldownDays);
    REQUIRE(cfg.rules().version == 1);
    REQUIRE(cfg.validate().has_value());
}

TEST_CASE("builder carries every setting", "[engine][config]")
{
    model::CalibrationOptions calibration;
    calibration.minRaceObservations = 4;
    insight::InsightOptions insights;
    insights.topK = 3;

    const Config cfg = Config::Builder{}
                           .workerThreads(3)
                           .logLevel(core::LogLevel::kWarn)
                           .calibration(calibration)
                           .maxTaperWeeks(3)
                           .insights(insights)
                           .build();

    REQUIRE(cfg.workerThreads() == 3);
    REQUIRE(cfg.logLevel() == core::LogLevel::kWarn);
    REQUIRE(cfg.calibration().minRaceObservations == 4);
    REQUIRE(cfg.maxTaperWeeks() == 3);
    REQUIRE(cfg.insights().topK == 3);
    REQUIRE(cfg.validate().has_value());
}

TEST_CASE("invalid settings are refused", "[engine][config]")
{
    SECTION("no taper range")
    {
        const auto result = Config::Builder{}.maxTaperWeeks(0).build().validate();
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("empty insight feed")
    {
        insight::InsightOptions insights;
        insights.topK     = 0;
        const auto result = Config::Builder{}.insights(insights).build().validate();
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("zero-week fitness-bank window")
    {
        bank::BankOptions options;
        options.windowWeeks = 0;
        const auto result   = Config::Builder{}.fitnessBank(options).build().validate();
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("broken rule set")
    {
        plan::RuleSet rules = plan::RuleSet::defaults();
        rules.cutbackEvery  = 1;
        const auto result   = Config::Builder{}.rules(rules).build().validate();
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

} // namespace tpo::engine
