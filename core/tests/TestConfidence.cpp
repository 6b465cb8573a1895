/**
 * @file TestConfidence.cpp
 * @brief Unit tests for confidence label ordering.
 */

#include <catch2/catch_test_macros.hpp>

#include "tpo/core/Confidence.hpp"

namespace tpo::core {

TEST_CASE("Confidence labels are ordered", "[core][confidence]")
{
    REQUIRE(ConfidenceLabel::kInsufficient < ConfidenceLabel::kLow);
    REQUIRE(ConfidenceLabel::kModerate < ConfidenceLabel::kHigh);
    REQUIRE(confidenceLabelName(ConfidenceLabel::kModerate) == "moderate");
}

TEST_CASE("downgrade respects its floor", "[core][confidence]")
{
    REQUIRE(downgrade(ConfidenceLabel::kHigh) == ConfidenceLabel::kModerate);
    REQUIRE(downgrade(ConfidenceLabel::kHigh, 2) == ConfidenceLabel::kLow);
    REQUIRE(downgrade(ConfidenceLabel::kHigh, 5) == ConfidenceLabel::kInsufficient);
    REQUIRE(downgrade(ConfidenceLabel::kModerate, 3, ConfidenceLabel::kLow) == ConfidenceLabel::kLow);
    // A label already under the floor is left alone.
    REQUIRE(downgrade(ConfidenceLabel::kInsufficient, 1, ConfidenceLabel::kLow) == ConfidenceLabel::kInsufficient);
}

} // namespace tpo::core
