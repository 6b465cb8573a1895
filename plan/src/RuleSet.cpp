/**
 * @file RuleSet.cpp
 * @brief Default coaching rules and their validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/plan/RuleSet.hpp>

#include <format>

namespace tpo::plan {

namespace {

core::ExpectedVoid requireFraction(core::f64 value, std::string_view field, bool allowZero = false)
{
    if ((allowZero ? value < 0.0 : value <= 0.0) || value > 1.0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("rule set: {} = {} is outside (0, 1]", field, value));
    return {};
}

} // namespace

TierVolume tierVolume(session::VolumeTier tier) noexcept
{
    switch (tier)
    {
    case session::VolumeTier::kBuilder: return {25.0, 40.0, 48.0};
    case session::VolumeTier::kLow: return {40.0, 56.0, 64.0};
    case session::VolumeTier::kMid: return {56.0, 80.0, 88.0};
    case session::VolumeTier::kHigh: return {80.0, 113.0, 121.0};
    case session::VolumeTier::kElite: return {113.0, 180.0, 180.0};
    }
    return {56.0, 80.0, 88.0};
}

RuleSet RuleSet::defaults()
{
    using phase::PhaseLabel;

    RuleSet rules;
    rules.version = 1;
    rules.phases[static_cast<core::usize>(PhaseLabel::kBase)]     = {0.80, 0, 1.0};
    rules.phases[static_cast<core::usize>(PhaseLabel::kBuild)]    = {0.70, 2, 1.0};
    rules.phases[static_cast<core::usize>(PhaseLabel::kPeak)]     = {0.65, 2, 1.0};
    rules.phases[static_cast<core::usize>(PhaseLabel::kTaper)]    = {0.75, 1, 0.70};
    rules.phases[static_cast<core::usize>(PhaseLabel::kRace)]     = {0.65, 0, 0.40};
    rules.phases[static_cast<core::usize>(PhaseLabel::kRecovery)] = {0.90, 0, 0.50};
    return rules;
}

core::ExpectedVoid RuleSet::validate() const
{
    if (version == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "rule set: version must be positive");

    for (core::usize i = 0; i < kPhaseCount; ++i)
    {
        const auto label = phase::phaseLabelName(static_cast<phase::PhaseLabel>(i));
        TPO_TRY_VOID(requireFraction(phases[i].minEasyShare, std::format("{}.minEasyShare", label)));
        TPO_TRY_VOID(requireFraction(phases[i].volumeFactor, std::format("{}.volumeFactor", label)));
    }
    if (forPhase(phase::PhaseLabel::kBase).maxQualitySessions != 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "rule set: base weeks cannot hold quality sessions");

    TPO_TRY_VOID(requireFraction(qualitySessionShareCap, "qualitySessionShareCap"));
    TPO_TRY_VOID(requireFraction(goalPaceShareCap, "goalPaceShareCap"));
    TPO_TRY_VOID(requireFraction(longRunShareCap, "longRunShareCap"));
    TPO_TRY_VOID(requireFraction(cutbackFactor, "cutbackFactor"));
    TPO_TRY_VOID(requireFraction(maxWeeklyIncrease, "maxWeeklyIncrease", true));
    TPO_TRY_VOID(requireFraction(taperEndFactor, "taperEndFactor"));

    if (goalPaceDistanceCapM <= 0.0 || longRunDurationCapS <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "rule set: absolute caps must be positive");
    if (cutbackEvery < 2 || higherRiskCutbackEvery < 2 || higherRiskCutbackEvery > cutbackEvery)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("rule set: cutback cadence {}/{} is invalid", cutbackEvery,
                                           higherRiskCutbackEvery));
    if (taperEndFactor > forPhase(phase::PhaseLabel::kTaper).volumeFactor)
        return core::makeError(core::ErrorCode::kInvalidArgument, "rule set: taper must not grow towards the race");
    return {};
}

} // namespace tpo::plan
