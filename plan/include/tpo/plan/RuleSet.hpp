/**
 * @file RuleSet.hpp
 * @brief Versioned coaching rule tables.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_RULE_SET_HPP
    #define TPO_PLAN_RULE_SET_HPP

    #include <tpo/core/Expected.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/phase/Phase.hpp>
    #include <tpo/session/Session.hpp>

    #include <array>

namespace tpo::plan {

/**
 * @brief Limits applied to every week labelled with one phase.
 */
struct PhaseRules {
    core::f64 minEasyShare{0.70};
    core::u32 maxQualitySessions{2};
    core::f64 volumeFactor{1.0};   ///< Of the progression volume; taper interpolates to taperEndFactor.

    [[nodiscard]] bool operator==(const PhaseRules &) const = default;
};

/**
 * @brief Weekly distance band (km) of a volume tier.
 */
struct TierVolume {
    core::f64 minKm{0.0};
    core::f64 maxKm{0.0};
    core::f64 peakKm{0.0};
};

[[nodiscard]] TierVolume tierVolume(session::VolumeTier tier) noexcept;

struct RuleSet {
    static constexpr core::usize kPhaseCount = 6;

    core::u32 version{1};
    std::array<PhaseRules, kPhaseCount> phases{};

    core::f64 qualitySessionShareCap{0.10};
    core::f64 goalPaceShareCap{0.20};
    core::f64 goalPaceDistanceCapM{26'000.0};
    core::f64 longRunShareCap{0.30};
    core::f64 longRunDurationCapS{3.0 * 3600.0};

    core::u32 cutbackEvery{4};
    core::u32 higherRiskCutbackEvery{3};
    core::f64 cutbackFactor{0.75};
    core::f64 maxWeeklyIncrease{0.10};
    core::f64 taperEndFactor{0.55};
    core::u32 higherRiskAge{50};

    /// @brief Rule set version 1.
    [[nodiscard]] static RuleSet defaults();

    /**
     * @brief Checks internal consistency.
     * @return kInvalidArgument naming the first offending field.
     */
    [[nodiscard]] core::ExpectedVoid validate() const;

    [[nodiscard]] const PhaseRules &forPhase(phase::PhaseLabel label) const noexcept
    {
        return phases[static_cast<core::usize>(label)];
    }

    [[nodiscard]] bool operator==(const RuleSet &) const = default;
};

} // namespace tpo::plan

#endif // TPO_PLAN_RULE_SET_HPP
