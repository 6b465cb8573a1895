/**
 * @file PhaseDetector.hpp
 * @brief Trend-based state machine labelling training weeks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PHASE_PHASE_DETECTOR_HPP
    #define TPO_PHASE_PHASE_DETECTOR_HPP

    #include "Phase.hpp"

    #include <tpo/session/WeeklyAggregate.hpp>

    #include <optional>
    #include <span>
    #include <vector>

namespace tpo::phase {

struct PhaseOptions {
    core::u32 taperWeeks{2};           ///< Weeks before the race week forced to taper.
    core::u32 sustainWeeks{2};         ///< Consecutive weeks a new trend must hold.
    core::f64 buildQualityShare{0.08};
    core::f64 peakQualityShare{0.15};
    core::f64 peakFraction{0.90};      ///< Of the running maximum volume and long run.
    core::f64 recoveryFraction{0.60};  ///< Of the pre-race reference volume.
};

/**
 * @brief Labels each aggregate week.
 *
 * Race and taper weeks around @p raceDate are forced; a sharply reduced
 * week right after a race is recovery; other label changes need
 * @ref PhaseOptions::sustainWeeks consecutive weeks of evidence and
 * ambiguous weeks inherit. An override replaces the label of its own week
 * only.
 */
[[nodiscard]] std::vector<WeekPhase> labelWeeks(
    std::span<const session::WeeklyAggregate> weeks,
    std::optional<core::Date> raceDate,
    std::span<const PhaseOverride> overrides = {},
    const PhaseOptions &options = {});

/**
 * @brief Groups labelled weeks into a gap-free partition of phases.
 */
[[nodiscard]] std::vector<Phase> groupPhases(std::span<const WeekPhase> weeks);

/// @brief labelWeeks followed by groupPhases.
[[nodiscard]] std::vector<Phase> detectPhases(
    std::span<const session::WeeklyAggregate> weeks,
    std::optional<core::Date> raceDate,
    std::span<const PhaseOverride> overrides = {},
    const PhaseOptions &options = {});

/**
 * @brief Forward phase layout for @p weeksToRace weeks ending in the race
 *        week.
 *
 * An athlete already in a build or peak phase skips the base block: those
 * weeks become build weeks.
 */
[[nodiscard]] std::vector<PhaseLabel> planPhases(core::u32 weeksToRace, core::u32 taperWeeks = 2,
                                                 std::optional<PhaseLabel> current = std::nullopt);

} // namespace tpo::phase

#endif // TPO_PHASE_PHASE_DETECTOR_HPP
