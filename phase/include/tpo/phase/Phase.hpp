/**
 * @file Phase.hpp
 * @brief Periodisation phase labels and week ranges.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PHASE_PHASE_HPP
    #define TPO_PHASE_PHASE_HPP

    #include <tpo/core/Date.hpp>
    #include <tpo/core/Types.hpp>

    #include <string_view>

namespace tpo::phase {

enum class PhaseLabel : core::u8 {
    kBase = 0,
    kBuild,
    kPeak,
    kTaper,
    kRace,
    kRecovery
};

[[nodiscard]] std::string_view phaseLabelName(PhaseLabel label) noexcept;

/**
 * @brief Label assigned to one week, with how it was reached.
 */
struct WeekPhase {
    enum class Basis : core::u8 { kDetected = 0, kTransition, kInherited, kForced, kOverride };

    core::u32  weekIndex{0};
    core::Date weekStart{};
    PhaseLabel label{PhaseLabel::kBase};
    Basis      basis{Basis::kDetected};
    core::f64  confidence{0.0};
};

/**
 * @brief A run of consecutive weeks sharing a label.
 */
struct Phase {
    PhaseLabel label{PhaseLabel::kBase};
    core::u32  firstWeek{0};
    core::u32  lastWeek{0};     ///< Inclusive.
    core::Date startDate{};
    core::Date endDate{};       ///< Sunday of the last week.
    core::f64  detectionConfidence{0.0};

    [[nodiscard]] core::u32 weekCount() const noexcept { return lastWeek - firstWeek + 1; }
};

/**
 * @brief Manual label for a single week.
 */
struct PhaseOverride {
    core::Date weekStart{};
    PhaseLabel label{PhaseLabel::kBase};
};

} // namespace tpo::phase

#endif // TPO_PHASE_PHASE_HPP
