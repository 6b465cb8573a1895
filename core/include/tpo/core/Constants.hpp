/**
 * @file Constants.hpp
 * @brief Engine-wide compile-time constants.
 *
 * Population defaults of the training-response model, analysis windows
 * and the coaching limits that are not part of the versioned rule set
 * live here so that a single header controls them.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_CONSTANTS_HPP
    #define TPO_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace tpo::core {

inline constexpr i32 kDaysPerWeek               = 7;

// ---- Training-response model ---------------------------------------------

inline constexpr f64 kPopulationTau1            = 42.0;
inline constexpr f64 kPopulationTau2            = 7.0;
inline constexpr f64 kPopulationK1              = 0.004;
inline constexpr f64 kPopulationK2              = 0.010;
inline constexpr f64 kPopulationBaseline        = 45.0;
inline constexpr f64 kPopulationResidualVar     = 9.0;

inline constexpr f64 kTauMin                    = 5.0;
inline constexpr f64 kTauMax                    = 60.0;
inline constexpr f64 kK1Min                     = 0.0002;
inline constexpr f64 kK1Max                     = 0.05;
inline constexpr f64 kK2Min                     = 0.0002;
inline constexpr f64 kK2Max                     = 0.1;
inline constexpr f64 kBaselineMin               = 15.0;
inline constexpr f64 kBaselineMax               = 90.0;

inline constexpr u32 kMinRaceObservations       = 3;
inline constexpr i32 kMinHistoryDaysForHigh     = 60;
inline constexpr i32 kRecalibrationCadenceDays  = 28;
inline constexpr f64 kInterval80Z               = 1.2816;

// ---- Analysis windows ----------------------------------------------------

inline constexpr i32 kTrailingLoadDays          = 28;
inline constexpr i32 kGapThresholdDays          = 7;
inline constexpr i32 kGapLookbackDays           = 42;
inline constexpr i32 kRecencyScaleDays          = 180;
inline constexpr i32 kHorizonScaleDays          = 56;

inline constexpr u32 kDefaultMaxTaperWeeks      = 4;
inline constexpr f64 kTaperFloorFraction        = 0.40;

// ---- Fitness bank / constraints ------------------------------------------

inline constexpr u32 kBankWindowWeeks           = 6;
inline constexpr u32 kConfirmationWeeks         = 8;
inline constexpr f64 kComparableFraction        = 0.85;
inline constexpr i32 kConstraintGapDays         = 14;
inline constexpr f64 kConstraintResumeFraction  = 0.70;
inline constexpr f64 kConstraintRecoverFraction = 0.90;
inline constexpr u32 kConstraintRecoverWeeks    = 3;
inline constexpr f64 kDefaultRebuildRatio       = 1.5;

// ---- Insights ------------------------------------------------------------

inline constexpr u32 kDefaultInsightTopK        = 5;
inline constexpr i32 kDefaultCooldownDays       = 21;
inline constexpr f64 kInsightHalfLifeDays       = 14.0;

} // namespace tpo::core

#endif // TPO_CORE_CONSTANTS_HPP
