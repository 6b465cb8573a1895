/**
 * @file Insight.hpp
 * @brief Ranked, confidence-scored observations about an athlete's training.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_INSIGHT_INSIGHT_HPP
    #define TPO_INSIGHT_INSIGHT_HPP

    #include <tpo/core/Confidence.hpp>
    #include <tpo/core/Date.hpp>
    #include <tpo/core/Types.hpp>

    #include <optional>
    #include <string>
    #include <string_view>
    #include <vector>

namespace tpo::insight {

enum class InsightType : core::u8 {
    kTrend = 0,
    kBreakthrough,
    kFatigueWarning,
    kPattern,
    kInjuryRisk
};

[[nodiscard]] std::string_view insightTypeName(InsightType type) noexcept;

/// @brief Raw scores detectors assign by severity.
namespace score {
inline constexpr core::f64 kCritical = 100.0;
inline constexpr core::f64 kHigh     = 80.0;
inline constexpr core::f64 kMedium   = 60.0;
inline constexpr core::f64 kLow      = 40.0;
} // namespace score

struct Evidence {
    std::string               label;
    core::f64                 value{0.0};
    std::optional<core::Date> date;

    [[nodiscard]] bool operator==(const Evidence &) const = default;
};

struct Insight {
    InsightType           type{InsightType::kTrend};
    std::string           title;
    std::string           detail;
    std::vector<Evidence> evidence;
    std::string           signature;    ///< "<type>:<evidence key>", stable across runs.
    core::f64             rawScore{0.0};
    core::usize           sampleSize{0};
    core::f64             consistency{0.0};  ///< Share of the evidence agreeing with the conclusion.
    core::Date            observedAt{};
    core::ConfidenceLabel confidence{core::ConfidenceLabel::kInsufficient};
    core::f64             priority{0.0};
    bool                  isNew{true};

    [[nodiscard]] bool operator==(const Insight &) const = default;
};

/// @brief Builds a signature from @p type and a detector-specific key.
[[nodiscard]] std::string makeSignature(InsightType type, std::string_view key);

/**
 * @brief Confidence from sample size and evidence consistency.
 *
 * High needs ten samples agreeing at 80 %, moderate six at 60 %, low any
 * three samples.
 */
[[nodiscard]] core::ConfidenceLabel insightConfidence(core::usize sampleSize, core::f64 consistency) noexcept;

/// @brief Ranking weight of a confidence label (1, 0.75, 0.5, 0.25).
[[nodiscard]] core::f64 confidenceWeight(core::ConfidenceLabel label) noexcept;

/**
 * @brief raw × confidence weight × recency half-life weight.
 */
[[nodiscard]] core::f64 insightPriority(core::f64 rawScore, core::ConfidenceLabel label, core::i32 ageDays,
                                        core::f64 halfLifeDays) noexcept;

} // namespace tpo::insight

#endif // TPO_INSIGHT_INSIGHT_HPP
