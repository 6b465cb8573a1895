/**
 * @file Insight.cpp
 * @brief Insight confidence and priority.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/insight/Insight.hpp>

#include <tpo/math/Statistics.hpp>

#include <algorithm>
#include <format>

namespace tpo::insight {

std::string_view insightTypeName(InsightType type) noexcept
{
    switch (type)
    {
    case InsightType::kTrend: return "trend";
    case InsightType::kBreakthrough: return "breakthrough";
    case InsightType::kFatigueWarning: return "fatigue_warning";
    case InsightType::kPattern: return "pattern";
    case InsightType::kInjuryRisk: return "injury_risk";
    }
    return "unknown";
}

std::string makeSignature(InsightType type, std::string_view key)
{
    return std::format("{}:{}", insightTypeName(type), key);
}

core::ConfidenceLabel insightConfidence(core::usize sampleSize, core::f64 consistency) noexcept
{
    if (sampleSize >= 10 && consistency >= 0.8)
        return core::ConfidenceLabel::kHigh;
    if (sampleSize >= 6 && consistency >= 0.6)
        return core::ConfidenceLabel::kModerate;
    if (sampleSize >= 3)
        return core::ConfidenceLabel::kLow;
    return core::ConfidenceLabel::kInsufficient;
}

core::f64 confidenceWeight(core::ConfidenceLabel label) noexcept
{
    switch (label)
    {
    case core::ConfidenceLabel::kHigh: return 1.0;
    case core::ConfidenceLabel::kModerate: return 0.75;
    case core::ConfidenceLabel::kLow: return 0.5;
    case core::ConfidenceLabel::kInsufficient: return 0.25;
    }
    return 0.25;
}

core::f64 insightPriority(core::f64 rawScore, core::ConfidenceLabel label, core::i32 ageDays,
                          core::f64 halfLifeDays) noexcept
{
    const auto age = static_cast<core::f64>(std::max(ageDays, 0));
    return rawScore * confidenceWeight(label) * math::Statistics::halfLifeWeight(age, halfLifeDays);
}

} // namespace tpo::insight
