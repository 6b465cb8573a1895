/**
 * @file Confidence.cpp
 * @brief Confidence label helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tpo/core/Confidence.hpp"

#include <algorithm>

namespace tpo::core {

std::string_view confidenceLabelName(ConfidenceLabel label) noexcept
{
    switch (label)
    {
        case ConfidenceLabel::kInsufficient: return "insufficient";
        case ConfidenceLabel::kLow:          return "low";
        case ConfidenceLabel::kModerate:     return "moderate";
        case ConfidenceLabel::kHigh:         return "high";
    }
    return "unknown";
}

ConfidenceLabel downgrade(ConfidenceLabel label, u32 steps, ConfidenceLabel floor) noexcept
{
    if (label <= floor)
        return label;
    const u32 current = static_cast<u32>(label);
    const u32 lowest  = static_cast<u32>(floor);
    return static_cast<ConfidenceLabel>(std::max(lowest, current > steps ? current - steps : 0u));
}

} // namespace tpo::core
