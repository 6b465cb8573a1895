/**
 * @file Session.cpp
 * @brief Names of session enumerations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/session/Session.hpp>

namespace tpo::session {

std::string_view sessionTypeName(SessionType type) noexcept
{
    switch (type)
    {
        case SessionType::kEasy:         return "easy";
        case SessionType::kRecovery:     return "recovery";
        case SessionType::kLong:         return "long";
        case SessionType::kMarathonPace: return "marathon_pace";
        case SessionType::kThreshold:    return "threshold";
        case SessionType::kInterval:     return "interval";
        case SessionType::kRace:         return "race";
        case SessionType::kOther:        return "other";
    }
    return "unknown";
}

std::string_view volumeTierName(VolumeTier tier) noexcept
{
    switch (tier)
    {
        case VolumeTier::kBuilder: return "builder";
        case VolumeTier::kLow:     return "low";
        case VolumeTier::kMid:     return "mid";
        case VolumeTier::kHigh:    return "high";
        case VolumeTier::kElite:   return "elite";
    }
    return "unknown";
}

} // namespace tpo::session
