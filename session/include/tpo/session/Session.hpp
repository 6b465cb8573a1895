/**
 * @file Session.hpp
 * @brief Athlete profile, recorded sessions and race results.
 *
 * All distances are metres and all durations seconds. Sessions are
 * immutable once recorded; corrections are new sessions that name the
 * record they supersede.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_SESSION_SESSION_HPP
    #define TPO_SESSION_SESSION_HPP

    #include <tpo/core/Date.hpp>
    #include <tpo/core/Types.hpp>

    #include <optional>
    #include <string_view>

namespace tpo::session {

/**
 * @brief Detected kind of a recorded session.
 */
enum class SessionType : core::u8 {
    kEasy = 0,
    kRecovery,
    kLong,
    kMarathonPace,
    kThreshold,
    kInterval,
    kRace,
    kOther
};

[[nodiscard]] std::string_view sessionTypeName(SessionType type) noexcept;

/// @brief Threshold, interval and marathon-pace work.
[[nodiscard]] constexpr bool isQuality(SessionType type) noexcept
{
    return type == SessionType::kThreshold
        || type == SessionType::kInterval
        || type == SessionType::kMarathonPace;
}

struct Session {
    core::SessionId                id;
    core::Date                     date;
    core::f64                      durationS{0.0};
    core::f64                      distanceM{0.0};
    std::optional<core::f64>       avgHeartRate;
    SessionType                    type{SessionType::kEasy};
    core::f64                      trainingLoad{0.0};
    std::optional<core::SessionId> supersedes;

    /// @brief Average speed in m/s, zero for a zero-duration record.
    [[nodiscard]] core::f64 speed() const noexcept
    {
        return durationS > 0.0 ? distanceM / durationS : 0.0;
    }

    [[nodiscard]] bool operator==(const Session &) const = default;
};

struct RaceResult {
    core::Date date;
    core::f64  distanceM{0.0};
    core::f64  timeS{0.0};
};

enum class Sex : core::u8 { kUnspecified = 0, kFemale, kMale };

/**
 * @brief Weekly volume band the athlete trains in.
 */
enum class VolumeTier : core::u8 {
    kBuilder = 0,
    kLow,
    kMid,
    kHigh,
    kElite
};

[[nodiscard]] std::string_view volumeTierName(VolumeTier tier) noexcept;

struct Athlete {
    core::AthleteId          id;
    core::u32                age{35};
    Sex                      sex{Sex::kUnspecified};
    VolumeTier               volumeTier{VolumeTier::kMid};
    core::u32                daysPerWeek{5};
    std::optional<core::f64> maxHeartRate;
    std::optional<core::f64> restingHeartRate;
};

} // namespace tpo::session

#endif // TPO_SESSION_SESSION_HPP
