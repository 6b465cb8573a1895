/**
 * @file WeeklyAggregate.hpp
 * @brief Monday-based weekly summaries of the session history.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_SESSION_WEEKLY_AGGREGATE_HPP
    #define TPO_SESSION_WEEKLY_AGGREGATE_HPP

    #include "Session.hpp"

    #include <optional>
    #include <span>
    #include <vector>

namespace tpo::session {

struct WeeklyAggregate {
    core::Date weekStart;
    core::f64  distanceM{0.0};
    core::f64  durationS{0.0};
    core::f64  load{0.0};
    core::u32  sessionCount{0};
    core::u32  qualityCount{0};
    core::f64  qualityDistanceM{0.0};
    core::f64  longestRunM{0.0};
    bool       hasRace{false};

    /// @brief Share of the week's distance run as quality work.
    [[nodiscard]] core::f64 qualityShare() const noexcept
    {
        return distanceM > 0.0 ? qualityDistanceM / distanceM : 0.0;
    }
};

/**
 * @brief Dense weekly aggregates from the first session's week to the
 *        week containing @p through (or the last session).
 * @param sessions Chronological sessions.
 */
[[nodiscard]] std::vector<WeeklyAggregate> aggregateWeeks(
    std::span<const Session> sessions,
    std::optional<core::Date> through = std::nullopt);

} // namespace tpo::session

#endif // TPO_SESSION_WEEKLY_AGGREGATE_HPP
