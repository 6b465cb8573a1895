/**
 * @file WeeklyAggregate.cpp
 * @brief Weekly aggregation of sessions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/session/WeeklyAggregate.hpp>

#include <tpo/core/Constants.hpp>

#include <algorithm>

namespace tpo::session {

std::vector<WeeklyAggregate> aggregateWeeks(std::span<const Session> sessions, std::optional<core::Date> through)
{
    std::vector<WeeklyAggregate> weeks;
    if (sessions.empty())
        return weeks;

    core::Date first = sessions.front().date;
    core::Date last  = sessions.front().date;
    for (const auto &s : sessions)
    {
        first = std::min(first, s.date);
        last  = std::max(last, s.date);
    }
    if (through)
        last = *through;

    const core::Date firstWeek = core::weekStart(first);
    const core::Date lastWeek  = core::weekStart(last);
    if (lastWeek < firstWeek)
        return weeks;

    const core::i32 count = core::daysBetween(firstWeek, lastWeek) / core::kDaysPerWeek + 1;
    weeks.resize(static_cast<core::usize>(count));
    for (core::i32 w = 0; w < count; ++w)
        weeks[static_cast<core::usize>(w)].weekStart = core::addDays(firstWeek, w * core::kDaysPerWeek);

    for (const auto &s : sessions)
    {
        if (s.date > last)
            continue;

        auto &week = weeks[static_cast<core::usize>(core::daysBetween(firstWeek, s.date) / core::kDaysPerWeek)];
        week.distanceM += s.distanceM;
        week.durationS += s.durationS;
        week.load      += s.trainingLoad;
        ++week.sessionCount;

        if (isQuality(s.type))
        {
            ++week.qualityCount;
            week.qualityDistanceM += s.distanceM;
        }
        if (s.type == SessionType::kRace)
            week.hasRace = true;
        week.longestRunM = std::max(week.longestRunM, s.distanceM);
    }
    return weeks;
}

} // namespace tpo::session
