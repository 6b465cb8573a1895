/**
 * @file DailyLoadSeries.cpp
 * @brief Dense daily load series.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/session/DailyLoadSeries.hpp>

#include <algorithm>

namespace tpo::session {

DailyLoadSeries::DailyLoadSeries(core::Date start, std::vector<core::f64> loads)
    : _start(start), _loads(std::move(loads))
{
}

DailyLoadSeries DailyLoadSeries::fromSessions(std::span<const Session> sessions, std::optional<core::Date> end)
{
    if (sessions.empty())
        return {};

    core::Date first = sessions.front().date;
    core::Date last  = sessions.front().date;
    for (const auto &s : sessions)
    {
        first = std::min(first, s.date);
        last  = std::max(last, s.date);
    }
    if (end)
        last = *end;
    if (last < first)
        return {};

    std::vector<core::f64> loads(static_cast<core::usize>(core::daysBetween(first, last) + 1), 0.0);
    for (const auto &s : sessions)
    {
        if (s.date > last)
            continue;
        loads[static_cast<core::usize>(core::daysBetween(first, s.date))] += s.trainingLoad;
    }
    return DailyLoadSeries{first, std::move(loads)};
}

core::Date DailyLoadSeries::end() const noexcept
{
    return core::addDays(_start, static_cast<core::i32>(_loads.size()) - 1);
}

core::f64 DailyLoadSeries::loadOn(core::Date day) const noexcept
{
    const core::i32 offset = core::daysBetween(_start, day);
    if (offset < 0 || static_cast<core::usize>(offset) >= _loads.size())
        return 0.0;
    return _loads[static_cast<core::usize>(offset)];
}

core::f64 DailyLoadSeries::trailingMean(core::Date asOf, core::i32 days) const noexcept
{
    if (days <= 0)
        return 0.0;

    core::f64 sum = 0.0;
    for (core::i32 i = 0; i < days; ++i)
        sum += loadOn(core::addDays(asOf, -i));
    return sum / static_cast<core::f64>(days);
}

std::vector<DateRange> DailyLoadSeries::gaps(core::Date from, core::Date to, core::i32 minDays) const
{
    std::vector<DateRange> out;
    if (empty() || to < from)
        return out;

    from = std::max(from, _start);
    to   = std::min(to, end());

    std::optional<core::Date> runStart;
    for (core::Date day = from; day <= to; day = core::addDays(day, 1))
    {
        if (loadOn(day) <= 0.0)
        {
            if (!runStart)
                runStart = day;
            continue;
        }
        if (runStart && core::daysBetween(*runStart, day) >= minDays)
            out.push_back({*runStart, core::addDays(day, -1)});
        runStart.reset();
    }
    if (runStart && core::daysBetween(*runStart, to) + 1 >= minDays)
        out.push_back({*runStart, to});
    return out;
}

DailyLoadSeries DailyLoadSeries::extendedTo(core::Date newEnd, core::f64 fill) const
{
    if (empty())
        return {};
    if (newEnd < _start)
        return DailyLoadSeries{_start, {}};

    std::vector<core::f64> loads = _loads;
    loads.resize(static_cast<core::usize>(core::daysBetween(_start, newEnd) + 1), fill);
    return DailyLoadSeries{_start, std::move(loads)};
}

} // namespace tpo::session
