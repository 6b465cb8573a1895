/**
 * @file InsightFixtures.hpp
 * @brief Session builders shared by the insight tests.
 */
#pragma once

#include "tpo/insight/Detectors.hpp"

#include <format>
#include <optional>
#include <span>
#include <vector>

namespace tpo::insight::test {

inline const core::Date kStart = core::makeDate(2024, 1, 1);   // a Monday

inline core::Date day(core::i32 offset) { return core::addDays(kStart, offset); }

/// A run at 3 m/s unless @p speed says otherwise.
inline session::Session run(core::i32 offset, double km, std::optional<double> heartRate = std::nullopt,
                            session::SessionType type = session::SessionType::kEasy, double load = 0.0,
                            double speed = 3.0)
{
    session::Session s;
    s.id           = std::format("s{}-{}", offset, static_cast<int>(km * 10));
    s.date         = day(offset);
    s.distanceM    = km * 1000.0;
    s.durationS    = km * 1000.0 / speed;
    s.avgHeartRate = heartRate;
    s.type         = type;
    s.trainingLoad = load > 0.0 ? load : km * 5.0;
    return s;
}

inline InsightContext contextFor(std::span<const session::Session> sessions, core::Date today)
{
    InsightContext context;
    context.athlete.id = "ath-1";
    context.sessions   = sessions;
    context.today      = today;
    return context;
}

inline const Insight *findSignature(const std::vector<Insight> &insights, std::string_view signature)
{
    for (const auto &i : insights)
    {
        if (i.signature == signature)
            return &i;
    }
    return nullptr;
}

} // namespace tpo::insight::test
