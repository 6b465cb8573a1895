/**
 * @file SyntheticHistory.cpp
 * @brief Synthetic training history generation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/sim/SyntheticHistory.hpp>

#include <tpo/core/Constants.hpp>
#include <tpo/core/Log.hpp>
#include <tpo/model/Vdot.hpp>
#include <tpo/session/TrainingLoad.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>

namespace tpo::sim {

namespace {

struct Slot {
    core::i32            weekday;
    session::SessionType type;
    core::f64            share;
};

/// Training days (Mon = 0) for a weekly frequency; the long run is Sunday.
std::vector<core::i32> trainingDays(core::u32 daysPerWeek)
{
    switch (daysPerWeek)
    {
    case 3: return {1, 3, 6};
    case 4: return {1, 3, 5, 6};
    case 5: return {1, 2, 3, 5, 6};
    case 6: return {0, 1, 2, 3, 5, 6};
    default: return {0, 1, 2, 3, 4, 5, 6};
    }
}

std::vector<Slot> weekSlots(core::u32 daysPerWeek, bool raceWeek)
{
    std::vector<Slot> slots;
    auto days = trainingDays(daysPerWeek);
    if (raceWeek && std::ranges::find(days, 5) == days.end())
        days.insert(days.end() - 1, 5);
    const auto easyDays = static_cast<core::f64>(std::ranges::count_if(days, [&](core::i32 d) {
        if (d == 6 || d == 1)
            return false;
        if (d == 3 && daysPerWeek >= 4 && !raceWeek)
            return false;
        return !(raceWeek && d == 5);
    }));

    const core::f64 longShare    = raceWeek ? 0.10 : 0.30;
    const core::f64 qualityShare = raceWeek ? 0.15 : (daysPerWeek >= 4 ? 0.30 : 0.15);
    const core::f64 easyShare    = easyDays > 0.0 ? (1.0 - longShare - qualityShare) / easyDays : 0.0;

    for (core::i32 d : days)
    {
        if (d == 6)
            slots.push_back({d, raceWeek ? session::SessionType::kRecovery : session::SessionType::kLong, longShare});
        else if (d == 1)
            slots.push_back({d, session::SessionType::kThreshold, 0.15});
        else if (d == 3 && daysPerWeek >= 4 && !raceWeek)
            slots.push_back({d, session::SessionType::kInterval, 0.15});
        else if (raceWeek && d == 5)
            slots.push_back({d, session::SessionType::kRace, 0.0});
        else
            slots.push_back({d, session::SessionType::kEasy, easyShare});
    }
    return slots;
}

/// Share of heart-rate reserve a session type is run at.
core::f64 reserveFraction(session::SessionType type) noexcept
{
    switch (type)
    {
    case session::SessionType::kRecovery: return 0.60;
    case session::SessionType::kLong: return 0.70;
    case session::SessionType::kThreshold: return 0.82;
    case session::SessionType::kInterval: return 0.86;
    case session::SessionType::kRace: return 0.92;
    default: return 0.65;
    }
}

/// Average speed of a whole session, warm-up included.
core::f64 sessionSpeed(core::f64 vdot, session::SessionType type) noexcept
{
    const core::f64 easy = model::zoneSpeed(vdot, model::PaceZone::kEasy);
    switch (type)
    {
    case session::SessionType::kRecovery: return 0.92 * easy;
    case session::SessionType::kThreshold:
        return 0.5 * (easy + model::zoneSpeed(vdot, model::PaceZone::kThreshold));
    case session::SessionType::kInterval:
        return 0.5 * (easy + model::zoneSpeed(vdot, model::PaceZone::kInterval));
    default: return easy;
    }
}

} // namespace

SyntheticHistory::SyntheticHistory(core::u64 seed) { reset(seed); }

void SyntheticHistory::setProfile(const SyntheticProfile &profile) { _profile = profile; }

void SyntheticHistory::reset(core::u64 seed)
{
    if (seed == 0)
        seed = static_cast<core::u64>(std::chrono::steady_clock::now().time_since_epoch().count());
    _rng.seed(seed);
}

core::f64 SyntheticHistory::vdotAt(core::u32 week) const noexcept
{
    return std::clamp(_profile.startVdot + _profile.vdotGainPerWeek * static_cast<core::f64>(week), model::kVdotMin,
                      model::kVdotMax);
}

core::f64 SyntheticHistory::jitter(core::f64 value)
{
    if (_profile.noise <= 0.0)
        return value;
    std::normal_distribution<core::f64> dist{0.0, _profile.noise};
    return value * std::clamp(1.0 + dist(_rng), 0.5, 1.5);
}

core::Expected<SyntheticData> SyntheticHistory::generate(const core::AthleteId &athleteId)
{
    const SyntheticProfile &p = _profile;
    if (athleteId.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "synthetic history needs an athlete id");
    if (p.weeks == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "synthetic history needs at least one week");
    if (p.daysPerWeek < 3 || p.daysPerWeek > 7)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("{} training days per week is outside 3-7", p.daysPerWeek));
    if (p.baseWeeklyKm <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "weekly volume must be positive");

    SyntheticData data;
    data.athlete.id               = athleteId;
    data.athlete.daysPerWeek      = p.daysPerWeek;
    data.athlete.maxHeartRate     = p.maxHeartRate;
    data.athlete.restingHeartRate = p.restingHeartRate;

    const core::Date firstMonday = core::weekStart(p.start);
    data.lastDay = core::addDays(firstMonday, static_cast<core::i32>(p.weeks) * core::kDaysPerWeek - 1);

    core::u32 counter = 0;
    for (core::u32 w = 0; w < p.weeks; ++w)
    {
        core::f64 factor = std::pow(1.0 + p.weeklyGrowth, static_cast<core::f64>(w));
        if (p.layoff)
        {
            const core::u32 end = p.layoff->startWeek + p.layoff->weeks;
            if (w >= p.layoff->startWeek && w < end)
                continue;
            if (w >= end && w < end + 2)
                factor *= 0.7;
        }
        if (p.cutbackEvery > 0 && (w + 1) % p.cutbackEvery == 0)
            factor *= p.cutbackFactor;

        const bool      raceWeek = p.raceEveryWeeks > 0 && (w + 1) % p.raceEveryWeeks == 0;
        const core::f64 volumeM  = p.baseWeeklyKm * 1000.0 * factor;
        const core::f64 vdot     = vdotAt(w);
        const core::Date monday  = core::addDays(firstMonday, static_cast<core::i32>(w) * core::kDaysPerWeek);

        for (const Slot &slot : weekSlots(p.daysPerWeek, raceWeek))
        {
            session::Session s;
            s.id   = std::format("{}-s{:04}", athleteId, counter++);
            s.date = core::addDays(monday, slot.weekday);
            s.type = slot.type;

            if (slot.type == session::SessionType::kRace)
            {
                const core::f64 dayVdot = vdot * (1.0 + (jitter(1.0) - 1.0) / 3.0);
                const core::f64 timeS   = TPO_TRY(model::raceTimeForVdot(dayVdot, p.raceDistanceM));
                s.distanceM = p.raceDistanceM;
                s.durationS = timeS;
                data.races.push_back({s.date, s.distanceM, s.durationS});
            }
            else
            {
                s.distanceM = std::round(jitter(volumeM * slot.share) / 10.0) * 10.0;
                s.durationS = s.distanceM / jitter(sessionSpeed(vdot, slot.type));
            }

            std::normal_distribution<core::f64> hrNoise{0.0, 2.0};
            s.avgHeartRate = p.restingHeartRate + reserveFraction(slot.type) * (p.maxHeartRate - p.restingHeartRate)
                           + hrNoise(_rng);
            s.trainingLoad = session::computeTrainingLoad(s, data.athlete);
            data.sessions.push_back(std::move(s));
        }
    }

    core::Log::debug("SyntheticHistory", std::format("{}: {} sessions and {} races over {} weeks", athleteId,
                                                     data.sessions.size(), data.races.size(), p.weeks));
    return data;
}

} // namespace tpo::sim
