/**
 * @file FitnessBank.cpp
 * @brief Trailing-window peak extraction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/bank/FitnessBank.hpp>

#include <tpo/core/Log.hpp>
#include <tpo/model/Vdot.hpp>
#include <tpo/session/WeeklyAggregate.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <vector>

namespace tpo::bank {

namespace {

constexpr core::f64 kUnconfirmedShare = 0.92;

/// Weekly metric series aligned with the weekly aggregates.
struct WeeklyMetrics {
    std::vector<core::Date> weekStart;
    std::vector<core::f64>  volume;
    std::vector<core::f64>  longRun;
    std::vector<core::f64>  goalPaceRun;
};

WeeklyMetrics weeklyMetrics(std::span<const session::Session> sessions, core::Date today)
{
    WeeklyMetrics m;
    const auto weeks = session::aggregateWeeks(sessions, today);
    for (const auto &w : weeks)
    {
        m.weekStart.push_back(w.weekStart);
        m.volume.push_back(w.distanceM);
        m.longRun.push_back(w.longestRunM);
        m.goalPaceRun.push_back(0.0);
    }
    if (weeks.empty())
        return m;

    for (const auto &s : sessions)
    {
        if (s.type != session::SessionType::kMarathonPace || s.date > today)
            continue;
        const auto idx = static_cast<core::usize>(core::daysBetween(m.weekStart.front(), s.date) / core::kDaysPerWeek);
        m.goalPaceRun[idx] = std::max(m.goalPaceRun[idx], s.distanceM);
    }
    return m;
}

/**
 * Peak over trailing windows of @p window weeks. @p sustained selects the
 * window mean instead of the window maximum.
 */
CapabilityEvidence windowPeak(
    const std::vector<core::f64> &values,
    const std::vector<core::Date> &weekStart,
    core::Date today,
    core::usize window,
    bool sustained,
    core::f64 comparable)
{
    CapabilityEvidence peak;
    const core::usize divisor = std::min(window, values.size());

    for (core::usize e = 0; e < values.size(); ++e)
    {
        const core::usize lo = e + 1 >= window ? e + 1 - window : 0;

        core::f64 sum = 0.0;
        core::f64 max = 0.0;
        for (core::usize i = lo; i <= e; ++i)
        {
            sum += values[i];
            max  = std::max(max, values[i]);
        }
        const core::f64 value = sustained ? sum / static_cast<core::f64>(divisor) : max;
        if (value <= peak.value)
            continue;

        peak.value        = value;
        peak.evidenceDate = std::min(core::addDays(weekStart[e], core::kDaysPerWeek - 1), today);
        peak.sampleCount  = static_cast<core::u32>(std::count_if(
            values.begin() + static_cast<core::isize>(lo), values.begin() + static_cast<core::isize>(e) + 1,
            [&](core::f64 v) { return v >= comparable * value; }));
    }
    return peak;
}

bool confirmedRecently(
    const CapabilityEvidence &peak,
    const std::vector<core::f64> &values,
    const std::vector<core::Date> &weekStart,
    core::Date today,
    const BankOptions &options)
{
    if (peak.value <= 0.0)
        return false;

    const core::Date horizon = core::addDays(core::weekStart(today),
                                             -core::kDaysPerWeek * static_cast<core::i32>(options.confirmationWeeks - 1));
    for (core::usize i = 0; i < values.size(); ++i)
    {
        if (weekStart[i] >= horizon && values[i] >= options.comparableFraction * peak.value)
            return true;
    }
    return false;
}

ExperienceLevel experienceFor(core::f64 peakWeeklyM) noexcept
{
    const core::f64 km = peakWeeklyM / 1000.0;
    if (km < 40.0)
        return ExperienceLevel::kBeginner;
    if (km < 64.0)
        return ExperienceLevel::kIntermediate;
    if (km < 97.0)
        return ExperienceLevel::kExperienced;
    return ExperienceLevel::kElite;
}

} // namespace

std::string_view experienceLevelName(ExperienceLevel level) noexcept
{
    switch (level)
    {
        case ExperienceLevel::kBeginner:     return "beginner";
        case ExperienceLevel::kIntermediate: return "intermediate";
        case ExperienceLevel::kExperienced:  return "experienced";
        case ExperienceLevel::kElite:        return "elite";
    }
    return "unknown";
}

core::f64 FitnessBank::sustainableWeeklyVolume() const noexcept
{
    return peakWeeklyVolume.confirmed ? peakWeeklyVolume.value : kUnconfirmedShare * peakWeeklyVolume.value;
}

FitnessBank computeFitnessBank(
    std::span<const session::Session> sessions,
    core::Date today,
    std::span<const session::RaceResult> races,
    const BankOptions &options)
{
    FitnessBank bank;
    bank.asOf = today;

    std::vector<session::Session> past;
    std::copy_if(sessions.begin(), sessions.end(), std::back_inserter(past),
                 [&](const session::Session &s) { return s.date <= today; });

    for (const auto &race : races)
    {
        if (race.date > today)
            continue;
        if (auto vdot = model::vdotFromRace(race.distanceM, race.timeS))
            bank.bestRaceVdot = std::max(bank.bestRaceVdot.value_or(0.0), *vdot);
        else
            core::Log::warn("FitnessBank", std::format("ignoring race on {}: {}",
                                                       core::toString(race.date), vdot.error().message()));
    }

    if (past.empty())
        return bank;

    const WeeklyMetrics m = weeklyMetrics(past, today);
    const core::usize window = options.windowWeeks;
    const core::f64   frac   = options.comparableFraction;

    bank.peakWeeklyVolume      = windowPeak(m.volume, m.weekStart, today, window, true, frac);
    bank.peakLongRun           = windowPeak(m.longRun, m.weekStart, today, window, false, frac);
    bank.peakLongRunAtGoalPace = windowPeak(m.goalPaceRun, m.weekStart, today, window, false, frac);

    bank.peakWeeklyVolume.confirmed      = confirmedRecently(bank.peakWeeklyVolume, m.volume, m.weekStart, today, options);
    bank.peakLongRun.confirmed           = confirmedRecently(bank.peakLongRun, m.longRun, m.weekStart, today, options);
    bank.peakLongRunAtGoalPace.confirmed = confirmedRecently(bank.peakLongRunAtGoalPace, m.goalPaceRun, m.weekStart, today, options);

    const core::Date recent = core::addDays(today, -(4 * core::kDaysPerWeek - 1));
    core::f64 recentDistance = 0.0;
    for (const auto &s : past)
    {
        if (s.date < recent)
            continue;
        recentDistance     += s.distanceM;
        bank.currentLongRun = std::max(bank.currentLongRun, s.distanceM);
    }
    bank.currentWeeklyVolume = recentDistance / 4.0;
    bank.experience          = experienceFor(bank.peakWeeklyVolume.value);

    core::Log::debug("FitnessBank", std::format(
        "peak week {:.1f} km ({}), long run {:.1f} km ({}), current {:.1f} km/week",
        bank.peakWeeklyVolume.value / 1000.0, bank.peakWeeklyVolume.confirmed ? "confirmed" : "unconfirmed",
        bank.peakLongRun.value / 1000.0, bank.peakLongRun.confirmed ? "confirmed" : "unconfirmed",
        bank.currentWeeklyVolume / 1000.0));
    return bank;
}

FitnessBank mergeFitnessBank(
    const FitnessBank &prior,
    const FitnessBank &fresh,
    bool constraintActive,
    const BankOptions &options)
{
    auto mergeOne = [&](const CapabilityEvidence &kept, const CapabilityEvidence &now) {
        CapabilityEvidence out = now.value >= kept.value ? now : kept;
        if (now.value < kept.value)
            out.confirmed = now.confirmed && now.value >= options.comparableFraction * kept.value;
        if (constraintActive)
            out.confirmed = false;
        return out;
    };

    FitnessBank merged = fresh;
    merged.peakWeeklyVolume      = mergeOne(prior.peakWeeklyVolume, fresh.peakWeeklyVolume);
    merged.peakLongRun           = mergeOne(prior.peakLongRun, fresh.peakLongRun);
    merged.peakLongRunAtGoalPace = mergeOne(prior.peakLongRunAtGoalPace, fresh.peakLongRunAtGoalPace);
    if (prior.bestRaceVdot && (!fresh.bestRaceVdot || *prior.bestRaceVdot > *fresh.bestRaceVdot))
        merged.bestRaceVdot = prior.bestRaceVdot;
    merged.experience = experienceFor(merged.peakWeeklyVolume.value);
    return merged;
}

} // namespace tpo::bank
