/**
 * @file ConstraintDetector.cpp
 * @brief Explicit and inferred constraint resolution.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/bank/ConstraintDetector.hpp>

#include <tpo/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace tpo::bank {

namespace {

constexpr std::string_view kTag = "ConstraintDetector";

constexpr core::f64 kSeverityScaleDays = 90.0;
constexpr core::f64 kMinSeverity       = 0.1;
constexpr core::f64 kMinRebuildRatio   = 0.5;
constexpr core::f64 kMaxRebuildRatio   = 4.0;

struct Gap {
    core::Date lastBefore;
    core::Date resumedAt;
    core::i32  days{0};
};

std::vector<session::Session> runsUntil(std::span<const session::Session> sessions, core::Date until)
{
    std::vector<session::Session> out;
    for (const auto &s : sessions)
    {
        if (s.date <= until && s.distanceM > 0.0)
            out.push_back(s);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const session::Session &a, const session::Session &b) { return a.date < b.date; });
    return out;
}

std::vector<Gap> findGaps(const std::vector<session::Session> &runs, core::i32 minDays)
{
    std::vector<Gap> gaps;
    for (core::usize i = 1; i < runs.size(); ++i)
    {
        const core::i32 rest = core::daysBetween(runs[i - 1].date, runs[i].date) - 1;
        if (rest >= minDays)
            gaps.push_back({runs[i - 1].date, runs[i].date, rest});
    }
    return gaps;
}

core::f64 distanceBetween(const std::vector<session::Session> &runs, core::Date from, core::Date to)
{
    core::f64 sum = 0.0;
    for (const auto &s : runs)
    {
        if (s.date >= from && s.date <= to)
            sum += s.distanceM;
    }
    return sum;
}

/// Mean weekly distance over the four weeks ending at @p lastDay.
core::f64 referenceVolume(const std::vector<session::Session> &runs, core::Date lastDay)
{
    return distanceBetween(runs, core::addDays(lastDay, -27), lastDay) / 4.0;
}

bool sustainedRecovery(
    const std::vector<session::Session> &runs,
    core::Date resumedAt,
    core::Date today,
    core::f64 reference,
    const ConstraintOptions &options)
{
    core::u32 streak = 0;
    for (core::Date week = core::addDays(core::weekStart(resumedAt), core::kDaysPerWeek);
         core::addDays(week, core::kDaysPerWeek - 1) < today;
         week = core::addDays(week, core::kDaysPerWeek))
    {
        const core::f64 volume = distanceBetween(runs, week, core::addDays(week, core::kDaysPerWeek - 1));
        streak = volume >= options.recoverFraction * reference ? streak + 1 : 0;
        if (streak >= options.recoverWeeks)
            return true;
    }
    return false;
}

core::Date expiryFrom(core::Date start, core::i32 layoffDays, core::f64 ratio)
{
    return core::addDays(start, static_cast<core::i32>(std::ceil(static_cast<core::f64>(layoffDays) * ratio)));
}

std::optional<Constraint> inferConstraint(
    std::span<const session::Session> sessions,
    const std::vector<session::Session> &runs,
    core::Date today,
    const ConstraintOptions &options)
{
    const auto gaps = findGaps(runs, options.minGapDays);
    if (gaps.empty())
        return std::nullopt;

    const Gap &gap = gaps.back();
    const core::f64 reference = referenceVolume(runs, gap.lastBefore);
    if (reference <= 0.0)
        return std::nullopt;

    const core::i32 span = std::min(core::daysBetween(gap.resumedAt, today) + 1, 2 * core::kDaysPerWeek);
    const core::f64 resumed = distanceBetween(runs, gap.resumedAt, core::addDays(gap.resumedAt, span - 1))
                            / static_cast<core::f64>(std::max(span, core::kDaysPerWeek))
                            * core::kDaysPerWeek;
    if (resumed >= options.resumeFraction * reference)
        return std::nullopt;

    const core::f64 ratio = historicalRebuildRatio(sessions, gap.lastBefore, options);

    Constraint c;
    c.type                  = ConstraintType::kReturningFromLayoff;
    c.origin                = ConstraintOrigin::kInferred;
    c.detectedAt            = gap.resumedAt;
    c.severity              = std::clamp(static_cast<core::f64>(gap.days) / kSeverityScaleDays, kMinSeverity, 1.0);
    c.estimatedExpiry       = expiryFrom(gap.resumedAt, gap.days, ratio);
    c.referenceWeeklyVolume = reference;

    if (today >= c.estimatedExpiry || sustainedRecovery(runs, gap.resumedAt, today, reference, options))
    {
        core::Log::info(kTag, std::format("layoff of {} days ending {} has expired",
                                          gap.days, core::toString(gap.resumedAt)));
        return std::nullopt;
    }
    return c;
}

} // namespace

std::string_view constraintTypeName(ConstraintType type) noexcept
{
    switch (type)
    {
        case ConstraintType::kReturningFromLayoff: return "returning_from_layoff";
        case ConstraintType::kInjury:              return "injury";
    }
    return "unknown";
}

core::f64 historicalRebuildRatio(
    std::span<const session::Session> sessions,
    core::Date before,
    const ConstraintOptions &options)
{
    const auto runs = runsUntil(sessions, before);
    std::vector<core::f64> ratios;

    for (const auto &gap : findGaps(runs, options.minGapDays))
    {
        const core::f64 reference = referenceVolume(runs, gap.lastBefore);
        if (reference <= 0.0)
            continue;

        for (core::Date day = gap.resumedAt; day <= before; day = core::addDays(day, 1))
        {
            if (distanceBetween(runs, core::addDays(day, -(core::kDaysPerWeek - 1)), day)
                >= options.recoverFraction * reference)
            {
                const core::f64 rebuild = static_cast<core::f64>(core::daysBetween(gap.resumedAt, day) + 1);
                ratios.push_back(std::clamp(rebuild / static_cast<core::f64>(gap.days), kMinRebuildRatio, kMaxRebuildRatio));
                break;
            }
        }
    }

    if (ratios.empty())
        return options.defaultRebuildRatio;

    core::f64 sum = 0.0;
    for (core::f64 r : ratios)
        sum += r;
    return sum / static_cast<core::f64>(ratios.size());
}

ConstraintResolution detectConstraint(
    std::span<const session::Session> sessions,
    core::Date today,
    std::span<const ConstraintSignal> signals,
    const ConstraintOptions &options)
{
    ConstraintResolution out;
    const auto runs = runsUntil(sessions, today);

    std::vector<std::pair<core::Date, Constraint>> explicitActive;
    for (const auto &signal : signals)
    {
        if (signal.reportedAt > today)
            continue;
        if (signal.resolvedAt && *signal.resolvedAt < signal.reportedAt)
        {
            out.diagnostics.push_back({core::ErrorCode::kInvalidConstraintState,
                                       std::format("signal reported {} resolves before it starts",
                                                   core::toString(signal.reportedAt))});
            continue;
        }

        const core::Date end    = signal.resolvedAt.value_or(today);
        const core::i32  layoff = std::max(1, core::daysBetween(signal.reportedAt, end));
        const core::f64  ratio  = historicalRebuildRatio(sessions, signal.reportedAt, options);

        Constraint c;
        c.type                  = signal.type;
        c.origin                = ConstraintOrigin::kExplicit;
        c.detectedAt            = signal.reportedAt;
        c.severity              = std::clamp(signal.severity, 0.0, 1.0);
        c.estimatedExpiry       = signal.expectedReturn.value_or(expiryFrom(end, layoff, ratio));
        c.referenceWeeklyVolume = referenceVolume(runs, core::addDays(signal.reportedAt, -1));

        if (signal.resolvedAt)
        {
            if (today >= c.estimatedExpiry)
                continue;
            if (c.referenceWeeklyVolume > 0.0
                && sustainedRecovery(runs, *signal.resolvedAt, today, c.referenceWeeklyVolume, options))
                continue;
        }
        else
        {
            c.estimatedExpiry = std::max(c.estimatedExpiry, core::addDays(today, 1));
        }
        explicitActive.emplace_back(signal.reportedAt, c);
    }

    auto inferred = inferConstraint(sessions, runs, today, options);

    if (explicitActive.empty())
    {
        out.active = std::move(inferred);
    }
    else
    {
        std::stable_sort(explicitActive.begin(), explicitActive.end(),
                         [](const auto &a, const auto &b) { return a.first > b.first; });
        out.active = explicitActive.front().second;

        if (explicitActive.size() > 1)
            out.diagnostics.push_back({core::ErrorCode::kInvalidConstraintState,
                                       std::format("{} overlapping explicit signals; using the one reported {}",
                                                   explicitActive.size(), core::toString(explicitActive.front().first))});
        if (inferred)
            out.diagnostics.push_back({core::ErrorCode::kInvalidConstraintState,
                                       std::format("inferred layoff from {} overridden by explicit signal",
                                                   core::toString(inferred->detectedAt))});
    }

    for (const auto &d : out.diagnostics)
        core::Log::warn(kTag, d.message);
    if (out.active)
        core::Log::info(kTag, std::format("active {} ({}), severity {:.2f}, expires {}",
                                          constraintTypeName(out.active->type),
                                          out.active->origin == ConstraintOrigin::kExplicit ? "explicit" : "inferred",
                                          out.active->severity, core::toString(out.active->estimatedExpiry)));
    return out;
}

} // namespace tpo::bank
