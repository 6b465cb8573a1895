/**
 * @file PhaseDetector.cpp
 * @brief Phase labelling state machine and forward phase layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/phase/PhaseDetector.hpp>

#include <tpo/core/Constants.hpp>

#include <algorithm>
#include <cmath>

namespace tpo::phase {

namespace {

constexpr core::f64 kForcedConfidence     = 1.0;
constexpr core::f64 kTransitionConfidence = 0.8;
constexpr core::f64 kStableConfidence     = 0.7;
constexpr core::f64 kInheritedConfidence  = 0.5;
constexpr core::usize kReferenceWeeks     = 4;

/// nullopt when no threshold is crossed.
std::optional<PhaseLabel> trendCandidate(const session::WeeklyAggregate &week, core::f64 maxVolume,
                                         core::f64 maxLongRun, const PhaseOptions &options)
{
    if (week.distanceM <= 0.0)
        return std::nullopt;

    const core::f64 share = week.qualityShare();
    if (week.qualityCount == 0 && share < options.buildQualityShare)
        return PhaseLabel::kBase;
    if (share >= options.peakQualityShare && week.distanceM >= options.peakFraction * maxVolume &&
        week.longestRunM >= options.peakFraction * maxLongRun)
        return PhaseLabel::kPeak;
    if (share >= options.buildQualityShare)
        return PhaseLabel::kBuild;
    return std::nullopt;
}

/// Highest weekly volume over the weeks preceding @p raceIndex.
core::f64 preRaceReference(std::span<const session::WeeklyAggregate> weeks, core::usize raceIndex)
{
    const core::usize first = raceIndex > kReferenceWeeks ? raceIndex - kReferenceWeeks : 0;
    core::f64 reference = 0.0;
    for (core::usize i = first; i < raceIndex; ++i)
        reference = std::max(reference, weeks[i].distanceM);
    return reference;
}

} // namespace

std::string_view phaseLabelName(PhaseLabel label) noexcept
{
    switch (label)
    {
    case PhaseLabel::kBase: return "base";
    case PhaseLabel::kBuild: return "build";
    case PhaseLabel::kPeak: return "peak";
    case PhaseLabel::kTaper: return "taper";
    case PhaseLabel::kRace: return "race";
    case PhaseLabel::kRecovery: return "recovery";
    }
    return "unknown";
}

std::vector<WeekPhase> labelWeeks(std::span<const session::WeeklyAggregate> weeks,
                                  std::optional<core::Date> raceDate,
                                  std::span<const PhaseOverride> overrides, const PhaseOptions &options)
{
    std::vector<WeekPhase> out;
    out.reserve(weeks.size());

    const std::optional<core::Date> raceWeek =
        raceDate ? std::optional<core::Date>{core::weekStart(*raceDate)} : std::nullopt;

    core::f64 maxVolume  = 0.0;
    core::f64 maxLongRun = 0.0;
    std::optional<PhaseLabel> current;
    std::optional<PhaseLabel> pending;
    core::u32 streak = 0;
    std::optional<core::f64> recoveryReference;

    for (core::usize i = 0; i < weeks.size(); ++i)
    {
        const auto &week = weeks[i];
        maxVolume  = std::max(maxVolume, week.distanceM);
        maxLongRun = std::max(maxLongRun, week.longestRunM);

        WeekPhase labelled{};
        labelled.weekIndex = static_cast<core::u32>(i);
        labelled.weekStart = week.weekStart;

        const bool declaredRace = raceWeek && week.weekStart == *raceWeek;
        const core::i32 weeksBefore =
            raceWeek ? core::daysBetween(week.weekStart, *raceWeek) / core::kDaysPerWeek : -1;

        bool reset = true;
        if (declaredRace)
        {
            labelled.label      = PhaseLabel::kRace;
            labelled.basis      = WeekPhase::Basis::kForced;
            labelled.confidence = kForcedConfidence;
        }
        else if (weeksBefore > 0 && static_cast<core::u32>(weeksBefore) <= options.taperWeeks)
        {
            labelled.label      = PhaseLabel::kTaper;
            labelled.basis      = WeekPhase::Basis::kForced;
            labelled.confidence = kForcedConfidence;
        }
        else if (recoveryReference && week.distanceM < options.recoveryFraction * *recoveryReference)
        {
            labelled.label      = PhaseLabel::kRecovery;
            labelled.basis      = WeekPhase::Basis::kTransition;
            labelled.confidence = kTransitionConfidence;
        }
        else
        {
            reset = false;
            const auto candidate = trendCandidate(week, maxVolume, maxLongRun, options);
            if (!current)
            {
                current             = candidate.value_or(PhaseLabel::kBase);
                labelled.label      = *current;
                labelled.basis      = candidate ? WeekPhase::Basis::kDetected : WeekPhase::Basis::kInherited;
                labelled.confidence = candidate ? kStableConfidence : kInheritedConfidence;
            }
            else if (!candidate)
            {
                pending.reset();
                streak              = 0;
                labelled.label      = *current;
                labelled.basis      = WeekPhase::Basis::kInherited;
                labelled.confidence = kInheritedConfidence;
            }
            else if (*candidate == *current)
            {
                pending.reset();
                streak              = 0;
                labelled.label      = *current;
                labelled.basis      = WeekPhase::Basis::kDetected;
                labelled.confidence = kStableConfidence;
            }
            else
            {
                streak  = (pending == candidate) ? streak + 1 : 1;
                pending = candidate;
                if (streak >= options.sustainWeeks)
                {
                    current = *candidate;
                    pending.reset();
                    streak              = 0;
                    labelled.label      = *current;
                    labelled.basis      = WeekPhase::Basis::kTransition;
                    labelled.confidence = kTransitionConfidence;
                }
                else
                {
                    labelled.label      = *current;
                    labelled.basis      = WeekPhase::Basis::kInherited;
                    labelled.confidence = kInheritedConfidence;
                }
            }
        }

        if (reset)
        {
            current.reset();
            pending.reset();
            streak = 0;
        }

        if (week.hasRace || declaredRace)
        {
            const core::f64 reference = preRaceReference(weeks, i);
            recoveryReference = reference > 0.0 ? std::optional<core::f64>{reference} : std::nullopt;
        }
        else if (labelled.label != PhaseLabel::kRecovery)
        {
            recoveryReference.reset();
        }

        out.push_back(labelled);
    }

    for (const auto &o : overrides)
    {
        const core::Date target = core::weekStart(o.weekStart);
        for (auto &labelled : out)
        {
            if (labelled.weekStart != target)
                continue;
            labelled.label      = o.label;
            labelled.basis      = WeekPhase::Basis::kOverride;
            labelled.confidence = kForcedConfidence;
        }
    }
    return out;
}

std::vector<Phase> groupPhases(std::span<const WeekPhase> weeks)
{
    std::vector<Phase> phases;
    core::f64 confidenceSum = 0.0;

    for (const auto &week : weeks)
    {
        if (!phases.empty() && phases.back().label == week.label)
        {
            auto &phase   = phases.back();
            phase.lastWeek = week.weekIndex;
            phase.endDate  = core::addDays(week.weekStart, core::kDaysPerWeek - 1);
            confidenceSum += week.confidence;
            phase.detectionConfidence = confidenceSum / static_cast<core::f64>(phase.weekCount());
            continue;
        }
        Phase phase{};
        phase.label               = week.label;
        phase.firstWeek           = week.weekIndex;
        phase.lastWeek            = week.weekIndex;
        phase.startDate           = week.weekStart;
        phase.endDate             = core::addDays(week.weekStart, core::kDaysPerWeek - 1);
        phase.detectionConfidence = week.confidence;
        confidenceSum             = week.confidence;
        phases.push_back(phase);
    }
    return phases;
}

std::vector<Phase> detectPhases(std::span<const session::WeeklyAggregate> weeks,
                                std::optional<core::Date> raceDate,
                                std::span<const PhaseOverride> overrides, const PhaseOptions &options)
{
    const auto labelled = labelWeeks(weeks, raceDate, overrides, options);
    return groupPhases(labelled);
}

std::vector<PhaseLabel> planPhases(core::u32 weeksToRace, core::u32 taperWeeks, std::optional<PhaseLabel> current)
{
    std::vector<PhaseLabel> layout;
    if (weeksToRace == 0)
        return layout;

    layout.reserve(weeksToRace);
    const core::u32 taper     = std::min(taperWeeks, weeksToRace - 1);
    const core::u32 remaining = weeksToRace - 1 - taper;

    core::u32 base  = 0;
    core::u32 build = remaining;
    core::u32 peak  = 0;
    if (remaining > 2)
    {
        base  = static_cast<core::u32>(std::lround(0.30 * remaining));
        build = static_cast<core::u32>(std::lround(0.45 * remaining));
        peak  = remaining - base - build;
    }
    if (current == PhaseLabel::kBuild || current == PhaseLabel::kPeak)
    {
        build += base;
        base = 0;
    }

    layout.insert(layout.end(), base, PhaseLabel::kBase);
    layout.insert(layout.end(), build, PhaseLabel::kBuild);
    layout.insert(layout.end(), peak, PhaseLabel::kPeak);
    layout.insert(layout.end(), taper, PhaseLabel::kTaper);
    layout.push_back(PhaseLabel::kRace);
    return layout;
}

} // namespace tpo::phase
