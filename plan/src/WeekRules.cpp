/**
 * @file WeekRules.cpp
 * @brief WeekRuleChain and built-in rules implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tpo/plan/WeekRules.hpp>
#include <tpo/core/Log.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>

namespace tpo::plan {

namespace {

/// Metres of slack absorbing rounding to the nearest 100 m.
constexpr core::f64 kToleranceM = 1.0;

bool counts(const Workout &w) noexcept
{
    return w.status != WorkoutStatus::kSkipped && w.type != WorkoutType::kRace;
}

core::f64 km(core::f64 metres) noexcept { return metres / 1000.0; }

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// WeekRuleChain
// ─────────────────────────────────────────────────────────────────────────────

WeekRuleChain::WeekRuleChain() = default;
WeekRuleChain::~WeekRuleChain() = default;
WeekRuleChain::WeekRuleChain(WeekRuleChain &&) noexcept = default;
WeekRuleChain &WeekRuleChain::operator=(WeekRuleChain &&) noexcept = default;

void WeekRuleChain::addRule(std::unique_ptr<IWeekRule> rule)
{
    _rules.push_back(std::move(rule));
}

WeekEvaluation WeekRuleChain::evaluate(const Week &week) const
{
    WeekEvaluation result;

    for (const auto &rule : _rules)
    {
        RuleFinding finding = rule->evaluate(week);

        if (finding.verdict == RuleVerdict::kReject)
        {
            core::Log::debug("WeekRules", std::format("week {}: rejected by {}: {}", week.index, rule->name(),
                                                      finding.note));
            result.verdict    = RuleVerdict::kReject;
            result.rejectedBy = rule->name();
            result.notes.push_back(std::move(finding.note));
            return result;
        }

        if (finding.verdict == RuleVerdict::kWarn)
        {
            result.verdict = RuleVerdict::kWarn;
            result.notes.push_back(std::move(finding.note));
        }
    }

    return result;
}

core::usize WeekRuleChain::ruleCount() const noexcept
{
    return _rules.size();
}

WeekRuleChain WeekRuleChain::standard(const RuleSet &rules)
{
    WeekRuleChain chain;
    chain.addRule(std::make_unique<QualityCountRule>(rules));
    chain.addRule(std::make_unique<HardStackingRule>());
    chain.addRule(std::make_unique<EasyShareRule>(rules));
    chain.addRule(std::make_unique<IntensityCapRule>(rules));
    chain.addRule(std::make_unique<LongRunCapRule>(rules));
    chain.addRule(std::make_unique<VolumeCeilingRule>());
    chain.addRule(std::make_unique<BackToBackHardRule>());
    chain.addRule(std::make_unique<LongestRunRule>());
    return chain;
}

// ─────────────────────────────────────────────────────────────────────────────
// EasyShareRule
// ─────────────────────────────────────────────────────────────────────────────

EasyShareRule::EasyShareRule(const RuleSet &rules)
    : _rules{rules} {}

RuleFinding EasyShareRule::evaluate(const Week &week) const
{
    const core::f64 volume = week.volume();
    if (volume <= 0.0)
        return {};

    core::f64 work = 0.0;
    for (const auto &w : week.workouts)
        if (counts(w))
            work += w.workDistanceM;

    const core::f64 share   = (volume - work) / volume;
    const core::f64 minimum = _rules.forPhase(week.label).minEasyShare;
    if (share + kToleranceM / volume < minimum)
        return {RuleVerdict::kReject,
                std::format("easy running is {:.0f}% of the week, below the {:.0f}% a {} week needs", share * 100.0,
                            minimum * 100.0, phase::phaseLabelName(week.label))};
    return {};
}

const char *EasyShareRule::name() const noexcept
{
    return "EasyShareRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// QualityCountRule
// ─────────────────────────────────────────────────────────────────────────────

QualityCountRule::QualityCountRule(const RuleSet &rules)
    : _rules{rules} {}

RuleFinding QualityCountRule::evaluate(const Week &week) const
{
    const core::u32 count   = week.qualityCount();
    const core::u32 maximum = _rules.forPhase(week.label).maxQualitySessions;
    if (count > maximum)
        return {RuleVerdict::kReject, std::format("{} quality sessions exceed the {} allowed in a {} week", count,
                                                  maximum, phase::phaseLabelName(week.label))};
    return {};
}

const char *QualityCountRule::name() const noexcept
{
    return "QualityCountRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// IntensityCapRule
// ─────────────────────────────────────────────────────────────────────────────

IntensityCapRule::IntensityCapRule(const RuleSet &rules)
    : _rules{rules} {}

RuleFinding IntensityCapRule::evaluate(const Week &week) const
{
    const core::f64 volume = week.volume();
    if (volume <= 0.0)
        return {};

    const core::f64 qualityCap  = _rules.qualitySessionShareCap * volume;
    const core::f64 goalPaceCap = std::min(_rules.goalPaceShareCap * volume, _rules.goalPaceDistanceCapM);

    for (const auto &w : week.workouts)
    {
        if (!counts(w))
            continue;
        if ((w.type == WorkoutType::kThreshold || w.type == WorkoutType::kInterval) &&
            w.workDistanceM > qualityCap + kToleranceM)
            return {RuleVerdict::kReject, std::format("{} work of {:.1f} km exceeds {:.1f} km", workoutTypeName(w.type),
                                                      km(w.workDistanceM), km(qualityCap))};
        if ((w.type == WorkoutType::kMarathonPace || w.type == WorkoutType::kLong) &&
            w.workDistanceM > goalPaceCap + kToleranceM)
            return {RuleVerdict::kReject, std::format("marathon-pace work of {:.1f} km exceeds {:.1f} km",
                                                      km(w.workDistanceM), km(goalPaceCap))};
    }
    return {};
}

const char *IntensityCapRule::name() const noexcept
{
    return "IntensityCapRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// LongRunCapRule
// ─────────────────────────────────────────────────────────────────────────────

LongRunCapRule::LongRunCapRule(const RuleSet &rules)
    : _rules{rules} {}

RuleFinding LongRunCapRule::evaluate(const Week &week) const
{
    const Workout *longRun = week.longRun();
    if (!longRun)
        return {};

    const core::f64 shareCap = _rules.longRunShareCap * week.volume();
    if (longRun->targetDistanceM > shareCap + kToleranceM)
        return {RuleVerdict::kReject, std::format("long run of {:.1f} km exceeds {:.0f}% of the week ({:.1f} km)",
                                                  km(longRun->targetDistanceM), _rules.longRunShareCap * 100.0,
                                                  km(shareCap))};
    if (longRun->targetDurationS > _rules.longRunDurationCapS + 1.0)
        return {RuleVerdict::kReject, std::format("long run of {:.0f} min exceeds {:.0f} min",
                                                  longRun->targetDurationS / 60.0, _rules.longRunDurationCapS / 60.0)};
    if (week.longRunCeilingM > 0.0 && longRun->targetDistanceM > week.longRunCeilingM + kToleranceM)
        return {RuleVerdict::kReject, std::format("long run of {:.1f} km exceeds the {:.1f} km ceiling",
                                                  km(longRun->targetDistanceM), km(week.longRunCeilingM))};
    return {};
}

const char *LongRunCapRule::name() const noexcept
{
    return "LongRunCapRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// HardStackingRule
// ─────────────────────────────────────────────────────────────────────────────

RuleFinding HardStackingRule::evaluate(const Week &week) const
{
    const Workout *longRun = week.longRun();
    if (longRun && longRun->isWorkoutLong() && week.qualityCount() > 1)
        return {RuleVerdict::kReject, "a marathon-pace long run is stacked with more than one quality session"};
    return {};
}

const char *HardStackingRule::name() const noexcept
{
    return "HardStackingRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// VolumeCeilingRule
// ─────────────────────────────────────────────────────────────────────────────

RuleFinding VolumeCeilingRule::evaluate(const Week &week) const
{
    const core::f64 volume = week.volume();
    if (week.volumeCeilingM > 0.0 && volume > week.volumeCeilingM + kToleranceM)
        return {RuleVerdict::kReject, std::format("weekly volume of {:.1f} km exceeds the {:.1f} km ceiling",
                                                  km(volume), km(week.volumeCeilingM))};
    return {};
}

const char *VolumeCeilingRule::name() const noexcept
{
    return "VolumeCeilingRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// BackToBackHardRule
// ─────────────────────────────────────────────────────────────────────────────

RuleFinding BackToBackHardRule::evaluate(const Week &week) const
{
    for (core::usize i = 0; i < week.workouts.size(); ++i)
    {
        if (!week.workouts[i].isHard())
            continue;
        for (core::usize j = i + 1; j < week.workouts.size(); ++j)
        {
            if (!week.workouts[j].isHard())
                continue;
            if (std::abs(core::daysBetween(week.workouts[i].date, week.workouts[j].date)) <= 1)
                return {RuleVerdict::kWarn, std::format("this stacks two hard sessions within 48h ({} on {}, {} on {})",
                                                        workoutTypeName(week.workouts[i].type),
                                                        core::toString(week.workouts[i].date),
                                                        workoutTypeName(week.workouts[j].type),
                                                        core::toString(week.workouts[j].date))};
        }
    }
    return {};
}

const char *BackToBackHardRule::name() const noexcept
{
    return "BackToBackHardRule";
}

// ─────────────────────────────────────────────────────────────────────────────
// LongestRunRule
// ─────────────────────────────────────────────────────────────────────────────

RuleFinding LongestRunRule::evaluate(const Week &week) const
{
    const Workout *longRun = week.longRun();
    if (!longRun)
        return {};

    for (const auto &w : week.workouts)
    {
        if (!counts(w) || w.type == WorkoutType::kLong)
            continue;
        if (w.targetDistanceM > longRun->targetDistanceM + kToleranceM)
            return {RuleVerdict::kWarn, std::format("the {} run on {} is longer than the long run",
                                                    workoutTypeName(w.type), core::toString(w.date))};
    }
    return {};
}

const char *LongestRunRule::name() const noexcept
{
    return "LongestRunRule";
}

} // namespace tpo::plan
