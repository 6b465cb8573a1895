/**
 * @file Detectors.cpp
 * @brief Insight detectors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/insight/Detectors.hpp>

#include <tpo/core/Constants.hpp>
#include <tpo/math/Statistics.hpp>
#include <tpo/model/Vdot.hpp>
#include <tpo/session/DailyLoadSeries.hpp>
#include <tpo/session/WeeklyAggregate.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <map>

namespace tpo::insight {

namespace {

constexpr core::f64 kDefaultMaxHeartRate = 185.0;
constexpr core::f64 kEasyHeartRateShare  = 0.75;
constexpr core::f64 kMinEasyRunM         = 3000.0;
constexpr core::usize kMinEasyRuns       = 4;
constexpr core::i32 kRecentDays          = 7;
constexpr core::i32 kBaselineDays        = 42;
constexpr core::i32 kCorrelationDays     = 90;
constexpr core::usize kMinCorrelationPairs = 10;
constexpr core::f64 kIndividualTauShare  = 0.25;
constexpr core::u32 kSkippedQualityLimit = 3;
constexpr core::usize kPlanLookbackWeeks = 4;

/// Speed per heartbeat; empty without a usable heart rate.
std::optional<core::f64> efficiency(const session::Session &s)
{
    if (s.type == session::SessionType::kRace || !s.avgHeartRate || *s.avgHeartRate <= 0.0)
        return std::nullopt;
    const core::f64 speed = s.speed();
    if (speed <= 0.0)
        return std::nullopt;
    return speed / *s.avgHeartRate;
}

core::i32 ageOf(core::Date date, core::Date today) { return core::daysBetween(date, today); }

bool isCompleteWeek(core::Date weekStart, core::Date today)
{
    return core::addDays(weekStart, core::kDaysPerWeek) <= today;
}

} // namespace

std::vector<PlanWeekDelta> planDeltas(std::span<const plan::Plan> history, std::span<const session::Session> sessions,
                                      core::Date today)
{
    std::map<core::Date, PlanWeekDelta> byWeek;

    for (const auto &plan : history)
    {
        for (const auto &week : plan.weeks)
        {
            if (!isCompleteWeek(week.weekStart, today))
                continue;

            PlanWeekDelta delta;
            delta.weekStart = week.weekStart;
            delta.plannedM  = week.volume();

            for (const auto &w : week.workouts)
            {
                if (!plan::isQuality(w.type))
                    continue;
                ++delta.plannedQuality;

                const bool ranQuality = std::ranges::any_of(sessions, [&](const session::Session &s) {
                    return s.date == w.date && session::isQuality(s.type);
                });
                if (w.status == plan::WorkoutStatus::kSkipped || (w.status == plan::WorkoutStatus::kPlanned && !ranQuality))
                    ++delta.skippedQuality;
            }
            byWeek[week.weekStart] = delta;
        }
    }

    for (auto &[start, delta] : byWeek)
    {
        const core::Date end = core::addDays(start, core::kDaysPerWeek);
        for (const auto &s : sessions)
        {
            if (s.date >= start && s.date < end && s.type != session::SessionType::kRace)
                delta.completedM += s.distanceM;
        }
    }

    std::vector<PlanWeekDelta> out;
    out.reserve(byWeek.size());
    for (auto &[start, delta] : byWeek)
        out.push_back(delta);
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// EfficiencyTrendDetector
// ─────────────────────────────────────────────────────────────────────────────

EfficiencyTrendDetector::EfficiencyTrendDetector(core::f64 minChange) : _minChange{minChange} {}

const char *EfficiencyTrendDetector::name() const noexcept { return "EfficiencyTrendDetector"; }

std::vector<Insight> EfficiencyTrendDetector::detect(const InsightContext &context) const
{
    std::vector<core::f64> recent;
    std::vector<core::f64> older;
    core::Date last{};

    for (const auto &s : context.sessions)
    {
        const auto ef = efficiency(s);
        const core::i32 age = ageOf(s.date, context.today);
        if (!ef || age < 0)
            continue;
        if (age < kRecentDays)
        {
            recent.push_back(*ef);
            last = std::max(last, s.date);
        }
        else if (age < kBaselineDays)
        {
            older.push_back(*ef);
        }
    }

    if (recent.size() < 2 || older.size() < 3)
        return {};

    const core::f64 recentMean = math::Statistics::mean(recent);
    const core::f64 olderMean  = math::Statistics::mean(older);
    if (olderMean <= 0.0)
        return {};

    const core::f64 change = (recentMean - olderMean) / olderMean;
    if (std::abs(change) < _minChange)
        return {};

    const bool improving = change > 0.0;
    const auto agreeing = std::ranges::count_if(recent, [&](core::f64 ef) {
        return improving ? ef > olderMean : ef < olderMean;
    });

    Insight insight;
    insight.type        = InsightType::kTrend;
    insight.title       = improving ? "Running efficiency is improving" : "Running efficiency is slipping";
    insight.detail      = std::format("Speed per heartbeat over the last week is {:+.1f}% against the previous five weeks.",
                                      change * 100.0);
    insight.evidence    = {
        {"recent efficiency", recentMean, last},
        {"baseline efficiency", olderMean, std::nullopt},
        {"change", change, std::nullopt},
    };
    insight.signature   = makeSignature(InsightType::kTrend, improving ? "efficiency_up" : "efficiency_down");
    insight.rawScore    = improving ? score::kHigh : score::kMedium;
    insight.sampleSize  = recent.size() + older.size();
    insight.consistency = static_cast<core::f64>(agreeing) / static_cast<core::f64>(recent.size());
    insight.observedAt  = last;
    return {insight};
}

// ─────────────────────────────────────────────────────────────────────────────
// BreakthroughDetector
// ─────────────────────────────────────────────────────────────────────────────

BreakthroughDetector::BreakthroughDetector(core::f64 minVdotGain) : _minVdotGain{minVdotGain} {}

const char *BreakthroughDetector::name() const noexcept { return "BreakthroughDetector"; }

std::vector<Insight> BreakthroughDetector::detect(const InsightContext &context) const
{
    std::vector<Insight> out;

    std::vector<session::RaceResult> races(context.races.begin(), context.races.end());
    std::ranges::sort(races, {}, &session::RaceResult::date);

    std::optional<core::f64> best;
    std::optional<Insight> latest;
    core::usize valid = 0;
    for (const auto &race : races)
    {
        if (race.date > context.today)
            continue;
        const auto vdot = model::vdotFromRace(race.distanceM, race.timeS);
        if (!vdot)
            continue;
        ++valid;

        if (best && *vdot >= *best + _minVdotGain)
        {
            Insight insight;
            insight.type        = InsightType::kBreakthrough;
            insight.title       = "New race-based fitness high";
            insight.detail      = std::format("The race on {} puts VDOT at {:.1f}, up {:.1f} on the previous best.",
                                              core::toString(race.date), *vdot, *vdot - *best);
            insight.evidence    = {{"race vdot", *vdot, race.date}, {"previous best", *best, std::nullopt}};
            insight.signature   = makeSignature(InsightType::kBreakthrough, std::format("race:{}", core::toString(race.date)));
            insight.rawScore    = score::kHigh;
            insight.consistency = 1.0;
            insight.observedAt  = race.date;
            latest              = std::move(insight);
        }
        best = best ? std::max(*best, *vdot) : *vdot;
    }
    if (latest)
    {
        latest->sampleSize = valid;
        out.push_back(std::move(*latest));
    }

    const auto weeks = session::aggregateWeeks(context.sessions, context.today);
    auto current = std::ranges::find_if(weeks.rbegin(), weeks.rend(), [](const session::WeeklyAggregate &w) {
        return w.sessionCount > 0;
    });
    if (current == weeks.rend() || core::daysBetween(current->weekStart, context.today) >= 2 * core::kDaysPerWeek)
        return out;

    const auto earlier = std::span<const session::WeeklyAggregate>(weeks).first(
        static_cast<core::usize>(std::distance(current, weeks.rend()) - 1));
    if (earlier.size() < kPlanLookbackWeeks)
        return out;

    core::f64 peakVolume  = 0.0;
    core::f64 peakLongRun = 0.0;
    for (const auto &w : earlier)
    {
        peakVolume  = std::max(peakVolume, w.distanceM);
        peakLongRun = std::max(peakLongRun, w.longestRunM);
    }

    auto peakInsight = [&](std::string_view key, std::string title, core::f64 value, core::f64 previous) {
        Insight insight;
        insight.type        = InsightType::kBreakthrough;
        insight.title       = std::move(title);
        insight.detail      = std::format("{:.1f} km against a previous best of {:.1f} km.", value / 1000.0,
                                          previous / 1000.0);
        insight.evidence    = {{"this week", value, current->weekStart}, {"previous best", previous, std::nullopt}};
        insight.signature   = makeSignature(InsightType::kBreakthrough,
                                            std::format("{}:{}", key, core::toString(current->weekStart)));
        insight.rawScore    = score::kLow;
        insight.sampleSize  = earlier.size() + 1;
        insight.consistency = 1.0;
        insight.observedAt  = current->weekStart;
        out.push_back(std::move(insight));
    };

    if (peakVolume > 0.0 && current->distanceM > peakVolume)
        peakInsight("peak_volume", "Highest weekly volume so far", current->distanceM, peakVolume);
    if (peakLongRun > 0.0 && current->longestRunM > peakLongRun)
        peakInsight("peak_long_run", "Longest run so far", current->longestRunM, peakLongRun);
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// FatigueDetector
// ─────────────────────────────────────────────────────────────────────────────

FatigueDetector::FatigueDetector(core::f64 maxLoadRatio) : _maxLoadRatio{maxLoadRatio} {}

const char *FatigueDetector::name() const noexcept { return "FatigueDetector"; }

std::vector<Insight> FatigueDetector::detect(const InsightContext &context) const
{
    std::vector<Insight> out;

    // Last five runs with heart rate, oldest first.
    std::vector<std::pair<core::Date, core::f64>> runs;
    for (auto it = context.sessions.rbegin(); it != context.sessions.rend() && runs.size() < 5; ++it)
    {
        const core::i32 age = ageOf(it->date, context.today);
        if (age < 0)
            continue;
        if (age >= 2 * core::kDaysPerWeek)
            break;
        if (const auto ef = efficiency(*it))
            runs.emplace_back(it->date, *ef);
    }
    std::ranges::reverse(runs);

    if (runs.size() >= 3)
    {
        core::usize declines = 0;
        for (core::usize i = 1; i < runs.size(); ++i)
        {
            if (runs[i].second < runs[i - 1].second)
                ++declines;
        }
        const core::f64 share = static_cast<core::f64>(declines) / static_cast<core::f64>(runs.size() - 1);
        const core::f64 drop  = (runs.front().second - runs.back().second) / runs.front().second;

        if (share >= 0.75 && drop >= 0.03)
        {
            Insight insight;
            insight.type        = InsightType::kFatigueWarning;
            insight.title       = "Efficiency is falling run after run";
            insight.detail      = std::format("Speed per heartbeat dropped {:.1f}% across your last {} runs.",
                                              drop * 100.0, runs.size());
            insight.evidence    = {{"first efficiency", runs.front().second, runs.front().first},
                                   {"last efficiency", runs.back().second, runs.back().first}};
            insight.signature   = makeSignature(InsightType::kFatigueWarning, "efficiency_decline");
            insight.rawScore    = score::kHigh;
            insight.sampleSize  = runs.size();
            insight.consistency = share;
            insight.observedAt  = runs.back().first;
            out.push_back(std::move(insight));
        }
    }

    const auto series = session::DailyLoadSeries::fromSessions(context.sessions, context.today);
    if (series.size() < static_cast<core::usize>(core::kTrailingLoadDays))
        return out;

    const core::f64 acute   = series.trailingMean(context.today, kRecentDays);
    const core::f64 chronic = series.trailingMean(context.today, core::kTrailingLoadDays);
    if (chronic <= 0.0)
        return out;

    const core::f64 ratio = acute / chronic;
    if (ratio < _maxLoadRatio)
        return out;

    core::usize heavyDays = 0;
    core::usize trainingDays = 0;
    for (core::i32 i = 0; i < kRecentDays; ++i)
    {
        const core::f64 load = series.loadOn(core::addDays(context.today, -i));
        if (load > 0.0)
            ++trainingDays;
        if (load > chronic)
            ++heavyDays;
    }
    const auto monthSessions = std::ranges::count_if(context.sessions, [&](const session::Session &s) {
        const core::i32 age = ageOf(s.date, context.today);
        return age >= 0 && age < core::kTrailingLoadDays;
    });

    Insight insight;
    insight.type        = InsightType::kFatigueWarning;
    insight.title       = "This week's load is well above your usual";
    insight.detail      = std::format("The last seven days averaged {:.2f}x your four-week load.", ratio);
    insight.evidence    = {{"acute load", acute, context.today}, {"chronic load", chronic, std::nullopt},
                           {"ratio", ratio, std::nullopt}};
    insight.signature   = makeSignature(InsightType::kFatigueWarning, "load_ratio");
    insight.rawScore    = score::kHigh;
    insight.sampleSize  = static_cast<core::usize>(monthSessions);
    insight.consistency = trainingDays > 0 ? static_cast<core::f64>(heavyDays) / static_cast<core::f64>(trainingDays) : 0.0;
    insight.observedAt  = context.today;
    out.push_back(std::move(insight));
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// PatternDetector
// ─────────────────────────────────────────────────────────────────────────────

PatternDetector::PatternDetector(core::f64 minCorrelation, core::i32 maxLagDays)
    : _minCorrelation{minCorrelation}, _maxLagDays{maxLagDays}
{
}

const char *PatternDetector::name() const noexcept { return "PatternDetector"; }

std::vector<Insight> PatternDetector::detect(const InsightContext &context) const
{
    std::vector<Insight> out;

    // Easy runs that drift above the aerobic ceiling.
    const core::f64 ceiling = kEasyHeartRateShare * context.athlete.maxHeartRate.value_or(kDefaultMaxHeartRate);
    core::usize easyRuns = 0;
    core::usize tooHard  = 0;
    core::Date  lastHard{};
    for (const auto &s : context.sessions)
    {
        const core::i32 age = ageOf(s.date, context.today);
        if (age < 0 || age >= kBaselineDays || !s.avgHeartRate || s.distanceM <= kMinEasyRunM)
            continue;
        if (s.type != session::SessionType::kEasy && s.type != session::SessionType::kRecovery)
            continue;
        ++easyRuns;
        if (*s.avgHeartRate > ceiling)
        {
            ++tooHard;
            lastHard = std::max(lastHard, s.date);
        }
    }
    if (easyRuns >= kMinEasyRuns)
    {
        const core::f64 share = static_cast<core::f64>(tooHard) / static_cast<core::f64>(easyRuns);
        if (share >= 0.5)
        {
            Insight insight;
            insight.type        = InsightType::kPattern;
            insight.title       = "Easy runs are drifting too hard";
            insight.detail      = std::format("{} of your last {} easy runs averaged above {:.0f} bpm.", tooHard,
                                              easyRuns, ceiling);
            insight.evidence    = {{"easy runs", static_cast<core::f64>(easyRuns), std::nullopt},
                                   {"above ceiling", static_cast<core::f64>(tooHard), lastHard},
                                   {"heart rate ceiling", ceiling, std::nullopt}};
            insight.signature   = makeSignature(InsightType::kPattern, "easy_too_hard");
            insight.rawScore    = score::kMedium;
            insight.sampleSize  = easyRuns;
            insight.consistency = share;
            insight.observedAt  = lastHard;
            out.push_back(std::move(insight));
        }
    }

    // Load on one day against efficiency some days later.
    std::map<core::Date, std::vector<core::f64>> efByDay;
    for (const auto &s : context.sessions)
    {
        const core::i32 age = ageOf(s.date, context.today);
        if (age < 0 || age >= kCorrelationDays)
            continue;
        if (const auto ef = efficiency(s))
            efByDay[s.date].push_back(*ef);
    }
    const auto series = session::DailyLoadSeries::fromSessions(context.sessions, context.today);

    std::optional<math::Correlation> strongest;
    core::i32 strongestLag = 0;
    for (core::i32 lag = 1; lag <= _maxLagDays && !series.empty(); ++lag)
    {
        std::vector<core::f64> loads;
        std::vector<core::f64> effs;
        for (const auto &[day, values] : efByDay)
        {
            const core::Date loadDay = core::addDays(day, -lag);
            if (loadDay < series.start())
                continue;
            loads.push_back(series.loadOn(loadDay));
            effs.push_back(math::Statistics::mean(values));
        }
        if (loads.size() < kMinCorrelationPairs)
            continue;

        const auto corr = math::Statistics::pearson(loads, effs);
        if (!corr)
            continue;
        if (!strongest || std::abs(corr->r) > std::abs(strongest->r))
        {
            strongest    = *corr;
            strongestLag = lag;
        }
    }
    if (strongest && std::abs(strongest->r) >= _minCorrelation)
    {
        const bool helps = strongest->r > 0.0;
        Insight insight;
        insight.type        = InsightType::kPattern;
        insight.title       = helps ? "Harder days are followed by better runs" : "Harder days are followed by worse runs";
        insight.detail      = std::format("Daily load correlates with efficiency {} days later (r = {:.2f}, n = {}).",
                                          strongestLag, strongest->r, strongest->n);
        insight.evidence    = {{"correlation", strongest->r, std::nullopt},
                               {"lag days", static_cast<core::f64>(strongestLag), std::nullopt},
                               {"p value", strongest->pValue, std::nullopt}};
        insight.signature   = makeSignature(InsightType::kPattern, "load_efficiency");
        insight.rawScore    = score::kMedium;
        insight.sampleSize  = strongest->n;
        insight.consistency = std::abs(strongest->r);
        insight.observedAt  = efByDay.rbegin()->first;
        out.push_back(std::move(insight));
    }

    // Individual fitness decay against the population default.
    const model::ResponseModel *m = context.model;
    if (m != nullptr && m->source != model::ModelSource::kPopulationDefault
        && m->confidence >= core::ConfidenceLabel::kModerate)
    {
        const core::f64 deviation = (m->tau1 - core::kPopulationTau1) / core::kPopulationTau1;
        if (std::abs(deviation) >= kIndividualTauShare)
        {
            const bool fast = deviation < 0.0;
            Insight insight;
            insight.type        = InsightType::kPattern;
            insight.title       = fast ? "Fitness comes and goes quickly for you"
                                       : "Fitness builds and fades slowly for you";
            insight.detail      = std::format("Your fitness time constant is {:.0f} days against a typical {:.0f}.",
                                              m->tau1, core::kPopulationTau1);
            insight.evidence    = {{"tau1", m->tau1, std::nullopt}, {"population tau1", core::kPopulationTau1, std::nullopt}};
            insight.signature   = makeSignature(InsightType::kPattern, fast ? "response_fast" : "response_slow");
            insight.rawScore    = score::kLow;
            insight.sampleSize  = m->observationCount;
            insight.consistency = m->confidence == core::ConfidenceLabel::kHigh ? 1.0 : 0.7;
            insight.observedAt  = context.today;
            out.push_back(std::move(insight));
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// InjuryRiskDetector
// ─────────────────────────────────────────────────────────────────────────────

InjuryRiskDetector::InjuryRiskDetector(core::f64 maxWeeklyJump, core::f64 maxPlanOvershoot)
    : _maxWeeklyJump{maxWeeklyJump}, _maxPlanOvershoot{maxPlanOvershoot}
{
}

const char *InjuryRiskDetector::name() const noexcept { return "InjuryRiskDetector"; }

std::vector<Insight> InjuryRiskDetector::detect(const InsightContext &context) const
{
    std::vector<Insight> out;

    auto weeks = session::aggregateWeeks(context.sessions, context.today);
    std::erase_if(weeks, [&](const session::WeeklyAggregate &w) { return !isCompleteWeek(w.weekStart, context.today); });
    if (weeks.size() >= 2)
    {
        const auto &last = weeks.back();
        const auto &prev = weeks[weeks.size() - 2];
        if (prev.distanceM > 0.0)
        {
            const core::f64 jump = (last.distanceM - prev.distanceM) / prev.distanceM;
            if (jump >= _maxWeeklyJump)
            {
                const auto activeWeeks = std::ranges::count_if(weeks, [](const session::WeeklyAggregate &w) {
                    return w.distanceM > 0.0;
                });
                Insight insight;
                insight.type        = InsightType::kInjuryRisk;
                insight.title       = "Weekly volume jumped sharply";
                insight.detail      = std::format("Last week was {:.1f} km, {:.0f}% above the week before.",
                                                  last.distanceM / 1000.0, jump * 100.0);
                insight.evidence    = {{"week volume", last.distanceM, last.weekStart},
                                       {"previous week", prev.distanceM, prev.weekStart},
                                       {"increase", jump, std::nullopt}};
                insight.signature   = makeSignature(InsightType::kInjuryRisk,
                                                    std::format("volume_jump:{}", core::toString(last.weekStart)));
                insight.rawScore    = score::kCritical;
                insight.sampleSize  = static_cast<core::usize>(activeWeeks);
                insight.consistency = 1.0;
                insight.observedAt  = last.weekStart;
                out.push_back(std::move(insight));
            }
        }
    }

    if (context.planWeeks.empty())
        return out;

    const auto recent = context.planWeeks.last(std::min(kPlanLookbackWeeks, context.planWeeks.size()));
    const auto &latest = recent.back();

    if (latest.plannedM > 0.0 && latest.completedM >= _maxPlanOvershoot * latest.plannedM)
    {
        const auto over = std::ranges::count_if(recent, [](const PlanWeekDelta &d) {
            return d.plannedM > 0.0 && d.completedM > d.plannedM;
        });
        const core::f64 ratio = latest.completedM / latest.plannedM;
        Insight insight;
        insight.type        = InsightType::kInjuryRisk;
        insight.title       = "You ran well beyond the plan";
        insight.detail      = std::format("Completed {:.1f} km against {:.1f} km planned ({:.0f}%).",
                                          latest.completedM / 1000.0, latest.plannedM / 1000.0, ratio * 100.0);
        insight.evidence    = {{"completed", latest.completedM, latest.weekStart},
                               {"planned", latest.plannedM, latest.weekStart}};
        insight.signature   = makeSignature(InsightType::kInjuryRisk,
                                            std::format("plan_overshoot:{}", core::toString(latest.weekStart)));
        insight.rawScore    = score::kCritical;
        insight.sampleSize  = context.planWeeks.size();
        insight.consistency = static_cast<core::f64>(over) / static_cast<core::f64>(recent.size());
        insight.observedAt  = latest.weekStart;
        out.push_back(std::move(insight));
    }

    core::u32 planned = 0;
    core::u32 skipped = 0;
    for (const auto &d : recent)
    {
        planned += d.plannedQuality;
        skipped += d.skippedQuality;
    }
    if (skipped >= kSkippedQualityLimit && planned > 0)
    {
        Insight insight;
        insight.type        = InsightType::kInjuryRisk;
        insight.title       = "Key sessions keep getting skipped";
        insight.detail      = std::format("{} of {} quality sessions in the last {} weeks were missed.", skipped,
                                          planned, recent.size());
        insight.evidence    = {{"skipped quality", static_cast<core::f64>(skipped), latest.weekStart},
                               {"planned quality", static_cast<core::f64>(planned), std::nullopt}};
        insight.signature   = makeSignature(InsightType::kInjuryRisk, "skipped_quality");
        insight.rawScore    = score::kMedium;
        insight.sampleSize  = planned;
        insight.consistency = static_cast<core::f64>(skipped) / static_cast<core::f64>(planned);
        insight.observedAt  = latest.weekStart;
        out.push_back(std::move(insight));
    }
    return out;
}

} // namespace tpo::insight
