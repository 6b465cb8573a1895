/**
 * @file PlanSynthesizer.cpp
 * @brief Plan synthesis and the relaxation ladder.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/plan/PlanSynthesizer.hpp>

#include <tpo/core/Constants.hpp>
#include <tpo/core/Log.hpp>
#include <tpo/plan/Paces.hpp>
#include <tpo/plan/WeekRules.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace tpo::plan {

namespace {

using phase::PhaseLabel;

constexpr core::f64 kMinSeverity       = 0.05;
constexpr core::f64 kWarmupM           = 3'000.0;
constexpr core::f64 kGoalPaceSessionShare = 0.12;
constexpr core::f64 kGoalPaceLongShare = 0.5;  ///< Of the long run.
constexpr core::f64 kLongRunDurationMargin = 0.98;

constexpr core::u32 kLongDay     = 6;
constexpr core::u32 kFirstHard   = 1;
constexpr core::u32 kSecondHard  = 3;

constexpr std::array<std::string_view, kRetryLevels> kLevelNames{
    "rules as configured", "one quality session per week", "no marathon-pace long runs",
    "volume ceiling reduced by 10%"};

core::f64 floor100(core::f64 metres) noexcept { return std::floor(metres / 100.0) * 100.0; }
core::f64 round100(core::f64 metres) noexcept { return std::round(metres / 100.0) * 100.0; }

/// Weekday indices (Monday = 0) a runner training @p days days uses.
std::vector<core::u32> dayPattern(core::u32 days)
{
    switch (days)
    {
    case 3: return {1, 3, 6};
    case 4: return {1, 3, 5, 6};
    case 5: return {1, 2, 3, 5, 6};
    case 6: return {1, 2, 3, 4, 5, 6};
    default: return {0, 1, 2, 3, 4, 5, 6};
    }
}

bool isProgressionPhase(PhaseLabel label) noexcept
{
    return label == PhaseLabel::kBase || label == PhaseLabel::kBuild || label == PhaseLabel::kPeak;
}

/// Everything that stays fixed across ladder steps.
struct SynthesisContext {
    const PlanRequest              &request;
    const RuleSet                  &rules;
    const bank::FitnessBank        &bank;
    std::optional<bank::Constraint> constraint;
    std::span<const PhaseLabel>     phases;
    core::Date                      planStart;
    core::f64                       vdot{0.0};
    TrainingPaces                   paces;
    bool                            higherRisk{false};
};

Workout makeWorkout(const SynthesisContext &ctx, core::u32 weekIndex, core::Date date, WorkoutType type,
                    core::f64 distanceM, core::f64 workM)
{
    Workout w;
    w.id              = std::format("w{:02}d{}", weekIndex, core::weekdayIndex(date));
    w.date            = date;
    w.type            = type;
    w.targetDistanceM = distanceM;
    w.workDistanceM   = workM;
    w.targetDurationS = workoutDuration(w, ctx.paces);
    return w;
}

/// Lays out the workouts of one week totalling @p volume.
void fillWeek(const SynthesisContext &ctx, const SynthesisRelaxation &relax, Week &week, core::f64 volume,
              bool workoutLong)
{
    const RuleSet &rules  = ctx.rules;
    const auto &phaseRule = rules.forPhase(week.label);

    std::vector<core::u32> days = dayPattern(ctx.request.daysPerWeek);

    if (week.label == PhaseLabel::kRace)
    {
        const core::u32 raceDay = core::weekdayIndex(ctx.request.raceDate);
        std::erase(days, raceDay);
        Workout race = makeWorkout(ctx, week.index, ctx.request.raceDate, WorkoutType::kRace,
                                   ctx.request.raceDistanceM, ctx.request.raceDistanceM);
        race.id = std::format("w{:02}race", week.index);
        week.workouts.push_back(race);

        if (!days.empty())
        {
            const core::f64 each = floor100(volume / static_cast<core::f64>(days.size()));
            for (core::usize i = 0; i < days.size(); ++i)
            {
                const core::f64 distance =
                    i + 1 == days.size() ? volume - each * static_cast<core::f64>(days.size() - 1) : each;
                const core::Date date = core::addDays(week.weekStart, static_cast<core::i32>(days[i]));
                const WorkoutType type = date > ctx.request.raceDate ? WorkoutType::kRecovery : WorkoutType::kEasy;
                week.workouts.push_back(makeWorkout(ctx, week.index, date, type, distance, 0.0));
            }
        }
        std::ranges::sort(week.workouts, {}, &Workout::date);
        return;
    }

    core::u32 quality = phaseRule.maxQualitySessions;
    if (relax.maxQualitySessions)
        quality = std::min(quality, *relax.maxQualitySessions);
    if (week.cutback || workoutLong)
        quality = std::min<core::u32>(quality, 1);

    // Long run.
    core::f64 longRun = std::min(rules.longRunShareCap * volume,
                                 rules.longRunDurationCapS * ctx.paces.easy * kLongRunDurationMargin);
    if (week.longRunCeilingM > 0.0)
        longRun = std::min(longRun, week.longRunCeilingM);
    longRun = floor100(longRun);

    core::f64 longWork = 0.0;
    if (workoutLong)
        longWork = floor100(std::min({rules.goalPaceShareCap * volume, rules.goalPaceDistanceCapM,
                                      kGoalPaceLongShare * longRun}));

    // Quality sessions.
    struct Planned {
        core::u32   day;
        WorkoutType type;
        core::f64   distance;
        core::f64   work;
    };
    std::vector<Planned> hard;
    const bool marathonFocus = ctx.request.raceDistanceM >= model::kHalfMarathonM;
    for (core::u32 q = 0; q < quality; ++q)
    {
        WorkoutType type = WorkoutType::kThreshold;
        if (week.label == PhaseLabel::kBuild && q == 1)
            type = WorkoutType::kInterval;
        if (week.label == PhaseLabel::kPeak)
            type = q == 0 ? WorkoutType::kInterval : (marathonFocus ? WorkoutType::kMarathonPace : WorkoutType::kThreshold);

        const core::f64 work = type == WorkoutType::kMarathonPace
            ? floor100(std::min({kGoalPaceSessionShare * volume, rules.goalPaceShareCap * volume,
                                 rules.goalPaceDistanceCapM}))
            : floor100(rules.qualitySessionShareCap * volume);
        hard.push_back({q == 0 ? kFirstHard : kSecondHard, type, work + kWarmupM, work});
    }

    core::f64 remainder = volume - longRun;
    for (const auto &h : hard)
        remainder -= h.distance;
    if (remainder < 0.0)
    {
        for (auto &h : hard)
        {
            remainder += h.distance - h.work;
            h.distance = h.work;
        }
        remainder = std::max(remainder, 0.0);
    }

    std::vector<core::u32> easyDays;
    for (core::u32 d : days)
    {
        const bool taken = d == kLongDay || std::ranges::any_of(hard, [d](const Planned &h) { return h.day == d; });
        if (!taken)
            easyDays.push_back(d);
    }

    if (easyDays.empty() && !hard.empty())
    {
        const core::f64 extra = floor100(remainder / static_cast<core::f64>(hard.size()));
        for (core::usize i = 0; i < hard.size(); ++i)
            hard[i].distance += i + 1 == hard.size() ? remainder - extra * static_cast<core::f64>(hard.size() - 1) : extra;
        remainder = 0.0;
    }

    week.workouts.push_back(makeWorkout(ctx, week.index, core::addDays(week.weekStart, kLongDay), WorkoutType::kLong,
                                        longRun, longWork));
    for (const auto &h : hard)
        week.workouts.push_back(makeWorkout(ctx, week.index, core::addDays(week.weekStart, static_cast<core::i32>(h.day)),
                                            h.type, h.distance, h.work));

    if (!easyDays.empty())
    {
        const WorkoutType easyType =
            week.label == PhaseLabel::kRecovery ? WorkoutType::kRecovery : WorkoutType::kEasy;
        const core::f64 each = floor100(remainder / static_cast<core::f64>(easyDays.size()));
        for (core::usize i = 0; i < easyDays.size(); ++i)
        {
            const core::f64 distance =
                i + 1 == easyDays.size() ? remainder - each * static_cast<core::f64>(easyDays.size() - 1) : each;
            week.workouts.push_back(makeWorkout(ctx, week.index,
                                                core::addDays(week.weekStart, static_cast<core::i32>(easyDays[i])),
                                                easyType, distance, 0.0));
        }
    }
    std::ranges::sort(week.workouts, {}, &Workout::date);
}

/// Builds every week for one ladder step; reports the first rejection.
core::Expected<Plan> buildPlan(const SynthesisContext &ctx, core::u32 level)
{
    const SynthesisRelaxation relax = relaxationForLevel(level);
    const RuleSet &rules            = ctx.rules;
    const TierVolume tier           = tierVolume(ctx.request.volumeTier);
    const WeekRuleChain chain       = WeekRuleChain::standard(rules);

    const core::f64 tierMaxM  = tier.maxKm * 1000.0;
    const core::f64 tierPeakM = tier.peakKm * 1000.0;
    const core::f64 target    = std::max(tierMaxM, std::min(ctx.bank.sustainableWeeklyVolume(), tierPeakM)) *
                                relax.volumeScale;
    core::f64 progression = ctx.bank.currentWeeklyVolume > 0.0 ? ctx.bank.currentWeeklyVolume : tier.minKm * 1000.0;
    progression           = std::min(progression * relax.volumeScale, target);

    core::f64 constraintPeak = 0.0;
    core::f64 longRunPeak    = 0.0;
    if (ctx.constraint)
    {
        constraintPeak = ctx.bank.peakWeeklyVolume.confirmed ? ctx.bank.peakWeeklyVolume.value
                                                             : ctx.bank.sustainableWeeklyVolume();
        if (constraintPeak <= 0.0)
            constraintPeak = ctx.constraint->referenceWeeklyVolume;
        longRunPeak = ctx.bank.peakLongRun.value;
    }

    Plan plan;
    plan.athleteId      = ctx.request.athleteId;
    plan.ruleSetVersion = rules.version;
    plan.retryLevel     = level;
    plan.raceDate       = ctx.request.raceDate;
    plan.raceDistanceM  = ctx.request.raceDistanceM;
    plan.vdot           = ctx.vdot;

    const core::u32 cadence = ctx.higherRisk ? rules.higherRiskCutbackEvery : rules.cutbackEvery;
    const auto taperCount   = static_cast<core::u32>(std::ranges::count(ctx.phases, PhaseLabel::kTaper));
    core::u32 taperSeen     = 0;
    core::u32 structureTurn = 0;

    for (core::u32 i = 0; i < ctx.phases.size(); ++i)
    {
        Week week;
        week.index     = i;
        week.weekStart = core::addDays(ctx.planStart, static_cast<core::i32>(i) * core::kDaysPerWeek);
        week.label     = ctx.phases[i];

        const bool progressing = isProgressionPhase(week.label);
        week.cutback           = progressing && i > 0 && (i + 1) % cadence == 0;
        if (progressing && i > 0 && !week.cutback)
            progression = std::min(target, progression * (1.0 + rules.maxWeeklyIncrease));

        core::f64 factor = rules.forPhase(week.label).volumeFactor;
        if (week.label == PhaseLabel::kTaper)
        {
            const core::f64 start = rules.forPhase(PhaseLabel::kTaper).volumeFactor;
            factor = taperCount > 1 ? start + (rules.taperEndFactor - start) * static_cast<core::f64>(taperSeen) /
                                                  static_cast<core::f64>(taperCount - 1)
                                    : start;
            ++taperSeen;
        }
        if (week.cutback)
            factor *= rules.cutbackFactor;

        core::f64 volume  = progression * factor;
        core::f64 ceiling = progression * (1.0 + rules.maxWeeklyIncrease);
        if (ctx.constraint)
        {
            const core::f64 ramp = constraintRampFactor(*ctx.constraint, ctx.planStart, i);
            const core::f64 cap  = constraintPeak * ramp * relax.volumeScale;
            volume               = std::min(volume, cap);
            ceiling              = std::min(ceiling, cap);
            if (longRunPeak > 0.0)
                week.longRunCeilingM = longRunPeak * ramp;
        }
        volume              = round100(volume);
        week.volumeCeilingM = std::max(ceiling, volume);

        const bool workoutLong = relax.allowGoalPaceLongRuns && !week.cutback &&
                                 (week.label == PhaseLabel::kBuild || week.label == PhaseLabel::kPeak) &&
                                 ctx.request.raceDistanceM >= model::kHalfMarathonM && (structureTurn++ % 2 == 1);

        fillWeek(ctx, relax, week, volume, workoutLong);

        WeekEvaluation evaluation = chain.evaluate(week);
        if (evaluation.verdict == RuleVerdict::kReject)
            return core::makeError(core::ErrorCode::kRuleViolation,
                                   std::format("week {} ({}): {}", i, phase::phaseLabelName(week.label),
                                               evaluation.notes.back()));
        week.riskNotes = std::move(evaluation.notes);
        plan.weeks.push_back(std::move(week));
    }
    return plan;
}

} // namespace

SynthesisRelaxation relaxationForLevel(core::u32 level) noexcept
{
    SynthesisRelaxation relax;
    if (level >= 1)
        relax.maxQualitySessions = 1;
    if (level >= 2)
        relax.allowGoalPaceLongRuns = false;
    if (level >= 3)
        relax.volumeScale = 0.9;
    return relax;
}

core::f64 constraintRampFactor(const bank::Constraint &constraint, core::Date planStart, core::u32 weekIndex) noexcept
{
    const core::i32 daysLeft = core::daysBetween(planStart, constraint.estimatedExpiry);
    if (daysLeft <= 0)
        return 1.0;

    const core::f64 severity   = std::clamp(constraint.severity, kMinSeverity, 1.0);
    const core::f64 start      = 1.0 - 0.6 * severity;
    const core::f64 rampWeeks  = std::max(1.0, std::ceil(static_cast<core::f64>(daysLeft) / core::kDaysPerWeek));
    const core::f64 progress   = std::min(1.0, static_cast<core::f64>(weekIndex) / rampWeeks);
    return start + (1.0 - start) * progress;
}

bool isHigherRisk(bool constraintActive, core::u32 age, session::VolumeTier tier, const RuleSet &rules) noexcept
{
    return constraintActive || age >= rules.higherRiskAge || tier == session::VolumeTier::kBuilder;
}

core::Expected<Plan> synthesizePlan(const model::ResponseModel &model, const bank::FitnessBank &bank,
                                    const std::optional<bank::Constraint> &constraint,
                                    std::span<const phase::PhaseLabel> phases, const PlanRequest &request,
                                    const RuleSet &rules)
{
    if (phases.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "plan needs at least one week");
    if (request.daysPerWeek < 3 || request.daysPerWeek > 7)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("days per week must be 3..7, got {}", request.daysPerWeek));
    if (request.raceDistanceM <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "race distance must be positive");
    TPO_TRY_VOID(rules.validate());

    const core::Date planStart = core::weekStart(request.startDate);
    const auto raceIt          = std::ranges::find(phases, PhaseLabel::kRace);
    if (raceIt != phases.end())
    {
        const auto raceIndex       = static_cast<core::i32>(raceIt - phases.begin());
        const core::Date raceWeek  = core::addDays(planStart, raceIndex * core::kDaysPerWeek);
        if (core::weekStart(request.raceDate) != raceWeek)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("race date {} is not in plan week {} ({})",
                                               core::toString(request.raceDate), raceIndex, core::toString(raceWeek)));
    }

    SynthesisContext ctx{request, rules, bank, std::nullopt, phases, planStart};
    if (constraint && planStart < constraint->estimatedExpiry)
        ctx.constraint = constraint;
    ctx.vdot       = std::clamp(bank.bestRaceVdot.value_or(model.baseline), model::kVdotMin, model::kVdotMax);
    ctx.paces      = TrainingPaces::fromVdot(ctx.vdot);
    ctx.higherRisk = isHigherRisk(ctx.constraint.has_value(), request.age, request.volumeTier, rules);

    std::string lastFailure;
    for (core::u32 level = 0; level < kRetryLevels; ++level)
    {
        auto plan = buildPlan(ctx, level);
        if (plan)
        {
            core::Log::info("PlanSynthesizer",
                            std::format("athlete {}: {} weeks synthesised with {}", request.athleteId,
                                        plan->weeks.size(), kLevelNames[level]));
            return plan;
        }
        lastFailure = plan.error().message();
        core::Log::info("PlanSynthesizer", std::format("athlete {}: {} rejected ({}); retrying", request.athleteId,
                                                       kLevelNames[level], lastFailure));
    }

    core::Log::warn("PlanSynthesizer", std::format("athlete {}: no rule-compliant plan", request.athleteId));
    return core::makeError(core::ErrorCode::kRuleViolation,
                           std::format("no rule-compliant plan after {} relaxations: {}", kRetryLevels, lastFailure));
}

} // namespace tpo::plan
