/**
 * @file Proposal.cpp
 * @brief Change requests, diffs and their application.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/plan/Proposal.hpp>

#include <tpo/core/Log.hpp>
#include <tpo/plan/Paces.hpp>
#include <tpo/plan/WeekRules.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace tpo::plan {

namespace {

core::f64 floor100(core::f64 metres) noexcept { return std::floor(metres / 100.0) * 100.0; }

/// Work portion a workout of @p type prescribes in a week of @p weekVolume.
core::f64 workFor(WorkoutType type, core::f64 distanceM, core::f64 weekVolume, const RuleSet &rules)
{
    switch (type)
    {
    case WorkoutType::kThreshold:
    case WorkoutType::kInterval:
        return floor100(std::min(rules.qualitySessionShareCap * weekVolume, 0.5 * distanceM));
    case WorkoutType::kMarathonPace:
        return floor100(std::min({rules.goalPaceShareCap * weekVolume, rules.goalPaceDistanceCapM, 0.6 * distanceM}));
    default:
        return 0.0;
    }
}

Week *weekOf(Plan &plan, std::string_view id) noexcept
{
    for (auto &week : plan.weeks)
        for (const auto &w : week.workouts)
            if (w.id == id)
                return &week;
    return nullptr;
}

void insertSorted(Week &week, Workout workout)
{
    week.workouts.push_back(std::move(workout));
    std::ranges::stable_sort(week.workouts, {}, &Workout::date);
}

void eraseWorkout(Week &week, std::string_view id)
{
    std::erase_if(week.workouts, [id](const Workout &w) { return w.id == id; });
}

/// Moves workout @p id to @p date, possibly into another week.
core::ExpectedVoid moveWorkout(Plan &plan, std::string_view id, core::Date date)
{
    Week *from = weekOf(plan, id);
    Week *to   = plan.weekContaining(date);
    if (!from)
        return core::makeError(core::ErrorCode::kNotFound, std::format("workout {} not found", id));
    if (!to)
        return core::makeError(core::ErrorCode::kOutOfRange,
                               std::format("{} is outside the plan", core::toString(date)));

    Workout moved = *plan.findWorkout(id);
    moved.date    = date;
    moved.status  = WorkoutStatus::kModified;
    eraseWorkout(*from, id);
    insertSorted(*to, std::move(moved));
    return {};
}

core::Expected<Workout *> editable(Plan &plan, const core::WorkoutId &id)
{
    Workout *w = plan.findWorkout(id);
    if (!w)
        return core::makeError(core::ErrorCode::kNotFound, std::format("workout {} not found", id));
    if (w->type == WorkoutType::kRace)
        return core::makeError(core::ErrorCode::kInvalidArgument, "race workouts are fixed");
    return w;
}

} // namespace

std::string_view changeKindName(ChangeKind kind) noexcept
{
    switch (kind)
    {
    case ChangeKind::kSwapDays: return "swap_days";
    case ChangeKind::kSkip: return "skip";
    case ChangeKind::kRestore: return "restore";
    case ChangeKind::kAdjustLoad: return "adjust_load";
    case ChangeKind::kAddWorkout: return "add_workout";
    case ChangeKind::kReplaceType: return "replace_type";
    }
    return "unknown";
}

core::f64 loadAdjustmentFactor(LoadAdjustment adjustment) noexcept
{
    switch (adjustment)
    {
    case LoadAdjustment::kReduceLight: return 0.90;
    case LoadAdjustment::kReduceModerate: return 0.75;
    case LoadAdjustment::kIncreaseLight: return 1.10;
    }
    return 1.0;
}

std::string_view proposalStatusName(ProposalStatus status) noexcept
{
    switch (status)
    {
    case ProposalStatus::kProposed: return "proposed";
    case ProposalStatus::kConfirmed: return "confirmed";
    case ProposalStatus::kRejected: return "rejected";
    case ProposalStatus::kApplied: return "applied";
    case ProposalStatus::kFailed: return "failed";
    }
    return "unknown";
}

ChangeRequest ChangeRequest::swapDays(core::WorkoutId first, core::WorkoutId second)
{
    ChangeRequest r;
    r.kind           = ChangeKind::kSwapDays;
    r.workoutId      = std::move(first);
    r.otherWorkoutId = std::move(second);
    return r;
}

ChangeRequest ChangeRequest::skip(core::WorkoutId id)
{
    ChangeRequest r;
    r.kind      = ChangeKind::kSkip;
    r.workoutId = std::move(id);
    return r;
}

ChangeRequest ChangeRequest::restore(core::WorkoutId id)
{
    ChangeRequest r;
    r.kind      = ChangeKind::kRestore;
    r.workoutId = std::move(id);
    return r;
}

ChangeRequest ChangeRequest::adjustLoad(core::WorkoutId id, LoadAdjustment adjustment)
{
    ChangeRequest r;
    r.kind       = ChangeKind::kAdjustLoad;
    r.workoutId  = std::move(id);
    r.adjustment = adjustment;
    return r;
}

ChangeRequest ChangeRequest::addWorkout(core::Date date, WorkoutType type, core::f64 distanceM)
{
    ChangeRequest r;
    r.kind      = ChangeKind::kAddWorkout;
    r.date      = date;
    r.type      = type;
    r.distanceM = distanceM;
    return r;
}

ChangeRequest ChangeRequest::replaceType(core::WorkoutId id, WorkoutType type)
{
    ChangeRequest r;
    r.kind      = ChangeKind::kReplaceType;
    r.workoutId = std::move(id);
    r.type      = type;
    return r;
}

core::Expected<PlanProposal> proposeChange(const Plan &plan, const ChangeRequest &request, core::ProposalId id,
                                           const RuleSet &rules)
{
    Plan candidate             = plan;
    const TrainingPaces paces  = TrainingPaces::fromVdot(plan.vdot);
    std::vector<core::WorkoutId> touched;
    std::vector<std::string> notes;

    switch (request.kind)
    {
    case ChangeKind::kSwapDays: {
        if (request.workoutId == request.otherWorkoutId)
            return core::makeError(core::ErrorCode::kInvalidArgument, "cannot swap a workout with itself");
        const Workout first  = *TPO_TRY(editable(candidate, request.workoutId));
        const Workout second = *TPO_TRY(editable(candidate, request.otherWorkoutId));
        TPO_TRY_VOID(moveWorkout(candidate, first.id, second.date));
        TPO_TRY_VOID(moveWorkout(candidate, second.id, first.date));
        touched = {first.id, second.id};
        break;
    }
    case ChangeKind::kSkip: {
        Workout *w = TPO_TRY(editable(candidate, request.workoutId));
        if (w->status == WorkoutStatus::kSkipped)
            return core::makeError(core::ErrorCode::kInvalidState, std::format("workout {} is already skipped", w->id));
        w->status = WorkoutStatus::kSkipped;
        if (isQuality(w->type) || w->type == WorkoutType::kLong)
            notes.push_back(std::format("skipping the {} session on {} removes a key workout of the week",
                                        workoutTypeName(w->type), core::toString(w->date)));
        touched = {w->id};
        break;
    }
    case ChangeKind::kRestore: {
        Workout *w = TPO_TRY(editable(candidate, request.workoutId));
        if (w->status != WorkoutStatus::kSkipped)
            return core::makeError(core::ErrorCode::kInvalidState, std::format("workout {} is not skipped", w->id));
        w->status = WorkoutStatus::kPlanned;
        touched   = {w->id};
        break;
    }
    case ChangeKind::kAdjustLoad: {
        Workout *w = TPO_TRY(editable(candidate, request.workoutId));
        if (w->status == WorkoutStatus::kSkipped)
            return core::makeError(core::ErrorCode::kInvalidState, std::format("workout {} is skipped", w->id));
        const core::f64 factor = loadAdjustmentFactor(request.adjustment);
        w->targetDistanceM     = std::max(100.0, std::round(w->targetDistanceM * factor / 100.0) * 100.0);
        w->workDistanceM       = std::min(floor100(w->workDistanceM * factor), w->targetDistanceM);
        w->targetDurationS     = workoutDuration(*w, paces);
        w->status              = WorkoutStatus::kModified;
        touched                = {w->id};
        break;
    }
    case ChangeKind::kAddWorkout: {
        if (request.distanceM <= 0.0)
            return core::makeError(core::ErrorCode::kInvalidArgument, "added workout needs a positive distance");
        if (request.type == WorkoutType::kRace)
            return core::makeError(core::ErrorCode::kInvalidArgument, "races cannot be added to a plan");
        Week *week = candidate.weekContaining(request.date);
        if (!week)
            return core::makeError(core::ErrorCode::kOutOfRange,
                                   std::format("{} is outside the plan", core::toString(request.date)));

        Workout added;
        added.date            = request.date;
        added.type            = request.type;
        added.targetDistanceM = floor100(request.distanceM);
        added.workDistanceM   = workFor(request.type, added.targetDistanceM, week->volume(), rules);
        added.targetDurationS = workoutDuration(added, paces);
        const std::string stem = std::format("w{:02}d{}a", week->index, core::weekdayIndex(request.date));
        for (core::u32 n = 1;; ++n)
        {
            added.id = std::format("{}{}", stem, n);
            if (!candidate.findWorkout(added.id))
                break;
        }
        touched = {added.id};
        insertSorted(*week, std::move(added));
        break;
    }
    case ChangeKind::kReplaceType: {
        if (request.type == WorkoutType::kRace)
            return core::makeError(core::ErrorCode::kInvalidArgument, "a workout cannot become a race");
        Week *week = weekOf(candidate, request.workoutId);
        Workout *w = TPO_TRY(editable(candidate, request.workoutId));
        if (w->type == request.type)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("workout {} is already {}", w->id, workoutTypeName(w->type)));
        w->type            = request.type;
        w->workDistanceM   = workFor(request.type, w->targetDistanceM, week->volume(), rules);
        w->targetDurationS = workoutDuration(*w, paces);
        w->status          = WorkoutStatus::kModified;
        touched            = {w->id};
        break;
    }
    }

    PlanProposal proposal;
    proposal.id           = std::move(id);
    proposal.athleteId    = plan.athleteId;
    proposal.planRevision = plan.revision;
    proposal.request      = request;

    std::vector<core::u32> weeks;
    for (const auto &workoutId : touched)
    {
        std::optional<Workout> before;
        std::optional<Workout> after;
        if (const Workout *w = plan.findWorkout(workoutId))
        {
            before = *w;
            weeks.push_back(plan.weekContaining(w->date)->index);
        }
        if (const Workout *w = candidate.findWorkout(workoutId))
        {
            after = *w;
            weeks.push_back(candidate.weekContaining(w->date)->index);
        }
        if (before != after)
            proposal.diff.push_back({std::move(before), std::move(after)});
    }
    if (proposal.diff.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "the request changes nothing");

    std::ranges::sort(weeks);
    weeks.erase(std::unique(weeks.begin(), weeks.end()), weeks.end());

    // Lowering load never blocks the athlete: a share rule it trips is only noted.
    const bool reducesLoad = request.kind == ChangeKind::kSkip ||
                             (request.kind == ChangeKind::kAdjustLoad && loadAdjustmentFactor(request.adjustment) < 1.0);

    const WeekRuleChain chain = WeekRuleChain::standard(rules);
    for (core::u32 index : weeks)
    {
        const Week &changed    = candidate.weeks[index];
        WeekEvaluation result  = chain.evaluate(changed);
        if (result.verdict == RuleVerdict::kReject && reducesLoad)
        {
            result.notes.back() = std::format("after this change {}", result.notes.back());
        }
        else if (result.verdict == RuleVerdict::kReject)
        {
            core::Log::info("Proposal", std::format("{} on week {} rejected: {}", changeKindName(request.kind),
                                                           index, result.notes.back()));
            return core::makeError(core::ErrorCode::kRuleViolation,
                                   std::format("week {}: {}", index, result.notes.back()));
        }
        const WeekEvaluation original = chain.evaluate(plan.weeks[index]);
        for (auto &note : result.notes)
            if (std::ranges::find(original.notes, note) == original.notes.end())
                notes.push_back(std::move(note));

        if (index > 0)
        {
            const core::f64 previous = candidate.weeks[index - 1].volume();
            const core::f64 volume   = changed.volume();
            if (previous > 0.0 && volume > previous * (1.0 + rules.maxWeeklyIncrease) &&
                volume > plan.weeks[index].volume())
                notes.push_back(std::format("week {} volume rises {:.0f}% over the previous week", index,
                                            (volume / previous - 1.0) * 100.0));
        }
    }
    proposal.riskNotes = std::move(notes);
    return proposal;
}

core::Expected<core::u32> applyProposal(Plan &plan, const PlanProposal &proposal)
{
    if (plan.athleteId != proposal.athleteId)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("proposal {} belongs to athlete {}", proposal.id, proposal.athleteId));
    if (plan.revision != proposal.planRevision)
        return core::makeError(core::ErrorCode::kStalePlan,
                               std::format("proposal {} was computed against revision {}, plan is at {}", proposal.id,
                                           proposal.planRevision, plan.revision));

    Plan next = plan;
    for (const auto &change : proposal.diff)
    {
        if (change.before)
        {
            Week *week = weekOf(next, change.before->id);
            const Workout *current = next.findWorkout(change.before->id);
            if (!week || !current || *current != *change.before)
                return core::makeError(core::ErrorCode::kStalePlan,
                                       std::format("workout {} changed since the proposal", change.before->id));
            eraseWorkout(*week, change.before->id);
        }
        if (change.after)
        {
            if (!change.before && next.findWorkout(change.after->id))
                return core::makeError(core::ErrorCode::kAlreadyExists,
                                       std::format("workout {} already exists", change.after->id));
            Week *week = next.weekContaining(change.after->date);
            if (!week)
                return core::makeError(core::ErrorCode::kOutOfRange,
                                       std::format("{} is outside the plan", core::toString(change.after->date)));
            insertSorted(*week, *change.after);
        }
    }

    ++next.revision;
    plan = std::move(next);
    return static_cast<core::u32>(proposal.diff.size());
}

} // namespace tpo::plan
