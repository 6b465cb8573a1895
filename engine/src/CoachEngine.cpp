/**
 * @file CoachEngine.cpp
 * @brief Coaching façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/engine/CoachEngine.hpp>

#include <tpo/concurrency/AthleteLockTable.hpp>
#include <tpo/concurrency/ThreadPool.hpp>
#include <tpo/core/Log.hpp>
#include <tpo/insight/Detectors.hpp>
#include <tpo/insight/InsightEngine.hpp>
#include <tpo/insight/Narrator.hpp>
#include <tpo/model/Calibrator.hpp>
#include <tpo/model/TaperOptimizer.hpp>
#include <tpo/phase/PhaseDetector.hpp>
#include <tpo/plan/PlanSynthesizer.hpp>
#include <tpo/plan/Proposal.hpp>
#include <tpo/session/DailyLoadSeries.hpp>
#include <tpo/session/SessionHistory.hpp>
#include <tpo/session/TrainingLoad.hpp>
#include <tpo/session/WeeklyAggregate.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace tpo::engine {

namespace {

/// Everything the engine holds for one athlete. Guarded by the athlete's lock.
struct AthleteState {
    session::Athlete                    athlete;
    session::SessionHistory             history;
    std::vector<session::RaceResult>    races;
    std::vector<bank::ConstraintSignal> signals;
    std::vector<phase::PhaseOverride>   overrides;
    std::optional<model::ResponseModel> response;
    bool                                responseStale{false}; ///< New race evidence since calibration.
    std::optional<core::Date>           latestSession;
    std::optional<core::Date>           calibratedThrough;
    std::optional<bank::FitnessBank>    fitness;
    std::optional<plan::Plan>           activePlan;
    std::vector<plan::Plan>             planHistory;
    insight::FeedbackLog                feedback;
    core::u32                           proposalCounter{0};
};

template <typename T, typename F>
std::future<core::Expected<T>> submitTo(concurrency::ThreadPool *pool, F &&work)
{
    std::promise<core::Expected<T>> refused;
    if (pool == nullptr)
    {
        refused.set_value(core::makeError(core::ErrorCode::kInvalidState, "engine is not initialised"));
        return refused.get_future();
    }

    auto queued = pool->enqueue(std::forward<F>(work));
    if (!queued)
    {
        refused.set_value(std::unexpected(queued.error()));
        return refused.get_future();
    }
    return std::move(*queued);
}

} // namespace

struct CoachEngine::Impl
{
    Config config;

    std::unique_ptr<concurrency::ThreadPool> pool;
    concurrency::AthleteLockTable            locks;
    plan::ProposalBook                       proposals;
    insight::InsightEngine                   insights{insight::InsightEngine::standard()};
    insight::Narrator                        narrator;

    mutable std::mutex                                                  registryMutex;
    std::unordered_map<core::AthleteId, std::unique_ptr<AthleteState>> athletes;

    std::atomic<bool> initialised{false};

    explicit Impl(Config cfg)
        : config{std::move(cfg)}
    {
    }

    core::ExpectedVoid requireRunning() const
    {
        if (!initialised.load())
            return core::makeError(core::ErrorCode::kInvalidState, "engine is not initialised");
        return {};
    }

    core::Expected<AthleteState *> find(const core::AthleteId &athleteId) const
    {
        TPO_TRY_VOID(requireRunning());

        std::lock_guard<std::mutex> lock{registryMutex};
        const auto it = athletes.find(athleteId);
        if (it == athletes.end())
            return core::makeError(core::ErrorCode::kNotFound, std::format("unknown athlete '{}'", athleteId));
        return it->second.get();
    }

    core::Expected<model::ResponseModel> calibrate(AthleteState &state)
    {
        const auto sessions = state.history.resolved();

        model::CalibrationOptions options = config.calibration();
        options.previousVersion           = state.response ? state.response->version : 0;

        const auto fitted = TPO_TRY(model::calibrate(sessions, state.races, options));
        core::Log::info("CoachEngine", std::format("{}: model v{} ({}, {} races, confidence {})", state.athlete.id,
                                                   fitted.version, model::modelSourceName(fitted.source),
                                                   fitted.observationCount,
                                                   core::confidenceLabelName(fitted.confidence)));
        state.response          = fitted;
        state.responseStale     = false;
        state.calibratedThrough = state.latestSession;
        return fitted;
    }

    /// The stored model unless race evidence arrived or the cadence elapsed.
    core::Expected<model::ResponseModel> activeModel(AthleteState &state)
    {
        if (!state.response)
            return calibrate(state);

        if (state.responseStale)
        {
            core::Log::debug("CoachEngine", std::format("{}: recalibrating on new race evidence", state.athlete.id));
            return calibrate(state);
        }

        const bool cadenceDue =
            state.latestSession
            && (!state.calibratedThrough
                || core::daysBetween(*state.calibratedThrough, *state.latestSession) >= core::kRecalibrationCadenceDays);
        if (cadenceDue)
        {
            core::Log::debug("CoachEngine", std::format("{}: recalibrating on cadence", state.athlete.id));
            return calibrate(state);
        }
        return *state.response;
    }

    AthleteSnapshot analyse(AthleteState &state, std::span<const session::Session> sessions, core::Date today,
                            std::optional<core::Date> raceDate)
    {
        AthleteSnapshot snapshot;
        snapshot.constraint = bank::detectConstraint(sessions, today, state.signals, config.constraints());
        for (const auto &diagnostic : snapshot.constraint.diagnostics)
            core::Log::warn("CoachEngine", std::format("{}: {}", state.athlete.id, diagnostic.message));

        const auto fresh = bank::computeFitnessBank(sessions, today, state.races, config.fitnessBank());
        snapshot.fitness = state.fitness ? bank::mergeFitnessBank(*state.fitness, fresh,
                                                                  snapshot.constraint.active.has_value(),
                                                                  config.fitnessBank())
                                         : fresh;
        state.fitness = snapshot.fitness;

        const auto weeks = session::aggregateWeeks(sessions, today);
        snapshot.phases  = phase::detectPhases(weeks, raceDate, state.overrides, config.phases());
        return snapshot;
    }

    core::Expected<plan::Plan> synthesize(AthleteState &state, core::Date startDate, core::Date raceDate,
                                          core::f64 raceDistanceM)
    {
        if (raceDate < startDate)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("race {} is before the plan start {}", core::toString(raceDate),
                                               core::toString(startDate)));

        const auto sessions = state.history.resolved();
        const auto response = TPO_TRY(activeModel(state));
        const auto snapshot = analyse(state, sessions, startDate, std::nullopt);

        std::optional<phase::PhaseLabel> currentPhase;
        if (!snapshot.phases.empty())
            currentPhase = snapshot.phases.back().label;

        const auto weeksToRace = static_cast<core::u32>(
            core::daysBetween(core::weekStart(startDate), core::weekStart(raceDate)) / core::kDaysPerWeek + 1);
        const auto series = session::DailyLoadSeries::fromSessions(sessions);
        const auto taper  = model::optimalTaper(response, series, raceDate,
                                                std::min(config.maxTaperWeeks(), weeksToRace - 1));
        const auto layout = phase::planPhases(weeksToRace, taper.taperWeeks, currentPhase);

        plan::PlanRequest request;
        request.athleteId     = state.athlete.id;
        request.startDate     = startDate;
        request.raceDate      = raceDate;
        request.raceDistanceM = raceDistanceM;
        request.volumeTier    = state.athlete.volumeTier;
        request.daysPerWeek   = state.athlete.daysPerWeek;
        request.age           = state.athlete.age;

        auto built = TPO_TRY(plan::synthesizePlan(response, snapshot.fitness, snapshot.constraint.active, layout,
                                                  request, config.rules()));
        if (state.activePlan)
            built.revision = state.activePlan->revision + 1;

        core::Log::info("CoachEngine", std::format("{}: plan rev {} with {} weeks, {}-week taper", state.athlete.id,
                                                   built.revision, built.weeks.size(), taper.taperWeeks));
        state.activePlan = built;
        state.planHistory.push_back(built);
        return built;
    }

    std::vector<insight::Insight> insightFeed(AthleteState &state, core::Date today) const
    {
        const auto sessions = state.history.resolved();
        const auto deltas   = insight::planDeltas(state.planHistory, sessions, today);

        const insight::InsightContext context{
            state.athlete, sessions, state.races, deltas, state.response ? &*state.response : nullptr, today};
        return insights.generate(context, state.feedback, config.insights());
    }
};

CoachEngine::CoachEngine(Config config)
    : _impl{std::make_unique<Impl>(std::move(config))}
{
}

CoachEngine::~CoachEngine()
{
    if (_impl && _impl->initialised.load())
        shutdown();
}

core::ExpectedVoid CoachEngine::init()
{
    if (_impl->initialised.load())
        return core::makeError(core::ErrorCode::kInvalidState, "engine is already initialised");

    if (auto valid = _impl->config.validate(); !valid)
    {
        core::Log::error("CoachEngine", std::format("refusing to start: {}", valid.error().message()));
        return valid;
    }

    core::Log::setMinLevel(_impl->config.logLevel());
    _impl->pool = std::make_unique<concurrency::ThreadPool>(_impl->config.workerThreads());
    _impl->initialised.store(true);

    core::Log::info("CoachEngine", std::format("started with {} workers, rule set v{}", _impl->pool->threadCount(),
                                               _impl->config.rules().version));
    return {};
}

void CoachEngine::shutdown()
{
    if (!_impl->initialised.exchange(false))
        return;

    if (_impl->pool)
        _impl->pool->shutdown();
    core::Log::info("CoachEngine", "stopped");
}

bool CoachEngine::isInitialised() const noexcept { return _impl->initialised.load(); }

const Config &CoachEngine::config() const noexcept { return _impl->config; }

core::ExpectedVoid CoachEngine::registerAthlete(const session::Athlete &athlete)
{
    TPO_TRY_VOID(_impl->requireRunning());
    if (athlete.id.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "athlete id must not be empty");
    if (athlete.daysPerWeek < 3 || athlete.daysPerWeek > 7)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("{} training days per week is outside 3-7", athlete.daysPerWeek));
    if (athlete.maxHeartRate && athlete.restingHeartRate && *athlete.maxHeartRate <= *athlete.restingHeartRate)
        return core::makeError(core::ErrorCode::kInvalidArgument, "maximum heart rate must exceed resting heart rate");

    std::lock_guard<std::mutex> lock{_impl->registryMutex};
    if (_impl->athletes.contains(athlete.id))
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               std::format("athlete '{}' is already registered", athlete.id));

    auto state     = std::make_unique<AthleteState>();
    state->athlete = athlete;
    _impl->athletes.emplace(athlete.id, std::move(state));
    core::Log::debug("CoachEngine", std::format("registered {}", athlete.id));
    return {};
}

core::ExpectedVoid CoachEngine::recordSession(const core::AthleteId &athleteId, session::Session session)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);

    if (session.trainingLoad <= 0.0)
        session.trainingLoad = session::computeTrainingLoad(session, state->athlete);

    const core::Date date    = session.date;
    const bool       evidence = session.type == session::SessionType::kRace || session.supersedes.has_value();
    TPO_TRY_VOID(state->history.append(std::move(session)));

    state->latestSession = state->latestSession ? std::max(*state->latestSession, date) : date;
    if (evidence)
        state->responseStale = true;
    return {};
}

core::ExpectedVoid CoachEngine::recordRace(const core::AthleteId &athleteId, const session::RaceResult &race)
{
    if (race.distanceM <= 0.0 || race.timeS <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "race distance and time must be positive");

    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    state->races.push_back(race);
    state->responseStale = true;
    return {};
}

core::ExpectedVoid CoachEngine::reportConstraint(const core::AthleteId &athleteId,
                                                 const bank::ConstraintSignal &signal)
{
    if (signal.resolvedAt && *signal.resolvedAt < signal.reportedAt)
        return core::makeError(core::ErrorCode::kInvalidArgument, "constraint resolved before it was reported");

    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    state->signals.push_back(signal);
    core::Log::info("CoachEngine", std::format("{}: {} reported on {}", athleteId,
                                               bank::constraintTypeName(signal.type),
                                               core::toString(signal.reportedAt)));
    return {};
}

core::ExpectedVoid CoachEngine::overridePhase(const core::AthleteId &athleteId, const phase::PhaseOverride &override)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);

    const core::Date monday = core::weekStart(override.weekStart);
    std::erase_if(state->overrides, [&](const phase::PhaseOverride &o) { return o.weekStart == monday; });
    state->overrides.push_back({monday, override.label});
    return {};
}

core::Expected<model::ResponseModel> CoachEngine::calibrate(const core::AthleteId &athleteId)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    return _impl->calibrate(*state);
}

core::Expected<model::Prediction> CoachEngine::predict(const core::AthleteId &athleteId, core::Date targetDate,
                                                       core::f64 distanceM)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);

    const auto response = TPO_TRY(_impl->activeModel(*state));
    const auto sessions = state->history.resolved();
    const auto series   = session::DailyLoadSeries::fromSessions(sessions);
    return model::predict(response, series, targetDate, distanceM, model::PredictOptions{_impl->config.maxTaperWeeks()});
}

core::Expected<AthleteSnapshot> CoachEngine::analyse(const core::AthleteId &athleteId, core::Date today,
                                                     std::optional<core::Date> raceDate)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);

    const auto sessions = state->history.resolved();
    return _impl->analyse(*state, sessions, today, raceDate);
}

core::Expected<plan::Plan> CoachEngine::synthesizePlan(const core::AthleteId &athleteId, core::Date startDate,
                                                       core::Date raceDate, core::f64 raceDistanceM)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    return _impl->synthesize(*state, startDate, raceDate, raceDistanceM);
}

core::Expected<plan::Plan> CoachEngine::activePlan(const core::AthleteId &athleteId) const
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    if (!state->activePlan)
        return core::makeError(core::ErrorCode::kNotFound, std::format("{} has no active plan", athleteId));
    return *state->activePlan;
}

core::Expected<std::vector<insight::Insight>> CoachEngine::insights(const core::AthleteId &athleteId,
                                                                    core::Date today)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    return _impl->insightFeed(*state, today);
}

core::ExpectedVoid CoachEngine::recordFeedback(const core::AthleteId &athleteId, const std::string &signature,
                                               insight::FeedbackAction action, core::Date at)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    return state->feedback.record({athleteId, signature, action, at});
}

core::Expected<plan::PlanProposal> CoachEngine::proposeChange(const core::AthleteId &athleteId,
                                                              const plan::ChangeRequest &request)
{
    auto *state = TPO_TRY(_impl->find(athleteId));
    auto guard  = _impl->locks.lock(athleteId);
    if (!state->activePlan)
        return core::makeError(core::ErrorCode::kNotFound, std::format("{} has no active plan", athleteId));

    const core::ProposalId id = std::format("{}-p{}", athleteId, ++state->proposalCounter);
    auto proposal = TPO_TRY(plan::proposeChange(*state->activePlan, request, id, _impl->config.rules()));
    TPO_TRY_VOID(_impl->proposals.add(proposal));
    return proposal;
}

core::Expected<plan::ProposalOutcome> CoachEngine::confirm(const core::ProposalId &proposalId,
                                                           std::string_view idempotencyKey, core::Date appliedAt)
{
    TPO_TRY_VOID(_impl->requireRunning());
    const auto proposal = TPO_TRY(_impl->proposals.find(proposalId));
    auto *state         = TPO_TRY(_impl->find(proposal.athleteId));
    auto guard          = _impl->locks.lock(proposal.athleteId);
    if (!state->activePlan)
        return core::makeError(core::ErrorCode::kInvalidState,
                               std::format("{} has no active plan", proposal.athleteId));

    const core::u32 revision = state->activePlan->revision;
    auto outcome = TPO_TRY(_impl->proposals.confirm(proposalId, idempotencyKey, *state->activePlan, appliedAt));
    if (state->activePlan->revision != revision)
        state->planHistory.push_back(*state->activePlan);
    return outcome;
}

core::Expected<plan::ProposalOutcome> CoachEngine::reject(const core::ProposalId &proposalId, std::string reason)
{
    TPO_TRY_VOID(_impl->requireRunning());
    return _impl->proposals.reject(proposalId, std::move(reason));
}

core::Expected<plan::PlanProposal> CoachEngine::proposal(const core::ProposalId &proposalId) const
{
    TPO_TRY_VOID(_impl->requireRunning());
    return _impl->proposals.find(proposalId);
}

core::Expected<std::string> CoachEngine::explain(const insight::Insight &insight, std::stop_token stop) const
{
    TPO_TRY_VOID(_impl->requireRunning());
    return _impl->narrator.explain(insight, std::move(stop));
}

core::Expected<std::string> CoachEngine::explainProposal(const core::ProposalId &proposalId,
                                                         std::stop_token stop) const
{
    TPO_TRY_VOID(_impl->requireRunning());
    const auto proposal = TPO_TRY(_impl->proposals.find(proposalId));
    return _impl->narrator.explain(proposal, std::move(stop));
}

std::future<core::Expected<model::ResponseModel>> CoachEngine::submitCalibrate(core::AthleteId athleteId)
{
    return submitTo<model::ResponseModel>(_impl->pool.get(),
                                          [this, id = std::move(athleteId)] { return calibrate(id); });
}

std::future<core::Expected<model::Prediction>> CoachEngine::submitPredict(core::AthleteId athleteId,
                                                                          core::Date targetDate, core::f64 distanceM)
{
    return submitTo<model::Prediction>(_impl->pool.get(), [this, id = std::move(athleteId), targetDate, distanceM] {
        return predict(id, targetDate, distanceM);
    });
}

std::future<core::Expected<plan::Plan>> CoachEngine::submitSynthesizePlan(core::AthleteId athleteId,
                                                                          core::Date startDate, core::Date raceDate,
                                                                          core::f64 raceDistanceM)
{
    return submitTo<plan::Plan>(_impl->pool.get(),
                                [this, id = std::move(athleteId), startDate, raceDate, raceDistanceM] {
                                    return synthesizePlan(id, startDate, raceDate, raceDistanceM);
                                });
}

std::future<core::Expected<std::vector<insight::Insight>>> CoachEngine::submitInsights(core::AthleteId athleteId,
                                                                                     core::Date today)
{
    return submitTo<std::vector<insight::Insight>>(_impl->pool.get(), [this, id = std::move(athleteId), today] {
        return insights(id, today);
    });
}

} // namespace tpo::engine
