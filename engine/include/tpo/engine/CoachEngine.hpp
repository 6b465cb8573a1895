/**
 * @file CoachEngine.hpp
 * @brief Top-level coaching façade (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_ENGINE_COACH_ENGINE_HPP
    #define TPO_ENGINE_COACH_ENGINE_HPP

    #include "Config.hpp"

    #include <tpo/bank/ConstraintDetector.hpp>
    #include <tpo/bank/FitnessBank.hpp>
    #include <tpo/core/Expected.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/insight/FeedbackLog.hpp>
    #include <tpo/insight/Insight.hpp>
    #include <tpo/model/Predictor.hpp>
    #include <tpo/model/ResponseModel.hpp>
    #include <tpo/model/Vdot.hpp>
    #include <tpo/phase/Phase.hpp>
    #include <tpo/plan/Plan.hpp>
    #include <tpo/plan/ProposalBook.hpp>
    #include <tpo/session/Session.hpp>

    #include <future>
    #include <memory>
    #include <optional>
    #include <stop_token>
    #include <string>
    #include <vector>

namespace tpo::engine {

/**
 * @brief What the engine currently knows about one athlete's training.
 */
struct AthleteSnapshot {
    bank::FitnessBank          fitness;
    bank::ConstraintResolution constraint;
    std::vector<phase::Phase>  phases;
};

/**
 * @brief Top-level coaching façade.
 *
 * Owns the worker pool, the proposal store and the per-athlete state.
 * Analytical calls for one athlete are serialised; calls for different
 * athletes may run in parallel. Nothing is persisted: callers feed data in
 * and read results out.
 */
class CoachEngine
{
public:
    explicit CoachEngine(Config config);
    ~CoachEngine();

    CoachEngine(const CoachEngine &)            = delete;
    CoachEngine &operator=(const CoachEngine &) = delete;

    /**
     * @brief Validates the configuration and starts the worker pool.
     * @return kInvalidArgument for an invalid configuration.
     */
    [[nodiscard]] core::ExpectedVoid init();

    /** @brief Drains pending work and stops the worker pool. */
    void shutdown();

    [[nodiscard]] bool isInitialised() const noexcept;

    [[nodiscard]] const Config &config() const noexcept;

    // --- data intake ------------------------------------------------------

    /// @return kAlreadyExists for a known id, kInvalidArgument for a bad profile.
    [[nodiscard]] core::ExpectedVoid registerAthlete(const session::Athlete &athlete);

    /// @brief Appends a session; a zero load is computed from the athlete's profile.
    [[nodiscard]] core::ExpectedVoid recordSession(const core::AthleteId &athleteId, session::Session session);

    [[nodiscard]] core::ExpectedVoid recordRace(const core::AthleteId &athleteId, const session::RaceResult &race);

    [[nodiscard]] core::ExpectedVoid reportConstraint(const core::AthleteId &athleteId,
                                                      const bank::ConstraintSignal &signal);

    [[nodiscard]] core::ExpectedVoid overridePhase(const core::AthleteId &athleteId,
                                                   const phase::PhaseOverride &override);

    // --- analytics --------------------------------------------------------

    /// @brief Recalibrates the athlete's response model and keeps it active.
    [[nodiscard]] core::Expected<model::ResponseModel> calibrate(const core::AthleteId &athleteId);

    /// @brief Uses the active model, calibrating first when there is none.
    [[nodiscard]] core::Expected<model::Prediction> predict(const core::AthleteId &athleteId, core::Date targetDate,
                                                            core::f64 distanceM);

    /// @brief Fitness bank, constraint and phases as of @p today.
    [[nodiscard]] core::Expected<AthleteSnapshot> analyse(const core::AthleteId &athleteId, core::Date today,
                                                          std::optional<core::Date> raceDate = std::nullopt);

    /**
     * @brief Builds a plan from @p startDate to @p raceDate and makes it the
     *        active plan.
     *
     * The taper length comes from the taper optimiser and the forward
     * phases continue from the athlete's current phase. A replaced plan's
     * revision carries on, so proposals computed against it go stale.
     */
    [[nodiscard]] core::Expected<plan::Plan> synthesizePlan(const core::AthleteId &athleteId, core::Date startDate,
                                                            core::Date raceDate,
                                                            core::f64 raceDistanceM = model::kMarathonM);

    [[nodiscard]] core::Expected<plan::Plan> activePlan(const core::AthleteId &athleteId) const;

    /// @brief Ranked insight feed, honouring the athlete's feedback.
    [[nodiscard]] core::Expected<std::vector<insight::Insight>> insights(const core::AthleteId &athleteId,
                                                                         core::Date today);

    [[nodiscard]] core::ExpectedVoid recordFeedback(const core::AthleteId &athleteId, const std::string &signature,
                                                    insight::FeedbackAction action, core::Date at);

    // --- proposals ---------------------------------------------------------

    /// @return kNotFound when the athlete has no active plan.
    [[nodiscard]] core::Expected<plan::PlanProposal> proposeChange(const core::AthleteId &athleteId,
                                                                   const plan::ChangeRequest &request);

    /**
     * @brief Confirms and applies a proposal to its athlete's active plan.
     *
     * Retrying with the same key returns the stored receipt. A proposal
     * already in another terminal status comes back with @c conflict set.
     */
    [[nodiscard]] core::Expected<plan::ProposalOutcome> confirm(const core::ProposalId &proposalId,
                                                                std::string_view idempotencyKey,
                                                                core::Date appliedAt);

    [[nodiscard]] core::Expected<plan::ProposalOutcome> reject(const core::ProposalId &proposalId, std::string reason);

    [[nodiscard]] core::Expected<plan::PlanProposal> proposal(const core::ProposalId &proposalId) const;

    // --- explanations ------------------------------------------------------

    [[nodiscard]] core::Expected<std::string> explain(const insight::Insight &insight, std::stop_token stop) const;

    [[nodiscard]] core::Expected<std::string> explainProposal(const core::ProposalId &proposalId,
                                                              std::stop_token stop) const;

    // --- asynchronous variants ----------------------------------------------

    [[nodiscard]] std::future<core::Expected<model::ResponseModel>> submitCalibrate(core::AthleteId athleteId);

    [[nodiscard]] std::future<core::Expected<model::Prediction>> submitPredict(core::AthleteId athleteId,
                                                                               core::Date targetDate,
                                                                               core::f64 distanceM);

    [[nodiscard]] std::future<core::Expected<plan::Plan>> submitSynthesizePlan(
        core::AthleteId athleteId, core::Date startDate, core::Date raceDate,
        core::f64 raceDistanceM = model::kMarathonM);

    [[nodiscard]] std::future<core::Expected<std::vector<insight::Insight>>> submitInsights(core::AthleteId athleteId,
                                                                                          core::Date today);

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tpo::engine

#endif // TPO_ENGINE_COACH_ENGINE_HPP
