/**
 * @file Detectors.hpp
 * @brief Independent insight detectors over sessions and plan history.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_INSIGHT_DETECTORS_HPP
    #define TPO_INSIGHT_DETECTORS_HPP

    #include "Insight.hpp"

    #include <tpo/model/ResponseModel.hpp>
    #include <tpo/plan/Plan.hpp>
    #include <tpo/session/Session.hpp>

    #include <span>
    #include <vector>

namespace tpo::insight {

/**
 * @brief Planned versus completed work for one past plan week.
 */
struct PlanWeekDelta {
    core::Date weekStart{};
    core::f64  plannedM{0.0};
    core::f64  completedM{0.0};
    core::u32  plannedQuality{0};
    core::u32  skippedQuality{0};

    [[nodiscard]] bool operator==(const PlanWeekDelta &) const = default;
};

/**
 * @brief Compares every complete plan week before @p today with the
 *        sessions actually run. Later plans in @p history override earlier
 *        ones for the same week.
 */
[[nodiscard]] std::vector<PlanWeekDelta> planDeltas(
    std::span<const plan::Plan> history,
    std::span<const session::Session> sessions,
    core::Date today);

struct InsightContext {
    session::Athlete                     athlete;
    std::span<const session::Session>    sessions;   ///< Resolved, chronological.
    std::span<const session::RaceResult> races;
    std::span<const PlanWeekDelta>       planWeeks;
    const model::ResponseModel          *model{nullptr};
    core::Date                           today{};
};

/** @brief Abstract insight source. */
class IInsightDetector
{
public:
    virtual ~IInsightDetector() = default;

    /**
     * @brief Candidate insights with raw score, sample size and consistency
     *        filled in; ranking happens later.
     */
    [[nodiscard]] virtual std::vector<Insight> detect(const InsightContext &context) const = 0;

    /** @brief Human-readable name of the detector. */
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

/** @brief Speed-per-heartbeat over the last week against the five before. */
class EfficiencyTrendDetector final : public IInsightDetector
{
public:
    explicit EfficiencyTrendDetector(core::f64 minChange = 0.05);
    [[nodiscard]] std::vector<Insight> detect(const InsightContext &context) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    core::f64 _minChange;
};

/** @brief Race VDOT jumps and new volume or long-run peaks. */
class BreakthroughDetector final : public IInsightDetector
{
public:
    explicit BreakthroughDetector(core::f64 minVdotGain = 1.0);
    [[nodiscard]] std::vector<Insight> detect(const InsightContext &context) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    core::f64 _minVdotGain;
};

/** @brief Falling efficiency across recent runs or a high acute:chronic ratio. */
class FatigueDetector final : public IInsightDetector
{
public:
    explicit FatigueDetector(core::f64 maxLoadRatio = 1.5);
    [[nodiscard]] std::vector<Insight> detect(const InsightContext &context) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    core::f64 _maxLoadRatio;
};

/**
 * @brief Recurring behaviour: easy runs run too hard, load that predicts
 *        later efficiency, individual response speed versus population.
 */
class PatternDetector final : public IInsightDetector
{
public:
    explicit PatternDetector(core::f64 minCorrelation = 0.3, core::i32 maxLagDays = 7);
    [[nodiscard]] std::vector<Insight> detect(const InsightContext &context) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    core::f64 _minCorrelation;
    core::i32 _maxLagDays;
};

/** @brief Volume spikes, plan overshoot and skipped key sessions. */
class InjuryRiskDetector final : public IInsightDetector
{
public:
    InjuryRiskDetector(core::f64 maxWeeklyJump = 0.30, core::f64 maxPlanOvershoot = 1.20);
    [[nodiscard]] std::vector<Insight> detect(const InsightContext &context) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    core::f64 _maxWeeklyJump;
    core::f64 _maxPlanOvershoot;
};

} // namespace tpo::insight

#endif // TPO_INSIGHT_DETECTORS_HPP
