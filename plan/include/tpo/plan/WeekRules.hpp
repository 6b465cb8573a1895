/**
 * @file WeekRules.hpp
 * @brief Chain of Responsibility validating a planned week.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_WEEK_RULES_HPP
    #define TPO_PLAN_WEEK_RULES_HPP

    #include "Plan.hpp"
    #include "RuleSet.hpp"

    #include <memory>
    #include <string>
    #include <vector>

namespace tpo::plan {

/** @brief Result of one week check. */
enum class RuleVerdict : core::u8
{
    kPass,
    kWarn,
    kReject
};

struct RuleFinding {
    RuleVerdict verdict{RuleVerdict::kPass};
    std::string note;
};

/** @brief Abstract week check link. */
class IWeekRule
{
public:
    virtual ~IWeekRule() = default;

    /**
     * @brief Evaluate @p week against this rule.
     * @return Verdict and, unless it passes, a human-readable note.
     */
    [[nodiscard]] virtual RuleFinding evaluate(const Week &week) const = 0;

    /** @brief Human-readable name of the rule. */
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

struct WeekEvaluation {
    RuleVerdict              verdict{RuleVerdict::kPass};
    std::vector<std::string> notes;       ///< Warnings, then the rejection if any.
    std::string              rejectedBy;
};

/**
 * @brief Chain of Responsibility aggregating IWeekRule links.
 *
 * Evaluates each rule in order. Stops at the first rejection; otherwise
 * the verdict is Warn if any rule warns.
 */
class WeekRuleChain
{
public:
    WeekRuleChain();
    ~WeekRuleChain();

    WeekRuleChain(WeekRuleChain &&) noexcept;
    WeekRuleChain &operator=(WeekRuleChain &&) noexcept;
    WeekRuleChain(const WeekRuleChain &) = delete;
    WeekRuleChain &operator=(const WeekRuleChain &) = delete;

    /** @brief Append a rule to the chain. */
    void addRule(std::unique_ptr<IWeekRule> rule);

    [[nodiscard]] WeekEvaluation evaluate(const Week &week) const;

    /** @brief Number of rules in the chain. */
    [[nodiscard]] core::usize ruleCount() const noexcept;

    /** @brief All built-in rules parameterised by @p rules. */
    [[nodiscard]] static WeekRuleChain standard(const RuleSet &rules);

private:
    std::vector<std::unique_ptr<IWeekRule>> _rules;
};

// ─────────────────────────────────────────────────────────────────────────────
// Built-in week rules
// ─────────────────────────────────────────────────────────────────────────────

/** @brief Rejects weeks whose easy share is below the phase minimum. */
class EasyShareRule final : public IWeekRule
{
public:
    explicit EasyShareRule(const RuleSet &rules);
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    RuleSet _rules;
};

/** @brief Rejects more quality sessions than the phase allows. */
class QualityCountRule final : public IWeekRule
{
public:
    explicit QualityCountRule(const RuleSet &rules);
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    RuleSet _rules;
};

/** @brief Caps single-session quality and marathon-pace work. */
class IntensityCapRule final : public IWeekRule
{
public:
    explicit IntensityCapRule(const RuleSet &rules);
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    RuleSet _rules;
};

/** @brief Caps the long run by share of the week, duration and ceiling. */
class LongRunCapRule final : public IWeekRule
{
public:
    explicit LongRunCapRule(const RuleSet &rules);
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;

private:
    RuleSet _rules;
};

/** @brief Rejects a workout long run stacked with more than one quality day. */
class HardStackingRule final : public IWeekRule
{
public:
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;
};

/** @brief Rejects weeks above their volume ceiling. */
class VolumeCeilingRule final : public IWeekRule
{
public:
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;
};

/** @brief Warns when two hard sessions fall within 48 hours. */
class BackToBackHardRule final : public IWeekRule
{
public:
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;
};

/** @brief Warns when another run is longer than the long run. */
class LongestRunRule final : public IWeekRule
{
public:
    [[nodiscard]] RuleFinding evaluate(const Week &week) const override;
    [[nodiscard]] const char *name() const noexcept override;
};

} // namespace tpo::plan

#endif // TPO_PLAN_WEEK_RULES_HPP
