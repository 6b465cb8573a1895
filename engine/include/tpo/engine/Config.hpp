/**
 * @file Config.hpp
 * @brief Coach engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_ENGINE_CONFIG_HPP
    #define TPO_ENGINE_CONFIG_HPP

    #include <tpo/bank/ConstraintDetector.hpp>
    #include <tpo/bank/FitnessBank.hpp>
    #include <tpo/core/Constants.hpp>
    #include <tpo/core/Log.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/insight/InsightEngine.hpp>
    #include <tpo/model/Calibrator.hpp>
    #include <tpo/phase/PhaseDetector.hpp>
    #include <tpo/plan/RuleSet.hpp>

namespace tpo::engine {

/** @brief Immutable engine configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        /// Zero uses the hardware concurrency.
        Builder &workerThreads(core::u32 n) noexcept;
        Builder &logLevel(core::LogLevel level) noexcept;
        Builder &calibration(const model::CalibrationOptions &options) noexcept;
        Builder &maxTaperWeeks(core::u32 weeks) noexcept;
        Builder &fitnessBank(const bank::BankOptions &options) noexcept;
        Builder &constraints(const bank::ConstraintOptions &options) noexcept;
        Builder &phases(const phase::PhaseOptions &options) noexcept;
        Builder &insights(const insight::InsightOptions &options) noexcept;
        Builder &rules(const plan::RuleSet &rules) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32                  _workerThreads{0};
        core::LogLevel             _logLevel{core::LogLevel::kInfo};
        model::CalibrationOptions  _calibration{};
        core::u32                  _maxTaperWeeks{core::kDefaultMaxTaperWeeks};
        bank::BankOptions          _bank{};
        bank::ConstraintOptions    _constraints{};
        phase::PhaseOptions        _phases{};
        insight::InsightOptions    _insights{};
        plan::RuleSet              _rules{plan::RuleSet::defaults()};
    };

    [[nodiscard]] core::u32                         workerThreads() const noexcept { return _workerThreads; }
    [[nodiscard]] core::LogLevel                    logLevel()      const noexcept { return _logLevel; }
    [[nodiscard]] const model::CalibrationOptions  &calibration()   const noexcept { return _calibration; }
    [[nodiscard]] core::u32                         maxTaperWeeks() const noexcept { return _maxTaperWeeks; }
    [[nodiscard]] const bank::BankOptions          &fitnessBank()   const noexcept { return _bank; }
    [[nodiscard]] const bank::ConstraintOptions    &constraints()   const noexcept { return _constraints; }
    [[nodiscard]] const phase::PhaseOptions        &phases()        const noexcept { return _phases; }
    [[nodiscard]] const insight::InsightOptions    &insights()      const noexcept { return _insights; }
    [[nodiscard]] const plan::RuleSet              &rules()         const noexcept { return _rules; }

    /**
     * @brief Checks the rule set and the numeric limits.
     * @return kInvalidArgument describing the first problem found.
     */
    [[nodiscard]] core::ExpectedVoid validate() const;

private:
    friend class Builder;

    core::u32                  _workerThreads{0};
    core::LogLevel             _logLevel{core::LogLevel::kInfo};
    model::CalibrationOptions  _calibration{};
    core::u32                  _maxTaperWeeks{core::kDefaultMaxTaperWeeks};
    bank::BankOptions          _bank{};
    bank::ConstraintOptions    _constraints{};
    phase::PhaseOptions        _phases{};
    insight::InsightOptions    _insights{};
    plan::RuleSet              _rules{plan::RuleSet::defaults()};
};

} // namespace tpo::engine

#endif // TPO_ENGINE_CONFIG_HPP
