/**
 * @file Config.cpp
 * @brief Config::Builder implementation and validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/engine/Config.hpp>

#include <format>

namespace tpo::engine {

Config::Builder &Config::Builder::workerThreads(core::u32 n) noexcept
{
    _workerThreads = n;
    return *this;
}

Config::Builder &Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config::Builder &Config::Builder::calibration(const model::CalibrationOptions &options) noexcept
{
    _calibration = options;
    return *this;
}

Config::Builder &Config::Builder::maxTaperWeeks(core::u32 weeks) noexcept
{
    _maxTaperWeeks = weeks;
    return *this;
}

Config::Builder &Config::Builder::fitnessBank(const bank::BankOptions &options) noexcept
{
    _bank = options;
    return *this;
}

Config::Builder &Config::Builder::constraints(const bank::ConstraintOptions &options) noexcept
{
    _constraints = options;
    return *this;
}

Config::Builder &Config::Builder::phases(const phase::PhaseOptions &options) noexcept
{
    _phases = options;
    return *this;
}

Config::Builder &Config::Builder::insights(const insight::InsightOptions &options) noexcept
{
    _insights = options;
    return *this;
}

Config::Builder &Config::Builder::rules(const plan::RuleSet &rules) noexcept
{
    _rules = rules;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg._workerThreads = _workerThreads;
    cfg._logLevel      = _logLevel;
    cfg._calibration   = _calibration;
    cfg._maxTaperWeeks = _maxTaperWeeks;
    cfg._bank          = _bank;
    cfg._constraints   = _constraints;
    cfg._phases        = _phases;
    cfg._insights      = _insights;
    cfg._rules         = _rules;
    return cfg;
}

core::ExpectedVoid Config::validate() const
{
    TPO_TRY_VOID(_rules.validate());

    if (_maxTaperWeeks == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "maxTaperWeeks must be at least 1");
    if (_calibration.minRaceObservations == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "calibration needs at least one race observation");
    if (_bank.windowWeeks == 0 || _bank.confirmationWeeks == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "fitness-bank windows must be at least one week");
    if (_insights.topK == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "insight topK must be at least 1");
    if (_insights.cooldownDays < 0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("insight cooldown of {} days is negative", _insights.cooldownDays));
    return {};
}

} // namespace tpo::engine
