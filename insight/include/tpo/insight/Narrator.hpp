/**
 * @file Narrator.hpp
 * @brief Cancellable natural-language explanations of insights and proposals.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_INSIGHT_NARRATOR_HPP
    #define TPO_INSIGHT_NARRATOR_HPP

    #include "Insight.hpp"

    #include <tpo/core/Expected.hpp>
    #include <tpo/plan/Proposal.hpp>

    #include <functional>
    #include <stop_token>
    #include <string>

namespace tpo::insight {

/**
 * @brief Builds explanations one sentence at a time.
 *
 * The stop token is polled before every sentence. A stop request returns
 * kCancelled and discards everything built so far.
 */
class Narrator
{
public:
    /// Called with the index of each sentence before it is built.
    using StepHook = std::function<void(core::usize step)>;

    Narrator() = default;
    explicit Narrator(StepHook hook);

    [[nodiscard]] core::Expected<std::string> explain(const Insight &insight, std::stop_token stop) const;
    [[nodiscard]] core::Expected<std::string> explain(const plan::PlanProposal &proposal, std::stop_token stop) const;

private:
    [[nodiscard]] core::ExpectedVoid step(core::usize index, const std::stop_token &stop) const;

    StepHook _hook;
};

} // namespace tpo::insight

#endif // TPO_INSIGHT_NARRATOR_HPP
