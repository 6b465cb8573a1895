/**
 * @file Narrator.cpp
 * @brief Sentence-by-sentence explanation builder.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/insight/Narrator.hpp>

#include <tpo/core/Confidence.hpp>
#include <tpo/core/Log.hpp>

#include <format>
#include <vector>

namespace tpo::insight {

namespace {

using Sentence = std::function<std::string()>;

std::string describeWorkout(const plan::Workout &w)
{
    return std::format("{} {} of {:.1f} km", core::toString(w.date), plan::workoutTypeName(w.type),
                       w.targetDistanceM / 1000.0);
}

std::string describeChange(const plan::WorkoutChange &change)
{
    if (!change.before && change.after)
        return std::format("Adds {}.", describeWorkout(*change.after));
    if (change.before && change.after)
    {
        if (change.after->status == plan::WorkoutStatus::kSkipped)
            return std::format("Skips {}.", describeWorkout(*change.before));
        return std::format("Changes {} to {}.", describeWorkout(*change.before), describeWorkout(*change.after));
    }
    if (change.before)
        return std::format("Removes {}.", describeWorkout(*change.before));
    return {};
}

} // namespace

Narrator::Narrator(StepHook hook) : _hook{std::move(hook)} {}

core::ExpectedVoid Narrator::step(core::usize index, const std::stop_token &stop) const
{
    if (_hook)
        _hook(index);
    if (stop.stop_requested())
    {
        core::Log::debug("Narrator", std::format("explanation cancelled at sentence {}", index));
        return core::makeError(core::ErrorCode::kCancelled, "explanation cancelled");
    }
    return {};
}

core::Expected<std::string> Narrator::explain(const Insight &insight, std::stop_token stop) const
{
    std::vector<Sentence> sentences;
    sentences.emplace_back([&] { return std::format("{}.", insight.title); });
    if (!insight.detail.empty())
        sentences.emplace_back([&] { return insight.detail; });
    sentences.emplace_back([&] {
        return std::format("This is based on {} observations, {:.0f}% of them consistent; confidence is {}.",
                           insight.sampleSize, insight.consistency * 100.0,
                           core::confidenceLabelName(insight.confidence));
    });
    for (const auto &e : insight.evidence)
    {
        sentences.emplace_back([&e] {
            if (e.date)
                return std::format("{}: {:.3g} on {}.", e.label, e.value, core::toString(*e.date));
            return std::format("{}: {:.3g}.", e.label, e.value);
        });
    }
    if (!insight.isNew)
        sentences.emplace_back([] { return std::string{"You saved this insight earlier."}; });

    std::string text;
    for (core::usize i = 0; i < sentences.size(); ++i)
    {
        TPO_TRY_VOID(step(i, stop));
        if (!text.empty())
            text += ' ';
        text += sentences[i]();
    }
    return text;
}

core::Expected<std::string> Narrator::explain(const plan::PlanProposal &proposal, std::stop_token stop) const
{
    std::vector<Sentence> sentences;
    sentences.emplace_back([&] {
        const auto &r = proposal.request;
        if (r.reason.empty())
            return std::format("Proposed change: {}.", plan::changeKindName(r.kind));
        return std::format("Proposed change: {} ({}).", plan::changeKindName(r.kind), r.reason);
    });
    for (const auto &change : proposal.diff)
        sentences.emplace_back([&change] { return describeChange(change); });
    for (const auto &note : proposal.riskNotes)
        sentences.emplace_back([&note] { return std::format("Note: {}.", note); });
    sentences.emplace_back([&] {
        return std::format("Status: {}, computed against plan revision {}.",
                           plan::proposalStatusName(proposal.status), proposal.planRevision);
    });

    std::string text;
    for (core::usize i = 0; i < sentences.size(); ++i)
    {
        TPO_TRY_VOID(step(i, stop));
        auto sentence = sentences[i]();
        if (sentence.empty())
            continue;
        if (!text.empty())
            text += ' ';
        text += sentence;
    }
    return text;
}

} // namespace tpo::insight
