/**
 * @file InsightEngine.cpp
 * @brief Insight ranking and feedback filtering.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/insight/InsightEngine.hpp>

#include <tpo/core/Log.hpp>

#include <algorithm>
#include <format>
#include <unordered_map>

namespace tpo::insight {

InsightEngine::InsightEngine() = default;
InsightEngine::~InsightEngine() = default;
InsightEngine::InsightEngine(InsightEngine &&) noexcept = default;
InsightEngine &InsightEngine::operator=(InsightEngine &&) noexcept = default;

void InsightEngine::addDetector(std::unique_ptr<IInsightDetector> detector)
{
    if (detector)
        _detectors.push_back(std::move(detector));
}

core::usize InsightEngine::detectorCount() const noexcept { return _detectors.size(); }

std::vector<Insight> InsightEngine::candidates(const InsightContext &context, const InsightOptions &options) const
{
    std::vector<Insight> out;
    for (const auto &detector : _detectors)
    {
        auto found = detector->detect(context);
        core::Log::debug("InsightEngine", std::format("{} produced {} candidates", detector->name(), found.size()));
        for (auto &insight : found)
        {
            insight.confidence = insightConfidence(insight.sampleSize, insight.consistency);
            insight.priority   = insightPriority(insight.rawScore, insight.confidence,
                                                 core::daysBetween(insight.observedAt, context.today),
                                                 options.halfLifeDays);
            out.push_back(std::move(insight));
        }
    }
    return out;
}

std::vector<Insight> InsightEngine::generate(const InsightContext &context, const FeedbackLog &feedback,
                                             const InsightOptions &options) const
{
    auto all = candidates(context, options);

    std::unordered_map<std::string, core::usize> bestBySignature;
    std::vector<Insight> unique;
    for (auto &insight : all)
    {
        auto it = bestBySignature.find(insight.signature);
        if (it == bestBySignature.end())
        {
            bestBySignature.emplace(insight.signature, unique.size());
            unique.push_back(std::move(insight));
        }
        else if (insight.priority > unique[it->second].priority)
        {
            unique[it->second] = std::move(insight);
        }
    }

    const auto suppressed = std::erase_if(unique, [&](const Insight &insight) {
        return feedback.isSuppressed(context.athlete.id, insight.signature, context.today, options.cooldownDays);
    });
    if (suppressed > 0)
        core::Log::debug("InsightEngine", std::format("{} insights in cooldown for {}", suppressed, context.athlete.id));

    for (auto &insight : unique)
        insight.isNew = !feedback.isSaved(context.athlete.id, insight.signature);

    std::ranges::sort(unique, [](const Insight &a, const Insight &b) {
        if (a.priority != b.priority)
            return a.priority > b.priority;
        if (a.observedAt != b.observedAt)
            return a.observedAt > b.observedAt;
        return a.signature < b.signature;
    });

    if (unique.size() > options.topK)
        unique.resize(options.topK);
    return unique;
}

InsightEngine InsightEngine::standard()
{
    InsightEngine engine;
    engine.addDetector(std::make_unique<EfficiencyTrendDetector>());
    engine.addDetector(std::make_unique<BreakthroughDetector>());
    engine.addDetector(std::make_unique<FatigueDetector>());
    engine.addDetector(std::make_unique<PatternDetector>());
    engine.addDetector(std::make_unique<InjuryRiskDetector>());
    return engine;
}

std::vector<Insight> generateInsights(const InsightContext &context, const FeedbackLog &feedback,
                                      const InsightOptions &options)
{
    return InsightEngine::standard().generate(context, feedback, options);
}

} // namespace tpo::insight
