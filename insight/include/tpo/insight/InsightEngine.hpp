/**
 * @file InsightEngine.hpp
 * @brief Runs detectors, ranks their findings and applies feedback.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_INSIGHT_INSIGHT_ENGINE_HPP
    #define TPO_INSIGHT_INSIGHT_ENGINE_HPP

    #include "Detectors.hpp"
    #include "FeedbackLog.hpp"

    #include <tpo/core/Constants.hpp>

    #include <memory>
    #include <vector>

namespace tpo::insight {

struct InsightOptions {
    core::usize topK{core::kDefaultInsightTopK};
    core::i32   cooldownDays{core::kDefaultCooldownDays};
    core::f64   halfLifeDays{core::kInsightHalfLifeDays};
};

/**
 * @brief Ordered set of detectors producing a ranked insight feed.
 *
 * Each generation scores every candidate, keeps the best one per
 * signature, drops dismissed signatures still in cooldown and returns the
 * top K by priority. Ties go to the more recent observation, then to the
 * signature for a stable order.
 */
class InsightEngine
{
public:
    InsightEngine();
    ~InsightEngine();

    InsightEngine(InsightEngine &&) noexcept;
    InsightEngine &operator=(InsightEngine &&) noexcept;
    InsightEngine(const InsightEngine &) = delete;
    InsightEngine &operator=(const InsightEngine &) = delete;

    void addDetector(std::unique_ptr<IInsightDetector> detector);

    [[nodiscard]] core::usize detectorCount() const noexcept;

    /** @brief Scored, unfiltered output of every detector. */
    [[nodiscard]] std::vector<Insight> candidates(const InsightContext &context, const InsightOptions &options = {}) const;

    /** @brief Ranked feed after deduplication and feedback filtering. */
    [[nodiscard]] std::vector<Insight> generate(const InsightContext &context, const FeedbackLog &feedback,
                                                const InsightOptions &options = {}) const;

    /** @brief Engine with the five built-in detectors at default thresholds. */
    [[nodiscard]] static InsightEngine standard();

private:
    std::vector<std::unique_ptr<IInsightDetector>> _detectors;
};

/** @brief InsightEngine::standard().generate(...). */
[[nodiscard]] std::vector<Insight> generateInsights(const InsightContext &context, const FeedbackLog &feedback,
                                                    const InsightOptions &options = {});

} // namespace tpo::insight

#endif // TPO_INSIGHT_INSIGHT_ENGINE_HPP
