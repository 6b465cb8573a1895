/**
 * @file Statistics.hpp
 * @brief Descriptive statistics and correlation used by the analytics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MATH_STATISTICS_HPP
    #define TPO_MATH_STATISTICS_HPP

    #include <tpo/core/Expected.hpp>
    #include <tpo/core/Types.hpp>

    #include <span>

namespace tpo::math {

/**
 * @brief Pearson correlation summary.
 */
struct Correlation {
    core::f64   r{0.0};
    core::f64   pValue{1.0};
    core::usize n{0};
};

/**
 * @brief Utility functions for baselines, trends and correlations.
 */
class Statistics final {
public:
    Statistics() = delete;

    /**
     * @brief Arithmetic mean, zero for an empty span.
     */
    [[nodiscard]] static core::f64 mean(std::span<const core::f64> samples) noexcept;

    /**
     * @brief Compute baseline mean and sample standard deviation.
     * @param samples   Observations.
     * @param[out] mean Output mean.
     * @param[out] stddev Output standard deviation (zero below two samples).
     */
    static void computeBaseline(
        std::span<const core::f64> samples,
        core::f64 &mean,
        core::f64 &stddev
    );

    /**
     * @brief Least-squares slope of @p y against @p x.
     * @return Slope, zero when @p x has no spread.
     */
    [[nodiscard]] static core::f64 linearSlope(
        std::span<const core::f64> x,
        std::span<const core::f64> y
    );

    /**
     * @brief Pearson product-moment correlation with a two-sided p-value.
     *
     * The p-value uses the Fisher z transform, which is adequate for the
     * sample sizes the insight detectors accept.
     *
     * @return kInvalidArgument on size mismatch, kInsufficientData below
     *         three pairs or when either series is constant.
     */
    [[nodiscard]] static core::Expected<Correlation> pearson(
        std::span<const core::f64> x,
        std::span<const core::f64> y
    );

    /**
     * @brief Exponential decay weight 0.5^(age / halfLife).
     */
    [[nodiscard]] static core::f64 halfLifeWeight(core::f64 ageDays, core::f64 halfLifeDays) noexcept;
};

} // namespace tpo::math

#endif // TPO_MATH_STATISTICS_HPP
