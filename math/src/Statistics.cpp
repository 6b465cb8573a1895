/**
 * @file Statistics.cpp
 * @brief Implementation of statistical utilities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tpo/math/Statistics.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace tpo::math {

core::f64 Statistics::mean(std::span<const core::f64> samples) noexcept
{
    if (samples.empty())
        return 0.0;
    return std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<core::f64>(samples.size());
}

void Statistics::computeBaseline(
    std::span<const core::f64> samples,
    core::f64 &mean,
    core::f64 &stddev)
{
    mean   = Statistics::mean(samples);
    stddev = 0.0;

    if (samples.size() < 2)
        return;

    core::f64 sumSq = 0.0;
    for (core::f64 s : samples)
    {
        const core::f64 d = s - mean;
        sumSq += d * d;
    }
    stddev = std::sqrt(sumSq / static_cast<core::f64>(samples.size() - 1));
}

core::f64 Statistics::linearSlope(
    std::span<const core::f64> x,
    std::span<const core::f64> y)
{
    const core::usize n = std::min(x.size(), y.size());
    if (n < 2)
        return 0.0;

    const core::f64 mx = mean(x.first(n));
    const core::f64 my = mean(y.first(n));

    core::f64 sxy = 0.0;
    core::f64 sxx = 0.0;
    for (core::usize i = 0; i < n; ++i)
    {
        sxy += (x[i] - mx) * (y[i] - my);
        sxx += (x[i] - mx) * (x[i] - mx);
    }
    return sxx > 0.0 ? sxy / sxx : 0.0;
}

core::Expected<Correlation> Statistics::pearson(
    std::span<const core::f64> x,
    std::span<const core::f64> y)
{
    if (x.size() != y.size())
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("series length mismatch ({} vs {})", x.size(), y.size()));
    if (x.size() < 3)
        return core::makeError(core::ErrorCode::kInsufficientData,
                               std::format("need at least 3 pairs, got {}", x.size()));

    const core::f64 mx = mean(x);
    const core::f64 my = mean(y);

    core::f64 sxy = 0.0;
    core::f64 sxx = 0.0;
    core::f64 syy = 0.0;
    for (core::usize i = 0; i < x.size(); ++i)
    {
        const core::f64 dx = x[i] - mx;
        const core::f64 dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx <= 0.0 || syy <= 0.0)
        return core::makeError(core::ErrorCode::kInsufficientData, "constant series has no correlation");

    Correlation c;
    c.n = x.size();
    c.r = std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);

    if (c.n > 3 && std::abs(c.r) < 1.0)
    {
        const core::f64 z = std::atanh(c.r) * std::sqrt(static_cast<core::f64>(c.n - 3));
        c.pValue = std::erfc(std::abs(z) / std::sqrt(2.0));
    }
    else
    {
        c.pValue = std::abs(c.r) >= 1.0 ? 0.0 : 1.0;
    }
    return c;
}

core::f64 Statistics::halfLifeWeight(core::f64 ageDays, core::f64 halfLifeDays) noexcept
{
    if (halfLifeDays <= 0.0)
        return 1.0;
    return std::pow(0.5, std::max(0.0, ageDays) / halfLifeDays);
}

} // namespace tpo::math
