/**
 * @file LeastSquares.cpp
 * @brief Implementation of the bounded Levenberg–Marquardt solver.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tpo/math/LeastSquares.hpp>
#include <tpo/core/Assert.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace tpo::math {

namespace {

constexpr core::f64 kMinLambda = 1e-12;
constexpr core::f64 kMaxLambda = 1e12;

} // namespace

BoundedLevenbergMarquardt::BoundedLevenbergMarquardt(
    Eigen::VectorXd lower,
    Eigen::VectorXd upper,
    LmOptions options)
    : _lower(std::move(lower)), _upper(std::move(upper)), _options(options)
{
    TPO_ASSERT(_lower.size() == _upper.size());
}

Eigen::VectorXd BoundedLevenbergMarquardt::project(const Eigen::VectorXd &x) const
{
    return x.cwiseMax(_lower).cwiseMin(_upper);
}

Eigen::MatrixXd BoundedLevenbergMarquardt::jacobian(
    const ResidualFunction &residuals,
    const Eigen::VectorXd &x,
    const Eigen::VectorXd &r) const
{
    Eigen::MatrixXd jac(r.size(), x.size());

    for (Eigen::Index j = 0; j < x.size(); ++j)
    {
        const core::f64 h = _options.jacobianStep * std::max(1.0, std::abs(x[j]));
        Eigen::VectorXd shifted = x;

        // Step towards the interior when the parameter sits on its upper bound.
        core::f64 step = (x[j] + h <= _upper[j]) ? h : -h;
        shifted[j] = x[j] + step;
        shifted = project(shifted);
        step = shifted[j] - x[j];

        if (step == 0.0)
        {
            jac.col(j).setZero();
            continue;
        }
        jac.col(j) = (residuals(shifted) - r) / step;
    }
    return jac;
}

core::Expected<LmResult> BoundedLevenbergMarquardt::minimize(
    const ResidualFunction &residuals,
    const Eigen::VectorXd &start) const
{
    if (start.size() != _lower.size())
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("expected {} parameters, got {}", _lower.size(), start.size()));

    LmResult result;
    result.params = project(start);

    Eigen::VectorXd r = residuals(result.params);
    if (!r.allFinite())
        return core::makeError(core::ErrorCode::kCalibrationFailed, "residuals are not finite at the start point");

    result.cost = 0.5 * r.squaredNorm();
    core::f64 lambda = _options.initialLambda;

    for (result.iterations = 0; result.iterations < _options.maxIterations; ++result.iterations)
    {
        const Eigen::MatrixXd jac = jacobian(residuals, result.params, r);
        const Eigen::MatrixXd jtj = jac.transpose() * jac;
        const Eigen::VectorXd g   = jac.transpose() * r;

        if (g.lpNorm<Eigen::Infinity>() < _options.tolerance)
        {
            result.converged = true;
            break;
        }

        bool accepted = false;
        while (!accepted && lambda < kMaxLambda)
        {
            Eigen::MatrixXd damped = jtj;
            for (Eigen::Index i = 0; i < damped.rows(); ++i)
                damped(i, i) += lambda * std::max(jtj(i, i), 1e-9);

            const Eigen::VectorXd delta     = damped.ldlt().solve(-g);
            const Eigen::VectorXd candidate = project(result.params + delta);
            const Eigen::VectorXd rCand     = residuals(candidate);
            const core::f64 costCand = rCand.allFinite()
                ? 0.5 * rCand.squaredNorm()
                : std::numeric_limits<core::f64>::infinity();

            if (costCand < result.cost)
            {
                const core::f64 improvement = result.cost - costCand;
                const core::f64 stepNorm    = (candidate - result.params).norm();

                result.params = candidate;
                result.cost   = costCand;
                r             = rCand;
                lambda        = std::max(lambda / 10.0, kMinLambda);
                accepted      = true;

                if (improvement < _options.tolerance * (1.0 + result.cost)
                    || stepNorm < _options.tolerance * (1.0 + result.params.norm()))
                {
                    result.converged = true;
                }
            }
            else
            {
                lambda *= 10.0;
            }
        }

        // No downhill step exists at any damping: a (constrained) minimum.
        if (!accepted)
        {
            result.converged = true;
            break;
        }
        if (result.converged)
            break;
    }
    return result;
}

} // namespace tpo::math
