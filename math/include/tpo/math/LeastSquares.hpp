/**
 * @file LeastSquares.hpp
 * @brief Box-constrained Levenberg–Marquardt solver on Eigen vectors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_MATH_LEAST_SQUARES_HPP
    #define TPO_MATH_LEAST_SQUARES_HPP

    #include <tpo/core/Expected.hpp>
    #include <tpo/core/Types.hpp>

    #include <Eigen/Dense>

    #include <functional>

namespace tpo::math {

/// @brief Maps a parameter vector to its residual vector.
using ResidualFunction = std::function<Eigen::VectorXd(const Eigen::VectorXd &)>;

struct LmOptions {
    core::u32 maxIterations{200};
    core::f64 tolerance{1e-10};
    core::f64 initialLambda{1e-3};
    core::f64 jacobianStep{1e-6};
};

struct LmResult {
    Eigen::VectorXd params;
    core::f64       cost{0.0};   ///< 0.5 * ||r||^2 at @ref params.
    core::u32       iterations{0};
    bool            converged{false};
};

/**
 * @brief Minimises 0.5 * ||r(x)||^2 subject to lower <= x <= upper.
 *
 * Steps are projected back onto the box; the Jacobian is estimated by
 * finite differences taken inside the box.
 */
class BoundedLevenbergMarquardt final {
public:
    BoundedLevenbergMarquardt(Eigen::VectorXd lower, Eigen::VectorXd upper, LmOptions options = {});

    /**
     * @brief Runs the solver from @p start.
     * @return kInvalidArgument on dimension mismatch, kCalibrationFailed
     *         when the residuals are not finite at the start point.
     */
    [[nodiscard]] core::Expected<LmResult> minimize(
        const ResidualFunction &residuals,
        const Eigen::VectorXd &start) const;

    [[nodiscard]] Eigen::VectorXd project(const Eigen::VectorXd &x) const;

private:
    [[nodiscard]] Eigen::MatrixXd jacobian(
        const ResidualFunction &residuals,
        const Eigen::VectorXd &x,
        const Eigen::VectorXd &r) const;

    Eigen::VectorXd _lower;
    Eigen::VectorXd _upper;
    LmOptions       _options;
};

} // namespace tpo::math

#endif // TPO_MATH_LEAST_SQUARES_HPP
