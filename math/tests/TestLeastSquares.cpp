/**
 * @file TestLeastSquares.cpp
 * @brief Unit tests for the bounded Levenberg–Marquardt solver.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tpo/math/LeastSquares.hpp"

#include <cmath>

namespace tpo::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("LM recovers exponential decay parameters", "[math][lsq]")
{
    // y = a * exp(-t / tau), a = 3, tau = 12
    Eigen::VectorXd t(10);
    Eigen::VectorXd y(10);
    for (int i = 0; i < 10; ++i)
    {
        t[i] = 3.0 * i;
        y[i] = 3.0 * std::exp(-t[i] / 12.0);
    }

    Eigen::VectorXd lower(2), upper(2), start(2);
    lower << 0.1, 1.0;
    upper << 10.0, 60.0;
    start << 1.0, 30.0;

    BoundedLevenbergMarquardt solver(lower, upper);
    auto result = solver.minimize(
        [&](const Eigen::VectorXd &p) -> Eigen::VectorXd {
            return (p[0] * (-t.array() / p[1]).exp()).matrix() - y;
        },
        start);

    REQUIRE(result.has_value());
    REQUIRE(result->converged);
    REQUIRE_THAT(result->params[0], WithinAbs(3.0, 1e-4));
    REQUIRE_THAT(result->params[1], WithinAbs(12.0, 1e-3));
}

TEST_CASE("LM respects bounds", "[math][lsq]")
{
    // Unconstrained minimum is x = 5, but the box stops at 2.
    Eigen::VectorXd lower(1), upper(1), start(1);
    lower << -2.0;
    upper << 2.0;
    start << 0.0;

    BoundedLevenbergMarquardt solver(lower, upper);
    auto result = solver.minimize(
        [](const Eigen::VectorXd &p) -> Eigen::VectorXd {
            Eigen::VectorXd r(1);
            r[0] = p[0] - 5.0;
            return r;
        },
        start);

    REQUIRE(result.has_value());
    REQUIRE_THAT(result->params[0], WithinAbs(2.0, 1e-9));
}

TEST_CASE("LM rejects bad input", "[math][lsq]")
{
    Eigen::VectorXd lower(2), upper(2);
    lower << 0.0, 0.0;
    upper << 1.0, 1.0;
    BoundedLevenbergMarquardt solver(lower, upper);

    SECTION("dimension mismatch")
    {
        Eigen::VectorXd start(3);
        start.setZero();
        auto r = solver.minimize([](const Eigen::VectorXd &p) -> Eigen::VectorXd { return p; }, start);
        REQUIRE(r.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("non-finite residuals")
    {
        Eigen::VectorXd start(2);
        start << 0.5, 0.5;
        auto r = solver.minimize(
            [](const Eigen::VectorXd &) -> Eigen::VectorXd {
                Eigen::VectorXd v(1);
                v[0] = std::nan("");
                return v;
            },
            start);
        REQUIRE(r.error().code() == core::ErrorCode::kCalibrationFailed);
    }
}

} // namespace tpo::math
