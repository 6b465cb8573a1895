/**
 * @file Paces.hpp
 * @brief Training speeds derived from VDOT.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_PACES_HPP
    #define TPO_PLAN_PACES_HPP

    #include "Plan.hpp"

namespace tpo::plan {

/// @brief Speeds in m/s.
struct TrainingPaces {
    core::f64 vdot{0.0};
    core::f64 recovery{0.0};
    core::f64 easy{0.0};
    core::f64 marathon{0.0};
    core::f64 threshold{0.0};
    core::f64 interval{0.0};

    [[nodiscard]] static TrainingPaces fromVdot(core::f64 vdot) noexcept;
};

/**
 * @brief Expected duration of @p workout: the work portion at the session's
 *        intensity, the rest at easy pace.
 */
[[nodiscard]] core::f64 workoutDuration(const Workout &workout, const TrainingPaces &paces);

} // namespace tpo::plan

#endif // TPO_PLAN_PACES_HPP
