/**
 * @file SyntheticHistory.hpp
 * @brief Deterministic generator of training histories for tests and demos.
 *
 * Produces a progressive training block (weekly growth, cutbacks, optional
 * layoff) with heart rates and paces tied to a slowly rising VDOT, plus
 * periodic races timed from that VDOT.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_SIM_SYNTHETIC_HISTORY_HPP
    #define TPO_SIM_SYNTHETIC_HISTORY_HPP

    #include <tpo/core/Date.hpp>
    #include <tpo/core/Expected.hpp>
    #include <tpo/core/Types.hpp>
    #include <tpo/session/Session.hpp>

    #include <optional>
    #include <random>
    #include <vector>

namespace tpo::sim {

/// @brief Weeks without any running.
struct Layoff {
    core::u32 startWeek{0};
    core::u32 weeks{0};
};

/**
 * @brief Shape of the generated block.
 */
struct SyntheticProfile {
    core::Date  start{core::makeDate(2024, 1, 1)};  ///< Normalised to its Monday.
    core::u32   weeks{24};
    core::f64   baseWeeklyKm{50.0};
    core::f64   weeklyGrowth{0.03};
    core::u32   cutbackEvery{4};
    core::f64   cutbackFactor{0.75};
    core::u32   daysPerWeek{5};
    core::f64   startVdot{45.0};
    core::f64   vdotGainPerWeek{0.08};
    core::f64   maxHeartRate{185.0};
    core::f64   restingHeartRate{50.0};
    core::u32   raceEveryWeeks{6};       ///< Zero disables races.
    core::f64   raceDistanceM{10'000.0};
    core::f64   noise{0.03};             ///< Relative spread of distances, paces and race times.
    std::optional<Layoff> layoff;
};

struct SyntheticData {
    session::Athlete                 athlete;
    std::vector<session::Session>    sessions;   ///< Chronological, loads filled in.
    std::vector<session::RaceResult> races;
    core::Date                       lastDay{};  ///< Sunday of the final week.
};

/**
 * @class SyntheticHistory
 * @brief Seeded generator; the same seed and profile give the same history.
 *
 * @code
 *   sim::SyntheticHistory gen(42);
 *   auto data = gen.generate("ath-1");
 * @endcode
 */
class SyntheticHistory
{
public:
    /// @param seed PRNG seed (0 = time based).
    explicit SyntheticHistory(core::u64 seed = 0);

    void setProfile(const SyntheticProfile &profile);
    [[nodiscard]] const SyntheticProfile &profile() const noexcept { return _profile; }

    /**
     * @return kInvalidArgument for an empty athlete id, zero weeks, a
     *         training frequency outside 3–7 days or a non-positive volume.
     */
    [[nodiscard]] core::Expected<SyntheticData> generate(const core::AthleteId &athleteId);

    /// @brief Reseeds the generator.
    void reset(core::u64 seed = 0);

    /// @brief VDOT the generator assumes in week @p week.
    [[nodiscard]] core::f64 vdotAt(core::u32 week) const noexcept;

private:
    [[nodiscard]] core::f64 jitter(core::f64 value);

    SyntheticProfile _profile;
    std::mt19937_64  _rng;
};

} // namespace tpo::sim

#endif // TPO_SIM_SYNTHETIC_HISTORY_HPP
