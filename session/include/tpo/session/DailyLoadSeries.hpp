/**
 * @file DailyLoadSeries.hpp
 * @brief Dense date to training-load mapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_SESSION_DAILY_LOAD_SERIES_HPP
    #define TPO_SESSION_DAILY_LOAD_SERIES_HPP

    #include "Session.hpp"

    #include <optional>
    #include <span>
    #include <vector>

namespace tpo::session {

/// @brief Inclusive run of calendar days.
struct DateRange {
    core::Date first;
    core::Date last;

    [[nodiscard]] core::i32 days() const noexcept { return core::daysBetween(first, last) + 1; }
};

/**
 * @class DailyLoadSeries
 * @brief One load value per calendar day, zero on rest days.
 */
class DailyLoadSeries final {
public:
    DailyLoadSeries() = default;
    DailyLoadSeries(core::Date start, std::vector<core::f64> loads);

    /**
     * @brief Sums session loads per day from the first session to @p end
     *        (or the last session when @p end is empty).
     */
    [[nodiscard]] static DailyLoadSeries fromSessions(
        std::span<const Session> sessions,
        std::optional<core::Date> end = std::nullopt);

    [[nodiscard]] bool        empty() const noexcept { return _loads.empty(); }
    [[nodiscard]] core::usize size()  const noexcept { return _loads.size(); }
    [[nodiscard]] core::Date  start() const noexcept { return _start; }
    /// @brief Last covered day (inclusive).
    [[nodiscard]] core::Date  end()   const noexcept;

    [[nodiscard]] std::span<const core::f64> values() const noexcept { return _loads; }

    /// @brief Load on @p day, zero outside the covered range.
    [[nodiscard]] core::f64 loadOn(core::Date day) const noexcept;

    /// @brief Mean daily load over the @p days days ending at @p asOf.
    [[nodiscard]] core::f64 trailingMean(core::Date asOf, core::i32 days) const noexcept;

    /**
     * @brief Runs of at least @p minDays consecutive zero-load days that
     *        lie within [from, to].
     */
    [[nodiscard]] std::vector<DateRange> gaps(core::Date from, core::Date to, core::i32 minDays) const;

    /// @brief Copy extended (or truncated) to @p newEnd, padding with @p fill.
    [[nodiscard]] DailyLoadSeries extendedTo(core::Date newEnd, core::f64 fill) const;

    [[nodiscard]] bool operator==(const DailyLoadSeries &) const = default;

private:
    core::Date             _start{};
    std::vector<core::f64> _loads;
};

} // namespace tpo::session

#endif // TPO_SESSION_DAILY_LOAD_SERIES_HPP
