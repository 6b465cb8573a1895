/**
 * @file Date.hpp
 * @brief Calendar-day arithmetic on top of std::chrono::sys_days.
 *
 * All coaching computations work at day granularity. Weeks start on
 * Monday.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_DATE_HPP
    #define TPO_CORE_DATE_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <chrono>
    #include <string>
    #include <string_view>

namespace tpo::core {

using Date = std::chrono::sys_days;

/// @brief Builds a date from a calendar triple (no validation).
[[nodiscard]] Date makeDate(i32 year, u32 month, u32 day) noexcept;

/// @brief Parses a strict `YYYY-MM-DD` string.
[[nodiscard]] Expected<Date> parseDate(std::string_view text);

/// @brief Formats @p date as `YYYY-MM-DD`.
[[nodiscard]] std::string toString(Date date);

/// @brief Signed day count from @p from to @p to.
[[nodiscard]] inline i32 daysBetween(Date from, Date to) noexcept
{
    return static_cast<i32>((to - from).count());
}

[[nodiscard]] inline Date addDays(Date date, i32 days) noexcept
{
    return date + std::chrono::days{days};
}

/// @brief Day of week with Monday = 0 … Sunday = 6.
[[nodiscard]] u32 weekdayIndex(Date date) noexcept;

/// @brief Monday of the week containing @p date.
[[nodiscard]] Date weekStart(Date date) noexcept;

} // namespace tpo::core

#endif // TPO_CORE_DATE_HPP
