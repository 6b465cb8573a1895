/**
 * @file Date.cpp
 * @brief Calendar-day helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tpo/core/Date.hpp"

#include <charconv>
#include <format>

namespace tpo::core {

Date makeDate(i32 year, u32 month, u32 day) noexcept
{
    return Date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

Expected<Date> parseDate(std::string_view text)
{
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return makeError(ErrorCode::kInvalidArgument,
                         std::format("malformed date '{}', expected YYYY-MM-DD", text));

    auto field = [&](usize offset, usize len, i32 &out) {
        const char *first = text.data() + offset;
        auto [ptr, ec] = std::from_chars(first, first + len, out);
        return ec == std::errc{} && ptr == first + len;
    };

    i32 y = 0, m = 0, d = 0;
    if (!field(0, 4, y) || !field(5, 2, m) || !field(8, 2, d))
        return makeError(ErrorCode::kInvalidArgument,
                         std::format("non-numeric date field in '{}'", text));

    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return makeError(ErrorCode::kInvalidArgument,
                         std::format("'{}' is not a calendar date", text));
    return Date{ymd};
}

std::string toString(Date date)
{
    const std::chrono::year_month_day ymd{date};
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

u32 weekdayIndex(Date date) noexcept
{
    return std::chrono::weekday{date}.iso_encoding() - 1;
}

Date weekStart(Date date) noexcept
{
    return addDays(date, -static_cast<i32>(weekdayIndex(date)));
}

} // namespace tpo::core
