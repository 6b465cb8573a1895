/**
 * @file Confidence.hpp
 * @brief Ordered confidence qualifier shared by predictions and insights.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_CONFIDENCE_HPP
    #define TPO_CORE_CONFIDENCE_HPP

    #include "Types.hpp"

    #include <string_view>

namespace tpo::core {

/**
 * @brief Confidence labels, ordered from weakest to strongest.
 */
enum class ConfidenceLabel : u8 {
    kInsufficient = 0,
    kLow,
    kModerate,
    kHigh
};

[[nodiscard]] std::string_view confidenceLabelName(ConfidenceLabel label) noexcept;

/// @brief Lowers @p label by @p steps without going below @p floor.
[[nodiscard]] ConfidenceLabel downgrade(
    ConfidenceLabel label,
    u32 steps = 1,
    ConfidenceLabel floor = ConfidenceLabel::kInsufficient) noexcept;

} // namespace tpo::core

#endif // TPO_CORE_CONFIDENCE_HPP
