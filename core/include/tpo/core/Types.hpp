/**
 * @file Types.hpp
 * @brief Primitive type aliases and identifier types shared by every module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_TYPES_HPP
    #define TPO_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>
    #include <string>

namespace tpo::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/// @brief Opaque athlete identifier.
using AthleteId  = std::string;
/// @brief Identifier of a recorded training session.
using SessionId  = std::string;
/// @brief Identifier of a planned workout.
using WorkoutId  = std::string;
/// @brief Identifier of a plan change proposal.
using ProposalId = std::string;

} // namespace tpo::core

#endif // TPO_CORE_TYPES_HPP
