/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * TPO_TRY macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_EXPECTED_HPP
    #define TPO_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace tpo::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace tpo::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once. On error the enclosing function returns that
 * error, otherwise the macro yields the contained value.
 *
 * @param expr An expression of type tpo::core::Expected<U>.
 */
#define TPO_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_tpo_result = (expr);                                       \
        if (!_tpo_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tpo_result.error()));         \
        std::move(_tpo_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type tpo::core::ExpectedVoid.
 */
#define TPO_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_tpo_result = (expr);                                       \
        if (!_tpo_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tpo_result.error()));         \
    } while (false)

#endif // TPO_CORE_EXPECTED_HPP
