/**
 * @file Platform.hpp
 * @brief Compiler detection and branch-prediction hints.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_PLATFORM_HPP
    #define TPO_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define TPO_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define TPO_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define TPO_COMPILER_MSVC  1
    #else
        #define TPO_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(TPO_COMPILER_GCC) || defined(TPO_COMPILER_CLANG)
        #define TPO_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define TPO_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define TPO_LIKELY(x)       (x)
        #define TPO_UNLIKELY(x)     (x)
    #endif

// ---- Build configuration -------------------------------------------------

    #if !defined(NDEBUG) && !defined(TPO_DEBUG)
        #define TPO_DEBUG 1
    #endif

#endif // TPO_CORE_PLATFORM_HPP
