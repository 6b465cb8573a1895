/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * TPO_ASSERT is compiled out of release builds, TPO_VERIFY is always
 * evaluated and TPO_UNREACHABLE marks dead code paths. A failing check
 * reports the expression and its origin before aborting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CORE_ASSERT_HPP
    #define TPO_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace tpo::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[TPO ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace tpo::core::detail

    #ifdef TPO_DEBUG
        #define TPO_ASSERT(cond)                                          \
            do {                                                           \
                if (TPO_UNLIKELY(!(cond)))                                 \
                    ::tpo::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define TPO_ASSERT(cond) ((void)0)
    #endif

    #define TPO_VERIFY(cond)                                              \
        do {                                                               \
            if (TPO_UNLIKELY(!(cond)))                                     \
                ::tpo::core::detail::assertFail(#cond);                    \
        } while (false)

    #define TPO_UNREACHABLE()                                             \
        do {                                                               \
            ::tpo::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // TPO_CORE_ASSERT_HPP
