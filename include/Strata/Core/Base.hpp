#pragma once

#include <cstddef>

#include "Platform.hpp"

// Base macros shared by every Strata header

#ifdef __has_builtin
    #define STRATA_HAS_BUILTIN(x) __has_builtin(x)
#else
    #define STRATA_HAS_BUILTIN(x) 0
#endif

#define STRATA_NODISCARD [[nodiscard]]
#define STRATA_MAYBE_UNUSED [[maybe_unused]]
#define STRATA_LIKELY [[likely]]
#define STRATA_UNLIKELY [[unlikely]]

#if defined(STRATA_COMPILER_MSVC)
    #define STRATA_FORCEINLINE __forceinline
    #define STRATA_NOINLINE __declspec(noinline)
    #define STRATA_UNREACHABLE() __assume(0)
#else
    #define STRATA_FORCEINLINE inline __attribute__((always_inline))
    #define STRATA_NOINLINE __attribute__((noinline))
    #if STRATA_HAS_BUILTIN(__builtin_unreachable)
        #define STRATA_UNREACHABLE() __builtin_unreachable()
    #else
        #define STRATA_UNREACHABLE() ((void)0)
    #endif
#endif

#define STRATA_STRINGIFY_IMPL(x) #x
#define STRATA_STRINGIFY(x) STRATA_STRINGIFY_IMPL(x)

#define STRATA_UNUSED(x) ((void)(x))

// Internal invariant checks. Recoverable conditions are reported through Result.
#ifdef STRATA_BUILD_DEBUG
    #include <cassert>
    #define STRATA_ASSERT(condition, message) assert((condition) && (message))
#else
    #define STRATA_ASSERT(condition, message) ((void)0)
#endif

namespace Strata
{
    inline constexpr std::size_t CACHE_LINE_SIZE = STRATA_CACHE_LINE_SIZE;
}
