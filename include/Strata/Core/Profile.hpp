#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy zones are only compiled into release builds that define TRACY_ENABLE
#if defined(STRATA_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define STRATA_PROFILE_ZONE() ZoneScoped
    #define STRATA_PROFILE_ZONE_NAMED(name) ZoneScopedN(name)
    #define STRATA_PROFILE_ZONE_COLOR(color) ZoneScopedC(color)
    #define STRATA_PROFILE_ZONE_NAMED_COLOR(name, color) ZoneScopedNC(name, color)

    #define STRATA_PROFILE_ZONE_VALUE(value) ZoneValue(value)

    #define STRATA_PROFILE_ALLOC(ptr, size) TracyAlloc(ptr, size)
    #define STRATA_PROFILE_FREE(ptr) TracyFree(ptr)

    #define STRATA_PROFILE_PLOT(name, val) TracyPlot(name, val)
#else
    #define STRATA_PROFILE_ZONE()
    #define STRATA_PROFILE_ZONE_NAMED(name)
    #define STRATA_PROFILE_ZONE_COLOR(color)
    #define STRATA_PROFILE_ZONE_NAMED_COLOR(name, color)

    #define STRATA_PROFILE_ZONE_VALUE(value)

    #define STRATA_PROFILE_ALLOC(ptr, size)
    #define STRATA_PROFILE_FREE(ptr)

    #define STRATA_PROFILE_PLOT(name, val)
#endif

namespace Strata::Profile
{
    constexpr std::uint32_t ColorDefault = 0x000000;
    constexpr std::uint32_t ColorMemory = 0xFF8800;

    constexpr std::uint32_t ColorEntity = 0x88FF00;
    constexpr std::uint32_t ColorComponent = 0x0088FF;
    constexpr std::uint32_t ColorMigration = 0xDDDD00;
    constexpr std::uint32_t ColorQuery = 0x8800FF;
}
