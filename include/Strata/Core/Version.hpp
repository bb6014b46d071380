#pragma once

#define STRATA_VERSION_MAJOR 0
#define STRATA_VERSION_MINOR 1
#define STRATA_VERSION_PATCH 0

#define STRATA_VERSION ((STRATA_VERSION_MAJOR << 16) | (STRATA_VERSION_MINOR << 8) | STRATA_VERSION_PATCH)

namespace Strata
{
    inline constexpr int VERSION_MAJOR = STRATA_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = STRATA_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = STRATA_VERSION_PATCH;
    inline constexpr int VERSION = STRATA_VERSION;
}
