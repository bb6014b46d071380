#pragma once

#include <cstddef>

#include "Base.hpp"

namespace Strata
{
    namespace config
    {
        // Rows reserved by the first allocation of an archetype's columns
        inline constexpr std::size_t INITIAL_ARCHETYPE_CAPACITY = 64;

        // Column capacity multiplier applied whenever an archetype is full
        inline constexpr std::size_t GROWTH_FACTOR = 2;

        // Slots reserved up front by a default-constructed World
        inline constexpr std::size_t INITIAL_ENTITY_CAPACITY = 0;

        inline constexpr bool ENABLE_ASSERTS =
#ifdef STRATA_BUILD_DEBUG
            true;
#else
            false;
#endif
    }

    template<typename T>
    inline constexpr bool IsPowerOfTwo(T value) noexcept
    {
        return value && !(value & (value - 1));
    }

    inline constexpr std::size_t NextCapacity(std::size_t current, std::size_t required) noexcept
    {
        std::size_t capacity = current == 0 ? config::INITIAL_ARCHETYPE_CAPACITY : current;
        while (capacity < required)
        {
            capacity *= config::GROWTH_FACTOR;
        }
        return capacity;
    }
}
