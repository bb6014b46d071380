#pragma once

#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * Lightweight entity handle: a 32-bit slot index and the 32-bit generation the slot
     * had when the handle was issued, packed into one 64-bit value (generation high).
     */
    class Entity
    {
    public:
        using IndexType = std::uint32_t;
        using GenerationType = std::uint32_t;
        using BitsType = std::uint64_t;

        static constexpr std::size_t GENERATION_SHIFT = 32;
        static constexpr BitsType INDEX_MASK = 0xFFFFFFFFull;
        static constexpr BitsType INVALID = std::numeric_limits<BitsType>::max();

        constexpr Entity() noexcept : m_bits{INVALID} {}
        constexpr Entity(IndexType index, GenerationType generation) noexcept
            : m_bits{(static_cast<BitsType>(generation) << GENERATION_SHIFT) | static_cast<BitsType>(index)} {}

        STRATA_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

        STRATA_NODISCARD constexpr bool operator==(const Entity& other) const noexcept = default;
        STRATA_NODISCARD constexpr bool operator<(const Entity& other) const noexcept { return m_bits < other.m_bits; }

        STRATA_NODISCARD constexpr IndexType GetIndex() const noexcept { return static_cast<IndexType>(m_bits & INDEX_MASK); }
        STRATA_NODISCARD constexpr GenerationType GetGeneration() const noexcept { return static_cast<GenerationType>(m_bits >> GENERATION_SHIFT); }

        STRATA_NODISCARD constexpr BitsType ToBits() const noexcept { return m_bits; }
        STRATA_NODISCARD static constexpr Entity FromBits(BitsType bits) noexcept { return Entity{bits}; }

        STRATA_NODISCARD constexpr bool IsValid() const noexcept { return m_bits != INVALID; }
        STRATA_NODISCARD static constexpr Entity Invalid() noexcept { return Entity{INVALID}; }

    private:
        constexpr explicit Entity(BitsType bits) noexcept : m_bits{bits} {}

        BitsType m_bits;
    };

    struct EntityHash
    {
        std::size_t operator()(const Entity& entity) const noexcept
        {
            // splitmix64 finalizer
            std::uint64_t hash = entity.ToBits();
            hash ^= hash >> 30;
            hash *= 0xBF58476D1CE4E5B9ULL;
            hash ^= hash >> 27;
            hash *= 0x94D049BB133111EBULL;
            hash ^= hash >> 31;
            return static_cast<std::size_t>(hash);
        }
    };
}

namespace std
{
    template<>
    struct hash<Strata::Entity>
    {
        STRATA_NODISCARD std::size_t operator()(const Strata::Entity& entity) const noexcept
        {
            return Strata::EntityHash{}(entity);
        }
    };
}
