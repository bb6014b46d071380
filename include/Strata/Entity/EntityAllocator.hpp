#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/Result.hpp"
#include "Entity.hpp"

namespace Strata
{
    struct EntityLocation
    {
        static constexpr std::uint32_t INVALID_ARCHETYPE = std::numeric_limits<std::uint32_t>::max();

        std::uint32_t archetype = INVALID_ARCHETYPE;
        std::uint32_t row = 0;

        STRATA_NODISCARD constexpr bool operator==(const EntityLocation& other) const noexcept = default;
    };

    /**
     * Hands out entity handles and tracks, per slot, the current generation and where
     * the entity's row lives. Freed slots are recycled LIFO with a bumped generation so
     * handles to the previous occupant stop validating.
     */
    class EntityAllocator
    {
    public:
        using IndexType = Entity::IndexType;
        using GenerationType = Entity::GenerationType;

        EntityAllocator() = default;

        explicit EntityAllocator(std::size_t capacity)
        {
            Reserve(capacity);
        }

        STRATA_NODISCARD Entity Allocate()
        {
            if (!m_freeList.empty())
            {
                const IndexType index = m_freeList.back();
                m_freeList.pop_back();

                Slot& slot = m_slots[index];
                slot.alive = true;
                slot.location = EntityLocation{};
                ++m_alive;
                return Entity(index, slot.generation);
            }

            STRATA_ASSERT(m_slots.size() < Entity::INDEX_MASK, "Entity index space exhausted");
            const auto index = static_cast<IndexType>(m_slots.size());
            m_slots.push_back(Slot{0, EntityLocation{}, true});
            ++m_alive;
            return Entity(index, 0);
        }

        STRATA_NODISCARD Result<void, Error> Validate(Entity entity) const noexcept
        {
            if (!Contains(entity)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::EntityNotFound);
            }
            return {};
        }

        STRATA_NODISCARD bool Contains(Entity entity) const noexcept
        {
            const IndexType index = entity.GetIndex();
            if (index >= m_slots.size())
                return false;

            const Slot& slot = m_slots[index];
            return slot.alive && slot.generation == entity.GetGeneration();
        }

        Result<void, Error> Free(Entity entity)
        {
            if (auto valid = Validate(entity); !valid)
                return valid;

            Release(entity.GetIndex());
            return {};
        }

        // Frees a handle known to be live, for rolling back an allocation
        void Deallocate(Entity entity)
        {
            STRATA_ASSERT(Contains(entity), "Deallocating a dead entity");
            Release(entity.GetIndex());
        }

        STRATA_NODISCARD const EntityLocation& GetLocation(IndexType index) const noexcept
        {
            STRATA_ASSERT(index < m_slots.size(), "Entity index out of range");
            return m_slots[index].location;
        }

        void SetLocation(IndexType index, EntityLocation location) noexcept
        {
            STRATA_ASSERT(index < m_slots.size(), "Entity index out of range");
            m_slots[index].location = location;
        }

        void SetRow(IndexType index, std::uint32_t row) noexcept
        {
            STRATA_ASSERT(index < m_slots.size(), "Entity index out of range");
            m_slots[index].location.row = row;
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_alive; }
        STRATA_NODISCARD bool IsEmpty() const noexcept { return m_alive == 0; }
        STRATA_NODISCARD std::size_t Capacity() const noexcept { return m_slots.capacity(); }

        void Reserve(std::size_t capacity)
        {
            m_slots.reserve(capacity);
        }

        // Frees every live slot; outstanding handles become stale
        void Clear()
        {
            for (std::size_t i = 0; i < m_slots.size(); ++i)
            {
                if (m_slots[i].alive)
                    Release(static_cast<IndexType>(i));
            }
        }

    private:
        struct Slot
        {
            GenerationType generation;
            EntityLocation location;
            bool alive;
        };

        void Release(IndexType index)
        {
            Slot& slot = m_slots[index];
            // Wraps to 0 after 2^32 reuses of the same slot
            slot.generation = static_cast<GenerationType>(slot.generation + 1);
            slot.alive = false;
            slot.location = EntityLocation{};
            m_freeList.push_back(index);
            --m_alive;
        }

        std::vector<Slot> m_slots;
        std::vector<IndexType> m_freeList;
        std::size_t m_alive = 0;
    };
}
