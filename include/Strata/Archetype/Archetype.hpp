#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Component/Signature.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Profile.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "BorrowState.hpp"
#include "Column.hpp"

namespace Strata
{
    /**
     * Table of every entity that has exactly one signature.
     * Holds one Column per component id, in signature order, plus the entity column;
     * row i of every column belongs to m_entities[i].
     *
     * Rows are appended with AllocateRow followed by one Construct/PushMoved per column.
     * Removal is swap-remove, so rows are not stable: operations that move another
     * entity's row report it so the owner can update its location.
     */
    class Archetype
    {
    public:
        Archetype(Signature signature, const ComponentRegistry& registry) :
            m_signature(std::move(signature))
        {
            m_columns.reserve(m_signature.Size());
            for (ComponentID id : m_signature)
            {
                const ComponentDescriptor* desc = registry.Get(id);
                STRATA_ASSERT(desc != nullptr, "Component must be registered before its archetype is created");
                m_columns.push_back(std::make_unique<Column>(*desc));
            }
        }

        Archetype(const Archetype&) = delete;
        Archetype& operator=(const Archetype&) = delete;

        STRATA_NODISCARD const Signature& GetSignature() const noexcept { return m_signature; }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entities.size(); }
        STRATA_NODISCARD bool IsEmpty() const noexcept { return m_entities.empty(); }
        STRATA_NODISCARD std::size_t Capacity() const noexcept { return m_capacity; }
        STRATA_NODISCARD std::size_t ColumnCount() const noexcept { return m_columns.size(); }

        STRATA_NODISCARD bool Has(ComponentID id) const noexcept { return m_signature.Contains(id); }

        template<typename T>
        STRATA_NODISCARD bool Has() const noexcept { return Has(TypeID<T>::Value()); }

        STRATA_NODISCARD Column* GetColumn(ComponentID id) noexcept
        {
            auto index = m_signature.IndexOf(id);
            return index ? m_columns[*index].get() : nullptr;
        }

        STRATA_NODISCARD const Column* GetColumn(ComponentID id) const noexcept
        {
            auto index = m_signature.IndexOf(id);
            return index ? m_columns[*index].get() : nullptr;
        }

        STRATA_NODISCARD Column& ColumnAt(std::size_t index) noexcept { return *m_columns[index]; }

        STRATA_NODISCARD Entity GetEntity(std::size_t row) const noexcept
        {
            STRATA_ASSERT(row < m_entities.size(), "Row out of range");
            return m_entities[row];
        }

        STRATA_NODISCARD const std::vector<Entity>& GetEntities() const noexcept { return m_entities; }

        STRATA_NODISCARD BorrowState& EntityBorrow() noexcept { return m_entityBorrow; }

        template<typename T>
        STRATA_NODISCARD std::remove_const_t<T>& Get(std::size_t row) noexcept
        {
            using Type = std::remove_const_t<T>;
            Column* column = GetColumn(TypeID<Type>::Value());
            STRATA_ASSERT(column != nullptr, "Archetype does not store this component");
            STRATA_ASSERT(row < column->Size(), "Row out of range");
            return column->Data<Type>()[row];
        }

        // Reserves space for one more row and records its entity; the caller fills every column next
        std::uint32_t AllocateRow(Entity entity)
        {
            const std::size_t row = m_entities.size();
            if (row == m_capacity) STRATA_UNLIKELY
            {
                Grow(NextCapacity(m_capacity, row + 1));
            }
            m_entities.push_back(entity);
            return static_cast<std::uint32_t>(row);
        }

        // Used once every column of a freshly allocated row is filled
        void SetEntity(std::uint32_t row, Entity entity) noexcept
        {
            STRATA_ASSERT(row < m_entities.size(), "Row out of range");
            m_entities[row] = entity;
        }

        /**
         * Undoes AllocateRow for the last row while it is still being filled: cells already
         * constructed in it are destroyed and the row is dropped.
         */
        void AbandonRow(std::uint32_t row) noexcept
        {
            STRATA_ASSERT(row + 1 == m_entities.size(), "Only the last row can be abandoned");
            for (auto& column : m_columns)
            {
                if (column->Size() > row)
                    column->PopBack();
            }
            m_entities.pop_back();
        }

        template<typename T>
        void Construct(std::uint32_t row, T&& value)
        {
            using Type = std::remove_cvref_t<T>;
            Column* column = GetColumn(TypeID<Type>::Value());
            STRATA_ASSERT(column != nullptr, "Archetype does not store this component");
            STRATA_ASSERT(column->Size() == row, "Columns out of step with the row being filled");
            STRATA_UNUSED(row);
            column->Emplace<Type>(std::forward<T>(value));
        }

        // Type-erased Construct: move-constructs the new cell from src
        void ConstructFrom(std::uint32_t row, ComponentID id, void* src)
        {
            Column* column = GetColumn(id);
            STRATA_ASSERT(column != nullptr, "Archetype does not store this component");
            STRATA_ASSERT(column->Size() == row, "Columns out of step with the row being filled");
            STRATA_UNUSED(row);
            column->PushMoved(src);
        }

        template<typename T>
        void Overwrite(std::uint32_t row, T&& value)
        {
            using Type = std::remove_cvref_t<T>;
            Type* cell = std::addressof(Get<Type>(row));
            cell->~Type();
            ::new (cell) Type(std::forward<T>(value));
        }

        void Overwrite(std::uint32_t row, ComponentID id, void* src)
        {
            Column* column = GetColumn(id);
            STRATA_ASSERT(column != nullptr, "Archetype does not store this component");
            column->Overwrite(row, src);
        }

        // Moves a value out of its cell and ends the cell's lifetime; the row must then leave via MigrateRow
        template<typename T>
        STRATA_NODISCARD T Take(std::uint32_t row)
        {
            Column* column = GetColumn(TypeID<T>::Value());
            STRATA_ASSERT(column != nullptr, "Archetype does not store this component");
            T value = std::move(column->Data<T>()[row]);
            column->DestroyAt(row);
            return value;
        }

        /**
         * Drops every value of `row` and fills the hole with the last row.
         * @return The entity that was relocated into `row`, if any
         */
        std::optional<Entity> SwapRemove(std::uint32_t row)
        {
            STRATA_ASSERT(row < m_entities.size(), "Row out of range");
            for (auto& column : m_columns)
            {
                column->SwapRemove(row);
            }
            return FillEntityHole(row);
        }

        /**
         * Moves the values of `row` into `targetRow` of `target`, which the caller has
         * already allocated. Columns shared with the target are relocated, columns the
         * target lacks are destroyed, and ids in `consumed` are skipped because the caller
         * already moved or destroyed those cells. Target columns not filled here are
         * populated by the caller afterwards.
         * @return The entity that was relocated into `row` of this archetype, if any
         */
        std::optional<Entity> MigrateRow(std::uint32_t row, Archetype& target, std::uint32_t targetRow, const Signature& consumed)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("Archetype::MigrateRow", Profile::ColorMigration);
            STRATA_ASSERT(row < m_entities.size(), "Row out of range");
            STRATA_ASSERT(targetRow < target.Size(), "Target row has not been allocated");
            STRATA_UNUSED(targetRow);

            for (std::size_t i = 0; i < m_columns.size(); ++i)
            {
                Column& column = *m_columns[i];
                const ComponentID id = column.GetID();
                if (consumed.Contains(id))
                    continue;

                if (Column* destination = target.GetColumn(id))
                {
                    STRATA_ASSERT(destination->Size() == targetRow, "Target columns out of step");
                    destination->PushMoved(column.At(row));
                }
                column.DestroyAt(row);
            }

            for (auto& column : m_columns)
            {
                column->FillHole(row);
            }
            return FillEntityHole(row);
        }

        void Reserve(std::size_t additional)
        {
            const std::size_t required = m_entities.size() + additional;
            if (required > m_capacity)
                Grow(NextCapacity(m_capacity, required));
        }

        // Drops every row; capacity is kept
        void Clear() noexcept
        {
            for (auto& column : m_columns)
            {
                column->Clear();
            }
            m_entities.clear();
        }

        // All-or-nothing exclusive borrow of the entity column and every component column
        STRATA_NODISCARD bool TryLockExclusive(std::vector<ExclusiveBorrow>& borrows)
        {
            const std::size_t mark = borrows.size();
            auto entityBorrow = ExclusiveBorrow::TryAcquire(m_entityBorrow);
            if (!entityBorrow)
                return false;
            borrows.push_back(std::move(entityBorrow));

            for (auto& column : m_columns)
            {
                auto borrow = ExclusiveBorrow::TryAcquire(column->Borrow());
                if (!borrow)
                {
                    borrows.resize(mark);
                    return false;
                }
                borrows.push_back(std::move(borrow));
            }
            return true;
        }

    private:
        void Grow(std::size_t capacity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("Archetype::Grow", Profile::ColorMemory);
            for (auto& column : m_columns)
            {
                column->Reserve(capacity);
            }
            m_entities.reserve(capacity);
            m_capacity = capacity;
        }

        std::optional<Entity> FillEntityHole(std::uint32_t row)
        {
            const std::size_t last = m_entities.size() - 1;
            std::optional<Entity> moved;
            if (row != last)
            {
                m_entities[row] = m_entities[last];
                moved = m_entities[row];
            }
            m_entities.pop_back();
            return moved;
        }

        Signature m_signature;
        std::vector<std::unique_ptr<Column>> m_columns;
        std::vector<Entity> m_entities;
        BorrowState m_entityBorrow;
        std::size_t m_capacity = 0;
    };
}
