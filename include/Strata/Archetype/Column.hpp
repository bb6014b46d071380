#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Memory.hpp"
#include "BorrowState.hpp"

namespace Strata
{
    /**
     * Contiguous, type-erased storage for one component type inside an archetype.
     * Cells [0, Size()) are live. Growth relocates every live cell into the new buffer.
     */
    class Column
    {
    public:
        explicit Column(const ComponentDescriptor& descriptor) noexcept : m_descriptor(descriptor) {}

        ~Column()
        {
            Clear();
            AlignedFree(m_data, m_descriptor.alignment);
        }

        Column(const Column&) = delete;
        Column& operator=(const Column&) = delete;
        Column(Column&&) = delete;
        Column& operator=(Column&&) = delete;

        void Reserve(std::size_t capacity)
        {
            if (capacity <= m_capacity)
                return;

            auto* newData = static_cast<std::byte*>(AlignedAllocate(capacity * m_descriptor.size, m_descriptor.alignment));
            for (std::size_t i = 0; i < m_size; ++i)
            {
                m_descriptor.Relocate(newData + i * m_descriptor.size, CellAt(i));
            }

            AlignedFree(m_data, m_descriptor.alignment);
            m_data = newData;
            m_capacity = capacity;
        }

        template<typename T, typename... Args>
        T& Emplace(Args&&... args)
        {
            STRATA_ASSERT(TypeID<T>::Value() == m_descriptor.id, "Column type mismatch");
            STRATA_ASSERT(m_size < m_capacity, "Column is full");
            T* value = ::new (CellAt(m_size)) T(std::forward<Args>(args)...);
            ++m_size;
            return *value;
        }

        // Appends a cell move-constructed from src; src stays alive and is owned by the caller
        void PushMoved(void* src)
        {
            STRATA_ASSERT(m_size < m_capacity, "Column is full");
            m_descriptor.MoveConstruct(CellAt(m_size), src);
            ++m_size;
        }

        void Overwrite(std::size_t row, void* src)
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            m_descriptor.Destruct(CellAt(row));
            m_descriptor.MoveConstruct(CellAt(row), src);
        }

        // Ends the lifetime of one cell without closing the gap; follow with FillHole
        void DestroyAt(std::size_t row) noexcept
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            m_descriptor.Destruct(CellAt(row));
        }

        // Closes the gap left by a dead cell by relocating the last cell into it
        void FillHole(std::size_t row)
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            const std::size_t last = m_size - 1;
            if (row != last)
            {
                m_descriptor.Relocate(CellAt(row), CellAt(last));
            }
            --m_size;
        }

        // Drops the last cell
        void PopBack() noexcept
        {
            STRATA_ASSERT(m_size > 0, "Column is empty");
            --m_size;
            m_descriptor.Destruct(CellAt(m_size));
        }

        void SwapRemove(std::size_t row)
        {
            DestroyAt(row);
            FillHole(row);
        }

        void Clear() noexcept
        {
            if (!m_descriptor.is_trivially_copyable)
            {
                for (std::size_t i = 0; i < m_size; ++i)
                {
                    m_descriptor.Destruct(CellAt(i));
                }
            }
            m_size = 0;
        }

        STRATA_NODISCARD void* At(std::size_t row) noexcept
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            return CellAt(row);
        }

        STRATA_NODISCARD const void* At(std::size_t row) const noexcept
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            return m_data + row * m_descriptor.size;
        }

        template<typename T>
        STRATA_NODISCARD T* Data() noexcept
        {
            STRATA_ASSERT(TypeID<T>::Value() == m_descriptor.id, "Column type mismatch");
            return std::launder(reinterpret_cast<std::remove_const_t<T>*>(m_data));
        }

        template<typename T>
        STRATA_NODISCARD const T* Data() const noexcept
        {
            STRATA_ASSERT(TypeID<T>::Value() == m_descriptor.id, "Column type mismatch");
            return std::launder(reinterpret_cast<const std::remove_const_t<T>*>(m_data));
        }

        STRATA_NODISCARD const ComponentDescriptor& Descriptor() const noexcept { return m_descriptor; }
        STRATA_NODISCARD ComponentID GetID() const noexcept { return m_descriptor.id; }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_size; }
        STRATA_NODISCARD std::size_t Capacity() const noexcept { return m_capacity; }
        STRATA_NODISCARD BorrowState& Borrow() noexcept { return m_borrow; }

    private:
        std::byte* CellAt(std::size_t row) noexcept
        {
            return m_data + row * m_descriptor.size;
        }

        ComponentDescriptor m_descriptor;
        std::byte* m_data = nullptr;
        std::size_t m_size = 0;
        std::size_t m_capacity = 0;
        BorrowState m_borrow;
    };
}
