#pragma once

#include <utility>

#include "../Archetype/BorrowState.hpp"
#include "../Core/Base.hpp"

namespace Strata
{
    // Shared access to one component value; the column stays shared-borrowed while the Ref lives
    template<typename T>
    class Ref
    {
    public:
        Ref(SharedBorrow borrow, const T* value) noexcept : m_borrow(std::move(borrow)), m_value(value) {}

        Ref(Ref&&) noexcept = default;
        Ref& operator=(Ref&&) noexcept = default;

        STRATA_NODISCARD const T& Get() const noexcept { return *m_value; }
        STRATA_NODISCARD const T& operator*() const noexcept { return *m_value; }
        STRATA_NODISCARD const T* operator->() const noexcept { return m_value; }

    private:
        SharedBorrow m_borrow;
        const T* m_value;
    };

    // Exclusive access to one component value; no other borrow of the column can be taken meanwhile
    template<typename T>
    class RefMut
    {
    public:
        RefMut(ExclusiveBorrow borrow, T* value) noexcept : m_borrow(std::move(borrow)), m_value(value) {}

        RefMut(RefMut&&) noexcept = default;
        RefMut& operator=(RefMut&&) noexcept = default;

        STRATA_NODISCARD T& Get() const noexcept { return *m_value; }
        STRATA_NODISCARD T& operator*() const noexcept { return *m_value; }
        STRATA_NODISCARD T* operator->() const noexcept { return m_value; }

    private:
        ExclusiveBorrow m_borrow;
        T* m_value;
    };
}
