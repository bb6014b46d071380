#pragma once

#include <cstdint>
#include <utility>

#include "../Archetype/Archetype.hpp"
#include "../Archetype/BorrowState.hpp"
#include "../Component/Signature.hpp"
#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "Ref.hpp"

namespace Strata
{
    /**
     * A resolved view of one live entity: its archetype and row, looked up once.
     * Holds a shared borrow of the archetype's entity column, so the row cannot be
     * moved or dropped by a structural change while the EntityRef lives.
     */
    class EntityRef
    {
    public:
        EntityRef(SharedBorrow borrow, Entity entity, Archetype& archetype, std::uint32_t row) noexcept :
            m_borrow(std::move(borrow)), m_entity(entity), m_archetype(&archetype), m_row(row)
        {}

        EntityRef(EntityRef&&) noexcept = default;
        EntityRef& operator=(EntityRef&&) noexcept = default;
        EntityRef(const EntityRef&) = delete;
        EntityRef& operator=(const EntityRef&) = delete;

        STRATA_NODISCARD Entity GetEntity() const noexcept { return m_entity; }
        STRATA_NODISCARD const Signature& GetSignature() const noexcept { return m_archetype->GetSignature(); }

        template<typename T>
        STRATA_NODISCARD bool Has() const noexcept
        {
            return m_archetype->Has<T>();
        }

        template<typename T>
        STRATA_NODISCARD Result<Ref<T>, Error> Get() const
        {
            Column* column = m_archetype->GetColumn(TypeID<T>::Value());
            if (!column) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentMissing);
            }

            auto borrow = SharedBorrow::TryAcquire(column->Borrow());
            if (!borrow) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }
            return Ref<T>(std::move(borrow), column->Data<T>() + m_row);
        }

        template<typename T>
        STRATA_NODISCARD Result<RefMut<T>, Error> GetMut() const
        {
            Column* column = m_archetype->GetColumn(TypeID<T>::Value());
            if (!column) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentMissing);
            }

            auto borrow = ExclusiveBorrow::TryAcquire(column->Borrow());
            if (!borrow) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }
            return RefMut<T>(std::move(borrow), column->Data<T>() + m_row);
        }

    private:
        SharedBorrow m_borrow;
        Entity m_entity;
        Archetype* m_archetype;
        std::uint32_t m_row;
    };
}
