#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Archetype/Archetype.hpp"
#include "../Archetype/BorrowState.hpp"
#include "../Component/Bundle.hpp"
#include "../Component/Component.hpp"
#include "../Component/Signature.hpp"
#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"

namespace Strata
{
    // Query modifier types
    template<typename T>
    struct Optional
    {
        static_assert(Component<T>, "Optional can only be used with valid components");
    };

    template<typename T>
    struct With
    {
        static_assert(Component<T>, "With can only be used with valid components");
    };

    template<typename T>
    struct Not
    {
        static_assert(Component<T>, "Not can only be used with valid components");
    };

    namespace Detail
    {
        /**
         * Describes how one query argument matches, borrows and yields.
         * The primary template is a required component: `T` yields T& under an exclusive
         * borrow, `const T` yields const T& under a shared borrow.
         */
        template<typename Arg>
        struct QueryTerm
        {
            using ComponentType = std::remove_const_t<Arg>;
            using Fetch = Arg*;
            using Yield = std::tuple<Arg&>;

            static constexpr bool IsRequired = true;
            static constexpr bool IsExcluded = false;
            static constexpr bool IsBorrowed = true;
            static constexpr bool IsExclusive = !std::is_const_v<Arg>;

            static Fetch Prepare(Archetype& archetype) noexcept
            {
                return archetype.GetColumn(TypeID<ComponentType>::Value())->template Data<ComponentType>();
            }

            static Yield At(Fetch base, std::size_t row) noexcept
            {
                return Yield(base[row]);
            }
        };

        template<typename T>
        struct QueryTerm<Optional<T>>
        {
            using ComponentType = std::remove_const_t<T>;
            using Fetch = T*;
            using Yield = std::tuple<T*>;

            static constexpr bool IsRequired = false;
            static constexpr bool IsExcluded = false;
            static constexpr bool IsBorrowed = true;
            static constexpr bool IsExclusive = !std::is_const_v<T>;

            static Fetch Prepare(Archetype& archetype) noexcept
            {
                Column* column = archetype.GetColumn(TypeID<ComponentType>::Value());
                return column ? column->template Data<ComponentType>() : nullptr;
            }

            static Yield At(Fetch base, std::size_t row) noexcept
            {
                return Yield(base ? base + row : nullptr);
            }
        };

        template<typename T>
        struct QueryTerm<With<T>>
        {
            using ComponentType = std::remove_const_t<T>;
            using Fetch = std::nullptr_t;
            using Yield = std::tuple<>;

            static constexpr bool IsRequired = true;
            static constexpr bool IsExcluded = false;
            static constexpr bool IsBorrowed = false;
            static constexpr bool IsExclusive = false;

            static Fetch Prepare(Archetype&) noexcept { return nullptr; }
            static Yield At(Fetch, std::size_t) noexcept { return {}; }
        };

        template<typename T>
        struct QueryTerm<Not<T>>
        {
            using ComponentType = std::remove_const_t<T>;
            using Fetch = std::nullptr_t;
            using Yield = std::tuple<>;

            static constexpr bool IsRequired = false;
            static constexpr bool IsExcluded = true;
            static constexpr bool IsBorrowed = false;
            static constexpr bool IsExclusive = false;

            static Fetch Prepare(Archetype&) noexcept { return nullptr; }
            static Yield At(Fetch, std::size_t) noexcept { return {}; }
        };

        template<typename Arg>
        STRATA_NODISCARD inline bool AcquireTerm(Archetype& archetype,
                                                 std::vector<SharedBorrow>& shared,
                                                 std::vector<ExclusiveBorrow>& exclusive)
        {
            using Term = QueryTerm<Arg>;
            if constexpr (!Term::IsBorrowed)
            {
                return true;
            }
            else
            {
                Column* column = archetype.GetColumn(TypeID<typename Term::ComponentType>::Value());
                if (!column)
                    return !Term::IsRequired;

                if constexpr (Term::IsExclusive)
                {
                    auto borrow = ExclusiveBorrow::TryAcquire(column->Borrow());
                    if (!borrow)
                        return false;
                    exclusive.push_back(std::move(borrow));
                }
                else
                {
                    auto borrow = SharedBorrow::TryAcquire(column->Borrow());
                    if (!borrow)
                        return false;
                    shared.push_back(std::move(borrow));
                }
                return true;
            }
        }
    }

    /**
     * A live query: the archetypes matching Args, with every borrow the query needs
     * held until the QueryBorrow is destroyed.
     *
     * Iteration yields std::tuple<Entity, refs...> archetype by archetype, row by row.
     * `T` yields T&, `const T` yields const T&, Optional<T> yields T* (nullptr when the
     * entity lacks T), With<T> and Not<T> only filter.
     */
    template<typename... Args>
    class QueryBorrow
    {
        static_assert(AreDistinct_v<typename Detail::QueryTerm<Args>::ComponentType...>,
                      "A query may name each component type only once");

        using Fetches = std::tuple<typename Detail::QueryTerm<Args>::Fetch...>;

    public:
        using Item = decltype(std::tuple_cat(std::declval<std::tuple<Entity>>(),
                                             std::declval<typename Detail::QueryTerm<Args>::Yield>()...));

        class Iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Item;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = Item;

            Iterator() noexcept = default;

            Iterator(Archetype* const* archetypes, std::size_t count, std::size_t index) noexcept :
                m_archetypes(archetypes), m_count(count), m_index(index)
            {
                SkipEmpty();
            }

            STRATA_NODISCARD reference operator*() const noexcept
            {
                return Read(m_archetypes[m_index], m_fetches, m_row, std::index_sequence_for<Args...>{});
            }

            Iterator& operator++() noexcept
            {
                if (++m_row >= m_rows)
                {
                    ++m_index;
                    SkipEmpty();
                }
                return *this;
            }

            Iterator operator++(int) noexcept
            {
                Iterator copy = *this;
                ++(*this);
                return copy;
            }

            STRATA_NODISCARD bool operator==(const Iterator& other) const noexcept
            {
                return m_index == other.m_index && (m_index == m_count || m_row == other.m_row);
            }

        private:
            void SkipEmpty() noexcept
            {
                m_row = 0;
                while (m_index < m_count && m_archetypes[m_index]->IsEmpty())
                {
                    ++m_index;
                }

                if (m_index < m_count)
                {
                    m_rows = m_archetypes[m_index]->Size();
                    m_fetches = Prepare(*m_archetypes[m_index]);
                }
                else
                {
                    m_rows = 0;
                }
            }

            Archetype* const* m_archetypes = nullptr;
            std::size_t m_count = 0;
            std::size_t m_index = 0;
            std::size_t m_row = 0;
            std::size_t m_rows = 0;
            Fetches m_fetches{};
        };

        QueryBorrow(QueryBorrow&&) noexcept = default;
        QueryBorrow& operator=(QueryBorrow&&) noexcept = default;
        QueryBorrow(const QueryBorrow&) = delete;
        QueryBorrow& operator=(const QueryBorrow&) = delete;

        STRATA_NODISCARD static bool Matches(const Signature& signature)
        {
            static const Signature required = MakeSignature<true>();
            static const Signature excluded = MakeSignature<false>();
            return signature.ContainsAll(required) && !signature.ContainsAny(excluded);
        }

        /**
         * Collects the matching archetypes and takes every borrow the query needs.
         * On a conflict nothing stays borrowed and ComponentAlreadyBorrowed is returned.
         */
        STRATA_NODISCARD static Result<QueryBorrow, Error> Acquire(const std::vector<std::unique_ptr<Archetype>>& archetypes)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("QueryBorrow::Acquire", Profile::ColorQuery);

            QueryBorrow query;
            for (const auto& archetype : archetypes)
            {
                if (!Matches(archetype->GetSignature()))
                    continue;

                auto entityBorrow = SharedBorrow::TryAcquire(archetype->EntityBorrow());
                if (!entityBorrow)
                    return Err(ErrorCode::ComponentAlreadyBorrowed);
                query.m_shared.push_back(std::move(entityBorrow));

                const bool acquired = (Detail::AcquireTerm<Args>(*archetype, query.m_shared, query.m_exclusive) && ...);
                if (!acquired)
                    return Err(ErrorCode::ComponentAlreadyBorrowed);

                query.m_archetypes.push_back(archetype.get());
            }
            return std::move(query);
        }

        STRATA_NODISCARD Iterator begin() const noexcept
        {
            return Iterator(m_archetypes.data(), m_archetypes.size(), 0);
        }

        STRATA_NODISCARD Iterator end() const noexcept
        {
            return Iterator(m_archetypes.data(), m_archetypes.size(), m_archetypes.size());
        }

        // Invokes fn(Entity, refs...) for every matching entity
        template<typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (Archetype* archetype : m_archetypes)
            {
                const std::size_t rows = archetype->Size();
                if (rows == 0)
                    continue;

                Fetches fetches = Prepare(*archetype);
                for (std::size_t row = 0; row < rows; ++row)
                {
                    std::apply(fn, Read(archetype, fetches, row, std::index_sequence_for<Args...>{}));
                }
            }
        }

        STRATA_NODISCARD std::size_t Size() const noexcept
        {
            std::size_t count = 0;
            for (const Archetype* archetype : m_archetypes)
            {
                count += archetype->Size();
            }
            return count;
        }

        STRATA_NODISCARD bool IsEmpty() const noexcept { return Size() == 0; }

        STRATA_NODISCARD std::size_t ArchetypeCount() const noexcept { return m_archetypes.size(); }

    private:
        QueryBorrow() = default;

        template<bool Required>
        static Signature MakeSignature()
        {
            std::vector<ComponentID> ids;
            auto collect = [&ids]<typename Arg>()
            {
                using Term = Detail::QueryTerm<Arg>;
                if constexpr (Required ? Term::IsRequired : Term::IsExcluded)
                    ids.push_back(TypeID<typename Term::ComponentType>::Value());
            };
            (collect.template operator()<Args>(), ...);
            return Signature(std::move(ids));
        }

        static Fetches Prepare(Archetype& archetype) noexcept
        {
            return Fetches(Detail::QueryTerm<Args>::Prepare(archetype)...);
        }

        template<std::size_t... Is>
        static Item Read(const Archetype* archetype, const Fetches& fetches, std::size_t row, std::index_sequence<Is...>) noexcept
        {
            return std::tuple_cat(std::tuple<Entity>(archetype->GetEntity(row)),
                                  Detail::QueryTerm<Args>::At(std::get<Is>(fetches), row)...);
        }

        std::vector<Archetype*> m_archetypes;
        std::vector<SharedBorrow> m_shared;
        std::vector<ExclusiveBorrow> m_exclusive;
    };
}
