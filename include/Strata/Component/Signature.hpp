#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"

namespace Strata
{
    /**
     * Canonical set of component ids: sorted ascending and free of duplicates, so two
     * signatures built from the same types in any order compare and hash equal.
     */
    class Signature
    {
    public:
        using Iterator = std::vector<ComponentID>::const_iterator;

        Signature() = default;

        Signature(std::initializer_list<ComponentID> ids) : m_ids(ids)
        {
            Canonicalize();
        }

        explicit Signature(std::vector<ComponentID> ids) : m_ids(std::move(ids))
        {
            Canonicalize();
        }

        template<typename... Ts>
        STRATA_NODISCARD static Signature Of()
        {
            return Signature{TypeID<Ts>::Value()...};
        }

        STRATA_NODISCARD bool Contains(ComponentID id) const noexcept
        {
            return std::binary_search(m_ids.begin(), m_ids.end(), id);
        }

        STRATA_NODISCARD bool ContainsAll(const Signature& other) const noexcept
        {
            return std::includes(m_ids.begin(), m_ids.end(), other.m_ids.begin(), other.m_ids.end());
        }

        STRATA_NODISCARD bool ContainsAny(const Signature& other) const noexcept
        {
            auto a = m_ids.begin();
            auto b = other.m_ids.begin();
            while (a != m_ids.end() && b != other.m_ids.end())
            {
                if (*a == *b)
                    return true;
                if (*a < *b)
                    ++a;
                else
                    ++b;
            }
            return false;
        }

        // Position of id within the sorted set, which is also its column index in an archetype
        STRATA_NODISCARD std::optional<std::size_t> IndexOf(ComponentID id) const noexcept
        {
            auto it = std::lower_bound(m_ids.begin(), m_ids.end(), id);
            if (it == m_ids.end() || *it != id)
                return std::nullopt;
            return static_cast<std::size_t>(it - m_ids.begin());
        }

        STRATA_NODISCARD Signature Union(const Signature& other) const
        {
            Signature result;
            result.m_ids.reserve(m_ids.size() + other.m_ids.size());
            std::set_union(m_ids.begin(), m_ids.end(), other.m_ids.begin(), other.m_ids.end(),
                           std::back_inserter(result.m_ids));
            return result;
        }

        STRATA_NODISCARD Signature Intersection(const Signature& other) const
        {
            Signature result;
            std::set_intersection(m_ids.begin(), m_ids.end(), other.m_ids.begin(), other.m_ids.end(),
                                  std::back_inserter(result.m_ids));
            return result;
        }

        STRATA_NODISCARD Signature Difference(const Signature& other) const
        {
            Signature result;
            result.m_ids.reserve(m_ids.size());
            std::set_difference(m_ids.begin(), m_ids.end(), other.m_ids.begin(), other.m_ids.end(),
                                std::back_inserter(result.m_ids));
            return result;
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_ids.size(); }
        STRATA_NODISCARD bool IsEmpty() const noexcept { return m_ids.empty(); }
        STRATA_NODISCARD ComponentID operator[](std::size_t index) const noexcept { return m_ids[index]; }

        STRATA_NODISCARD Iterator begin() const noexcept { return m_ids.begin(); }
        STRATA_NODISCARD Iterator end() const noexcept { return m_ids.end(); }

        STRATA_NODISCARD bool operator==(const Signature& other) const noexcept = default;

        STRATA_NODISCARD std::size_t Hash() const noexcept
        {
            // FNV-1a over the sorted ids
            std::uint64_t hash = 0xcbf29ce484222325ULL;
            for (ComponentID id : m_ids)
            {
                hash ^= id;
                hash *= 0x100000001b3ULL;
            }
            return static_cast<std::size_t>(hash);
        }

    private:
        void Canonicalize()
        {
            std::sort(m_ids.begin(), m_ids.end());
            m_ids.erase(std::unique(m_ids.begin(), m_ids.end()), m_ids.end());
        }

        std::vector<ComponentID> m_ids;
    };

    struct SignatureHash
    {
        std::size_t operator()(const Signature& signature) const noexcept
        {
            return signature.Hash();
        }
    };
}
