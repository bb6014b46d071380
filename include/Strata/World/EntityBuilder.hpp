#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Component/Signature.hpp"
#include "../Core/Base.hpp"
#include "../Core/Memory.hpp"
#include "../Core/TypeID.hpp"

namespace Strata
{
    namespace Detail
    {
        // One type-erased value owned by a dynamic bundle
        struct BundleEntry
        {
            ComponentDescriptor descriptor;
            void* data = nullptr;
        };

        inline void DestroyEntries(std::vector<BundleEntry>& entries) noexcept
        {
            for (BundleEntry& entry : entries)
            {
                entry.descriptor.Destruct(entry.data);
                AlignedFree(entry.data, entry.descriptor.alignment);
            }
            entries.clear();
        }
    }

    /**
     * A finished dynamic bundle, consumed by World::Spawn or World::Insert.
     * The world move-constructs each value out; the entries themselves are destroyed
     * when the BuiltEntity goes away.
     */
    class BuiltEntity
    {
    public:
        BuiltEntity() = default;

        BuiltEntity(BuiltEntity&& other) noexcept : m_entries(std::move(other.m_entries))
        {
            other.m_entries.clear();
        }

        BuiltEntity& operator=(BuiltEntity&& other) noexcept
        {
            if (this != &other)
            {
                Detail::DestroyEntries(m_entries);
                m_entries = std::move(other.m_entries);
                other.m_entries.clear();
            }
            return *this;
        }

        BuiltEntity(const BuiltEntity&) = delete;
        BuiltEntity& operator=(const BuiltEntity&) = delete;

        ~BuiltEntity()
        {
            Detail::DestroyEntries(m_entries);
        }

        STRATA_NODISCARD Signature GetSignature() const
        {
            std::vector<ComponentID> ids;
            ids.reserve(m_entries.size());
            for (const auto& entry : m_entries)
            {
                ids.push_back(entry.descriptor.id);
            }
            return Signature(std::move(ids));
        }

        STRATA_NODISCARD const std::vector<Detail::BundleEntry>& Entries() const noexcept { return m_entries; }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entries.size(); }
        STRATA_NODISCARD bool IsEmpty() const noexcept { return m_entries.empty(); }

    private:
        friend class EntityBuilder;

        explicit BuiltEntity(std::vector<Detail::BundleEntry>&& entries) noexcept : m_entries(std::move(entries)) {}

        std::vector<Detail::BundleEntry> m_entries;
    };

    /**
     * Dynamic bundle assembled one component at a time, for when the set of types is only
     * known at runtime. Adding a type that is already present replaces the earlier value.
     *
     * Usage:
     *   EntityBuilder builder;
     *   builder.Add(Position{1, 2}).Add(Velocity{3, 4});
     *   auto entity = world.Spawn(builder.Build());
     */
    class EntityBuilder
    {
    public:
        EntityBuilder() = default;

        EntityBuilder(EntityBuilder&& other) noexcept : m_entries(std::move(other.m_entries))
        {
            other.m_entries.clear();
        }

        EntityBuilder& operator=(EntityBuilder&& other) noexcept
        {
            if (this != &other)
            {
                Detail::DestroyEntries(m_entries);
                m_entries = std::move(other.m_entries);
                other.m_entries.clear();
            }
            return *this;
        }

        EntityBuilder(const EntityBuilder&) = delete;
        EntityBuilder& operator=(const EntityBuilder&) = delete;

        ~EntityBuilder()
        {
            Detail::DestroyEntries(m_entries);
        }

        template<typename T>
        EntityBuilder& Add(T&& value)
        {
            using Type = std::remove_cvref_t<T>;
            static_assert(Component<Type>, "EntityBuilder only stores valid components");

            const ComponentID id = TypeID<Type>::Value();
            for (Detail::BundleEntry& entry : m_entries)
            {
                if (entry.descriptor.id == id)
                {
                    Type* existing = std::launder(static_cast<Type*>(entry.data));
                    existing->~Type();
                    ::new (entry.data) Type(std::forward<T>(value));
                    return *this;
                }
            }

            m_entries.reserve(m_entries.size() + 1);

            Detail::BundleEntry entry;
            entry.descriptor = ComponentDescriptor::Of<Type>();
            entry.data = AlignedAllocate(sizeof(Type), alignof(Type));
            try
            {
                ::new (entry.data) Type(std::forward<T>(value));
            }
            catch (...)
            {
                AlignedFree(entry.data, alignof(Type));
                throw;
            }
            m_entries.push_back(entry);
            return *this;
        }

        template<typename T>
        STRATA_NODISCARD bool Has() const noexcept
        {
            const ComponentID id = TypeID<T>::Value();
            for (const auto& entry : m_entries)
            {
                if (entry.descriptor.id == id)
                    return true;
            }
            return false;
        }

        // Hands the collected values to a BuiltEntity; the builder is left empty for reuse
        STRATA_NODISCARD BuiltEntity Build() noexcept
        {
            BuiltEntity built(std::move(m_entries));
            m_entries.clear();
            return built;
        }

        void Clear() noexcept
        {
            Detail::DestroyEntries(m_entries);
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entries.size(); }
        STRATA_NODISCARD bool IsEmpty() const noexcept { return m_entries.empty(); }

    private:
        std::vector<Detail::BundleEntry> m_entries;
    };
}
