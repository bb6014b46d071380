#pragma once

#include <cstddef>
#include <unordered_map>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Strata
{
    /**
     * Per-world table of component descriptors, filled as types are first seen.
     * Archetypes look up the descriptors for their signature here when they are created.
     */
    class ComponentRegistry
    {
    public:
        template<Component T>
        const ComponentDescriptor& Register()
        {
            const ComponentID id = TypeID<T>::Value();
            auto it = m_descriptors.find(id);
            if (it != m_descriptors.end())
                return it->second;

            return m_descriptors.emplace(id, ComponentDescriptor::Of<T>()).first->second;
        }

        template<Component... Ts>
        void RegisterAll()
        {
            (Register<Ts>(), ...);
        }

        const ComponentDescriptor& Register(const ComponentDescriptor& desc)
        {
            STRATA_ASSERT(desc.id != INVALID_COMPONENT, "Registering descriptor without an id");
            return m_descriptors.try_emplace(desc.id, desc).first->second;
        }

        STRATA_NODISCARD const ComponentDescriptor* Get(ComponentID id) const
        {
            auto it = m_descriptors.find(id);
            return it != m_descriptors.end() ? &it->second : nullptr;
        }

        STRATA_NODISCARD bool Contains(ComponentID id) const
        {
            return m_descriptors.contains(id);
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_descriptors.size(); }

    private:
        std::unordered_map<ComponentID, ComponentDescriptor> m_descriptors;
    };
}
