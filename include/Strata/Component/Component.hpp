#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Memory.hpp"
#include "../Core/TypeID.hpp"

namespace Strata
{
    // Any movable, non-throwing-destructible object type can be stored in a column
    template<typename T>
    concept Component = std::is_object_v<std::remove_const_t<T>> &&
                        !std::is_array_v<std::remove_const_t<T>> &&
                        std::is_move_constructible_v<std::remove_const_t<T>> &&
                        std::is_nothrow_destructible_v<std::remove_const_t<T>>;

    /**
     * Type-erased description of a component type.
     * Columns and dynamic bundles hold one of these to construct, relocate and destroy
     * values without knowing the static type.
     */
    struct ComponentDescriptor
    {
        using DestructFn = void(void*);
        using MoveConstructFn = void(void*, void*);

        ComponentID id = INVALID_COMPONENT;
        std::size_t size = 0;
        std::size_t alignment = 1;
        std::string_view name;

        bool is_trivially_copyable = false;
        bool is_empty = false;

        DestructFn* destruct = nullptr;
        MoveConstructFn* moveConstruct = nullptr;

        template<Component T>
        STRATA_NODISCARD static ComponentDescriptor Of()
        {
            using Type = std::remove_const_t<T>;

            ComponentDescriptor desc;
            desc.id = TypeID<Type>::Value();
            desc.size = sizeof(Type);
            desc.alignment = alignof(Type);
            desc.name = TypeID<Type>::Name();
            desc.is_trivially_copyable = std::is_trivially_copyable_v<Type>;
            desc.is_empty = std::is_empty_v<Type>;
            desc.destruct = &DestructImpl<Type>;
            desc.moveConstruct = &MoveConstructImpl<Type>;
            return desc;
        }

        inline void MoveConstruct(void* dst, void* src) const
        {
            if (is_trivially_copyable) STRATA_LIKELY
            {
                MemoryCopy(dst, src, size);
            }
            else
            {
                moveConstruct(dst, src);
            }
        }

        inline void Destruct(void* ptr) const noexcept
        {
            if (!is_trivially_copyable)
                destruct(ptr);
        }

        // Move-constructs into dst, then ends the lifetime of src
        inline void Relocate(void* dst, void* src) const
        {
            MoveConstruct(dst, src);
            Destruct(src);
        }

    private:
        template<typename T>
        static void DestructImpl(void* ptr)
        {
            static_cast<T*>(ptr)->~T();
        }

        template<typename T>
        static void MoveConstructImpl(void* dst, void* src)
        {
            ::new (dst) T(std::move(*static_cast<T*>(src)));
        }
    };
}
