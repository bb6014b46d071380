#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "Base.hpp"

namespace Strata
{
    using ComponentID = std::uint32_t;

    inline constexpr ComponentID INVALID_COMPONENT = ~ComponentID(0);

    namespace Detail
    {
        template<typename T>
        constexpr std::string_view ExtractTypeName() noexcept
        {
            #if defined(STRATA_COMPILER_MSVC)
                constexpr std::string_view funcName = __FUNCSIG__;
                constexpr std::string_view prefix = "ExtractTypeName<";
                constexpr std::string_view suffix = ">(void)";
            #elif defined(STRATA_COMPILER_CLANG)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "ExtractTypeName() [T = ";
                constexpr std::string_view suffix = "]";
            #elif defined(STRATA_COMPILER_GCC)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "ExtractTypeName() [with T = ";
                constexpr std::string_view suffix = "]";
            #else
                #error "Unsupported compiler for compile-time type name extraction"
            #endif

            std::size_t start = funcName.find(prefix);
            if (start == std::string_view::npos)
                return "Unknown";
            start += prefix.length();

            std::size_t end = funcName.rfind(suffix);
            if (end == std::string_view::npos || end <= start)
                return "Unknown";

            std::string_view name = funcName.substr(start, end - start);

            #if defined(STRATA_COMPILER_MSVC)
                if (name.starts_with("class "))
                    name.remove_prefix(6);
                else if (name.starts_with("struct "))
                    name.remove_prefix(7);
            #endif

            return name;
        }

        // Ids are handed out in first-use order and are only stable within one process
        class TypeIDCounter
        {
        public:
            STRATA_NODISCARD static ComponentID Next() noexcept
            {
                return s_next.fetch_add(1, std::memory_order_relaxed);
            }

        private:
            inline static std::atomic<ComponentID> s_next{0};
        };
    }

    template<typename T>
    struct TypeID
    {
        using Type = std::remove_cvref_t<T>;

        STRATA_NODISCARD static ComponentID Value() noexcept
        {
            if constexpr (std::is_same_v<Type, T>)
            {
                static const ComponentID s_id = Detail::TypeIDCounter::Next();
                return s_id;
            }
            else
            {
                return TypeID<Type>::Value();
            }
        }

        STRATA_NODISCARD static constexpr std::string_view Name() noexcept
        {
            return Detail::ExtractTypeName<Type>();
        }
    };
}
