#pragma once

#include <tuple>
#include <type_traits>

#include "Component.hpp"
#include "Signature.hpp"

namespace Strata
{
    class BuiltEntity;

    namespace Detail
    {
        template<typename... Ts>
        struct AreDistinct : std::true_type {};

        template<typename T, typename... Rest>
        struct AreDistinct<T, Rest...>
            : std::bool_constant<(!std::is_same_v<T, Rest> && ...) && AreDistinct<Rest...>::value> {};

        template<typename T>
        struct IsTuple : std::false_type {};

        template<typename... Ts>
        struct IsTuple<std::tuple<Ts...>> : std::true_type {};
    }

    template<typename... Ts>
    inline constexpr bool AreDistinct_v = Detail::AreDistinct<std::remove_cvref_t<Ts>...>::value;

    template<typename T>
    inline constexpr bool IsTuple_v = Detail::IsTuple<std::remove_cvref_t<T>>::value;

    // A static bundle is a pack of distinct component types, given directly or as a tuple
    template<typename... Ts>
    concept StaticBundle = ((Component<std::remove_cvref_t<Ts>> &&
                             !IsTuple_v<Ts> &&
                             !std::is_same_v<std::remove_cvref_t<Ts>, BuiltEntity>) && ...) &&
                           AreDistinct_v<Ts...>;

    template<typename... Ts>
    STRATA_NODISCARD inline Signature BundleSignature()
    {
        return Signature::Of<std::remove_cvref_t<Ts>...>();
    }
}
