#pragma once

#include <cstdint>
#include <functional>

namespace Strata
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        EntityNotFound,
        ComponentMissing,
        ComponentAlreadyBorrowed,

        AllocationFailed,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator==(ErrorCode other) const noexcept
        {
            return code == other;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::EntityNotFound: return "Entity not found";
                case ErrorCode::ComponentMissing: return "Entity does not have the requested component";
                case ErrorCode::ComponentAlreadyBorrowed: return "Component is already borrowed";
                case ErrorCode::AllocationFailed: return "Allocation failed";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}

namespace std
{
    template<>
    struct hash<Strata::Error>
    {
        std::size_t operator()(const Strata::Error& e) const noexcept
        {
            return std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(e.code));
        }
    };
}
