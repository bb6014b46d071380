#pragma once

#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Strata
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    inline constexpr ErrorValue<Error> Err(ErrorCode code)
    {
        return ErrorValue<Error>(MakeError(code));
    }

    struct OkTag {};
    inline constexpr OkTag OK{};

    /**
     * Holds either a value of type T or an error of type E.
     * Move-only value types are supported; the copy operations only exist when both
     * alternatives are copyable. Value() and operator* on an rvalue Result return the
     * value itself rather than a reference into the expiring Result.
     */
    template<typename T, typename E>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        Result(const T& value) requires std::is_copy_constructible_v<T> : m_hasValue(true)
        {
            ::new (std::addressof(m_value)) T(value);
        }

        Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            ::new (std::addressof(m_value)) T(std::move(value));
        }

        Result(const ErrorValue<E>& err) : m_hasValue(false)
        {
            ::new (std::addressof(m_error)) E(err.value);
        }

        Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            ::new (std::addressof(m_error)) E(std::move(err.value));
        }

        Result(const Result& other) requires (std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                ::new (std::addressof(m_value)) T(other.m_value);
            else
                ::new (std::addressof(m_error)) E(other.m_error);
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                ::new (std::addressof(m_value)) T(std::move(other.m_value));
            else
                ::new (std::addressof(m_error)) E(std::move(other.m_error));
        }

        Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    ::new (std::addressof(m_value)) T(std::move(other.m_value));
                else
                    ::new (std::addressof(m_error)) E(std::move(other.m_error));
            }
            return *this;
        }

        Result& operator=(const Result& other) requires (std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
        {
            if (this != &other)
            {
                Result copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        ~Result()
        {
            Destroy();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        T& Value() &
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        const T& Value() const&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        T Value() &&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        E& Error() &
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        E&& Error() &&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return std::move(m_error);
        }

        T& operator*() & { return Value(); }
        const T& operator*() const& { return Value(); }
        T operator*() && { return std::move(*this).Value(); }

        T* operator->() noexcept
        {
            STRATA_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return std::addressof(m_value);
        }

        const T* operator->() const noexcept
        {
            STRATA_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return std::addressof(m_value);
        }

        template<typename U>
        [[nodiscard]] T ValueOr(U&& defaultValue) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(defaultValue));
        }

        template<typename U>
        [[nodiscard]] T ValueOr(U&& defaultValue) &&
        {
            return m_hasValue ? std::move(m_value) : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        void Destroy() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    m_value.~T();
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    m_error.~E();
            }
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept : m_hasValue(true) {}
        constexpr Result(OkTag) noexcept : m_hasValue(true) {}

        Result(const ErrorValue<E>& err) : m_hasValue(false)
        {
            ::new (std::addressof(m_error)) E(err.value);
        }

        Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            ::new (std::addressof(m_error)) E(std::move(err.value));
        }

        Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (!m_hasValue)
                ::new (std::addressof(m_error)) E(other.m_error);
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(other.m_hasValue)
        {
            if (!m_hasValue)
                ::new (std::addressof(m_error)) E(std::move(other.m_error));
        }

        Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    ::new (std::addressof(m_error)) E(other.m_error);
            }
            return *this;
        }

        Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    ::new (std::addressof(m_error)) E(std::move(other.m_error));
            }
            return *this;
        }

        ~Result()
        {
            Destroy();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        void Value() const { STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error"); }

        E& Error() &
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        void Destroy() noexcept
        {
            if (!m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    m_error.~E();
            }
        }

        union
        {
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename T, typename E>
    [[nodiscard]] bool operator==(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return lhs.IsErr() && lhs.Error() == rhs.value;
    }

    inline Result<void, Error> Ok()
    {
        return Result<void, Error>();
    }

    template<typename T>
    inline auto Ok(T&& value) -> Result<std::decay_t<T>, Error>
    {
        return Result<std::decay_t<T>, Error>(std::forward<T>(value));
    }
}
