#pragma once

#include <atomic>
#include <cstdint>
#include <utility>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * Runtime aliasing guard for one column: 0 when free, N > 0 while N shared borrows
     * are live, EXCLUSIVE while a single exclusive borrow is live.
     * Acquisition never blocks; a conflicting request simply fails.
     */
    class BorrowState
    {
    public:
        static constexpr std::int32_t FREE = 0;
        static constexpr std::int32_t EXCLUSIVE = -1;

        BorrowState() noexcept = default;
        BorrowState(const BorrowState&) = delete;
        BorrowState& operator=(const BorrowState&) = delete;

        STRATA_NODISCARD bool TryAcquireShared() noexcept
        {
            std::int32_t current = m_state.load(std::memory_order_relaxed);
            do
            {
                if (current == EXCLUSIVE) STRATA_UNLIKELY
                {
                    return false;
                }
            }
            while (!m_state.compare_exchange_weak(current, current + 1,
                                                  std::memory_order_acquire, std::memory_order_relaxed));
            return true;
        }

        STRATA_NODISCARD bool TryAcquireExclusive() noexcept
        {
            std::int32_t expected = FREE;
            return m_state.compare_exchange_strong(expected, EXCLUSIVE,
                                                   std::memory_order_acquire, std::memory_order_relaxed);
        }

        void ReleaseShared() noexcept
        {
            STRATA_ASSERT(m_state.load(std::memory_order_relaxed) > 0, "Releasing a shared borrow that is not held");
            m_state.fetch_sub(1, std::memory_order_release);
        }

        void ReleaseExclusive() noexcept
        {
            STRATA_ASSERT(m_state.load(std::memory_order_relaxed) == EXCLUSIVE, "Releasing an exclusive borrow that is not held");
            m_state.store(FREE, std::memory_order_release);
        }

        STRATA_NODISCARD bool IsFree() const noexcept { return m_state.load(std::memory_order_acquire) == FREE; }
        STRATA_NODISCARD bool IsExclusive() const noexcept { return m_state.load(std::memory_order_acquire) == EXCLUSIVE; }
        STRATA_NODISCARD std::int32_t SharedCount() const noexcept
        {
            const std::int32_t state = m_state.load(std::memory_order_acquire);
            return state > 0 ? state : 0;
        }

    private:
        std::atomic<std::int32_t> m_state{FREE};
    };

    namespace Detail
    {
        template<bool Exclusive>
        class ScopedBorrow
        {
        public:
            ScopedBorrow() noexcept = default;

            ScopedBorrow(ScopedBorrow&& other) noexcept : m_state(std::exchange(other.m_state, nullptr)) {}

            ScopedBorrow& operator=(ScopedBorrow&& other) noexcept
            {
                if (this != &other)
                {
                    Release();
                    m_state = std::exchange(other.m_state, nullptr);
                }
                return *this;
            }

            ScopedBorrow(const ScopedBorrow&) = delete;
            ScopedBorrow& operator=(const ScopedBorrow&) = delete;

            ~ScopedBorrow()
            {
                Release();
            }

            // Returns an engaged borrow on success, an empty one on conflict
            STRATA_NODISCARD static ScopedBorrow TryAcquire(BorrowState& state) noexcept
            {
                ScopedBorrow borrow;
                bool acquired;
                if constexpr (Exclusive)
                    acquired = state.TryAcquireExclusive();
                else
                    acquired = state.TryAcquireShared();

                if (acquired)
                    borrow.m_state = &state;
                return borrow;
            }

            void Release() noexcept
            {
                if (!m_state)
                    return;

                if constexpr (Exclusive)
                    m_state->ReleaseExclusive();
                else
                    m_state->ReleaseShared();
                m_state = nullptr;
            }

            STRATA_NODISCARD bool IsHeld() const noexcept { return m_state != nullptr; }
            STRATA_NODISCARD explicit operator bool() const noexcept { return IsHeld(); }

        private:
            BorrowState* m_state = nullptr;
        };
    }

    using SharedBorrow = Detail::ScopedBorrow<false>;
    using ExclusiveBorrow = Detail::ScopedBorrow<true>;
}
