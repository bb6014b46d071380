#pragma once

#include <cstddef>
#include <cstring>
#include <new>

#include "Base.hpp"
#include "Config.hpp"
#include "Profile.hpp"

namespace Strata
{
    /**
     * Allocates a block of at least `size` bytes aligned to `alignment`.
     * Every column buffer and every type-erased bundle slot goes through this pair,
     * so substituting an allocator only touches this header.
     * Throws std::bad_alloc on exhaustion.
     */
    STRATA_NODISCARD inline void* AlignedAllocate(std::size_t size, std::size_t alignment)
    {
        STRATA_ASSERT(IsPowerOfTwo(alignment), "Alignment must be a power of two");
        if (size == 0)
            return nullptr;

        void* ptr = ::operator new(size, std::align_val_t{alignment});
        STRATA_PROFILE_ALLOC(ptr, size);
        return ptr;
    }

    inline void AlignedFree(void* ptr, std::size_t alignment) noexcept
    {
        if (!ptr)
            return;

        STRATA_PROFILE_FREE(ptr);
        ::operator delete(ptr, std::align_val_t{alignment});
    }

    STRATA_FORCEINLINE void MemoryCopy(void* dst, const void* src, std::size_t size) noexcept
    {
        std::memcpy(dst, src, size);
    }
}
