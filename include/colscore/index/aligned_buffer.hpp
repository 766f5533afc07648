#pragma once

/** \file aligned_buffer.hpp
 *  \brief Cache-aligned storage for packed token embeddings.
 *
 * Packed corpora and queries live in one contiguous, 64-byte aligned block so the
 * scoring loops stream rows without straddling cache lines at the buffer start.
 */

#include <cstddef>
#include <cstdlib>
#include <limits>
#include <new>
#include <vector>

#include "colscore/platform/compiler.hpp"

namespace colscore::index {

/** \brief Aligned memory allocator for SIMD operations. */
template<typename T, std::size_t Alignment = COLSCORE_CACHE_LINE_SIZE>
class AlignedAllocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    template<typename U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    AlignedAllocator() noexcept = default;

    template<typename U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) noexcept {}

    [[nodiscard]] auto allocate(size_type n) -> T* {
        if (n > std::numeric_limits<size_type>::max() / sizeof(T) - Alignment) {
            throw std::bad_array_new_length();
        }
        // aligned_alloc requires the size to be a multiple of the alignment
        void* ptr = std::aligned_alloc(Alignment, align_up(n * sizeof(T), Alignment));
        if (!ptr) {
            throw std::bad_alloc();
        }
        return static_cast<T*>(ptr);
    }

    auto deallocate(T* ptr, size_type) noexcept -> void {
        std::free(ptr);
    }

    template<typename U>
    auto operator==(const AlignedAllocator<U, Alignment>&) const noexcept -> bool {
        return true;
    }

private:
    static constexpr auto align_up(size_type n, size_type alignment) noexcept -> size_type {
        return (n + alignment - 1) & ~(alignment - 1);
    }
};

/** \brief Flat float storage with cache-line aligned base address. */
using AlignedFloatBuffer = std::vector<float, AlignedAllocator<float>>;

} // namespace colscore::index
