#pragma once

#include "colscore/platform/compiler.hpp"

#if defined(COLSCORE_ARCH_X64)

/** \file sse.hpp
 *  \brief 4-wide SSE kernels (x86-64 baseline, no runtime check needed).
 *
 * Four independent __m128 accumulators cover 16 floats per iteration, followed by a
 * 4-wide step, a fixed reduction ((acc0 + acc1) + (acc2 + acc3)) and a scalar tail.
 */

#include <xmmintrin.h>
#include <cstddef>
#include <limits>
#include <span>
#include "colscore/kernels/dispatch.hpp"

namespace colscore::kernels {

namespace detail {

COLSCORE_ALWAYS_INLINE auto hsum128_ps(__m128 v) noexcept -> float {
    const __m128 shuf = _mm_shuffle_ps(v, v, _MM_SHUFFLE(2, 3, 0, 1));
    const __m128 sums = _mm_add_ps(v, shuf);
    const __m128 hi = _mm_movehl_ps(shuf, sums);
    return _mm_cvtss_f32(_mm_add_ss(sums, hi));
}

COLSCORE_ALWAYS_INLINE auto sse_dot_row(const float* pa, const float* pb, std::size_t n) noexcept -> float {
    __m128 acc0 = _mm_setzero_ps();
    __m128 acc1 = _mm_setzero_ps();
    __m128 acc2 = _mm_setzero_ps();
    __m128 acc3 = _mm_setzero_ps();
    std::size_t i = 0;

    for (; i + 16 <= n; i += 16) {
        acc0 = _mm_add_ps(acc0, _mm_mul_ps(_mm_loadu_ps(pa + i), _mm_loadu_ps(pb + i)));
        acc1 = _mm_add_ps(acc1, _mm_mul_ps(_mm_loadu_ps(pa + i + 4), _mm_loadu_ps(pb + i + 4)));
        acc2 = _mm_add_ps(acc2, _mm_mul_ps(_mm_loadu_ps(pa + i + 8), _mm_loadu_ps(pb + i + 8)));
        acc3 = _mm_add_ps(acc3, _mm_mul_ps(_mm_loadu_ps(pa + i + 12), _mm_loadu_ps(pb + i + 12)));
    }
    for (; i + 4 <= n; i += 4) {
        acc0 = _mm_add_ps(acc0, _mm_mul_ps(_mm_loadu_ps(pa + i), _mm_loadu_ps(pb + i)));
    }

    float result = hsum128_ps(_mm_add_ps(_mm_add_ps(acc0, acc1), _mm_add_ps(acc2, acc3)));
    for (; i < n; ++i) {
        result += pa[i] * pb[i];
    }
    return result;
}

} // namespace detail

COLSCORE_HOT
inline auto sse_dot_product(std::span<const float> a, std::span<const float> b) noexcept -> float {
    return detail::sse_dot_row(a.data(), b.data(), a.size());
}

inline auto sse_squared_norm(std::span<const float> a) noexcept -> float {
    return detail::sse_dot_row(a.data(), a.data(), a.size());
}

COLSCORE_HOT
inline auto sse_max_dot_product(std::span<const float> query,
                                const float* tokens, std::size_t ntokens,
                                std::size_t dim) noexcept -> float {
    float best = -std::numeric_limits<float>::infinity();
    for (std::size_t t = 0; t < ntokens; ++t) {
        const float* row = tokens + t * dim;
        if (t + 1 < ntokens) {
            COLSCORE_PREFETCH(row + dim);
        }
        const float s = detail::sse_dot_row(query.data(), row, dim);
        if (s > best) best = s;
    }
    return best;
}

inline const KernelOps& get_sse_ops() noexcept {
    static const KernelOps ops{
        "sse", 4,
        &sse_dot_product,
        &sse_squared_norm,
        &sse_max_dot_product
    };
    return ops;
}

} // namespace colscore::kernels

#endif // defined(COLSCORE_ARCH_X64)
