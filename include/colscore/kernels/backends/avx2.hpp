#pragma once

#include "colscore/platform/compiler.hpp"

#if defined(COLSCORE_ARCH_X64)

/** \file avx2.hpp
 *  \brief AVX2 + FMA kernels for MaxSim scoring.
 *
 * Features:
 * - 8-wide float FMA, two accumulators per row (16 floats per iteration)
 * - Four document rows per pass in max_dot_product, sharing each query load
 * - Per-function ISA target: callable only after cpu_features() reports AVX2 and FMA
 *
 * Row arithmetic is identical in avx2_dot_product and avx2_max_dot_product:
 * 16-wide main loop, one optional 8-wide step, (acc0 + acc1) reduction, scalar tail.
 * Thread-safety: pure functions, no shared state.
 */

#include <immintrin.h>
#include <cstddef>
#include <limits>
#include <span>
#include "colscore/kernels/dispatch.hpp"

namespace colscore::kernels {

namespace detail {

/** \brief Horizontal sum of 8 floats in an AVX register. */
COLSCORE_TARGET_AVX2 COLSCORE_ALWAYS_INLINE
auto hsum256_ps(__m256 v) noexcept -> float {
    const __m128 hi = _mm256_extractf128_ps(v, 1);
    const __m128 lo = _mm256_castps256_ps128(v);
    const __m128 sum = _mm_add_ps(hi, lo);
    const __m128 shuf = _mm_movehdup_ps(sum);
    const __m128 sums = _mm_add_ps(sum, shuf);
    const __m128 shuf2 = _mm_movehl_ps(sums, sums);
    const __m128 result = _mm_add_ss(sums, shuf2);
    return _mm_cvtss_f32(result);
}

COLSCORE_TARGET_AVX2 COLSCORE_ALWAYS_INLINE
auto avx2_dot_row(const float* pa, const float* pb, std::size_t n) noexcept -> float {
    __m256 acc0 = _mm256_setzero_ps();
    __m256 acc1 = _mm256_setzero_ps();
    std::size_t i = 0;

    for (; i + 16 <= n; i += 16) {
        acc0 = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i), acc0);
        acc1 = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i + 8), _mm256_loadu_ps(pb + i + 8), acc1);
    }
    if (i + 8 <= n) {
        acc0 = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i), acc0);
        i += 8;
    }

    float result = hsum256_ps(_mm256_add_ps(acc0, acc1));
    for (; i < n; ++i) {
        result += pa[i] * pb[i];
    }
    return result;
}

} // namespace detail

/** \brief AVX2 inner product. */
COLSCORE_TARGET_AVX2 COLSCORE_HOT
inline auto avx2_dot_product(std::span<const float> a, std::span<const float> b) noexcept -> float {
    return detail::avx2_dot_row(a.data(), b.data(), a.size());
}

/** \brief AVX2 squared norm. */
COLSCORE_TARGET_AVX2
inline auto avx2_squared_norm(std::span<const float> a) noexcept -> float {
    return detail::avx2_dot_row(a.data(), a.data(), a.size());
}

/** \brief AVX2 max dot product of one query token over row-major tokens.
 *
 * \param query Query token [dim]
 * \param tokens Document tokens [ntokens x dim]
 * \param ntokens Number of document tokens
 * \param dim Dimension
 * \return max_j query . tokens[j], or -inf when ntokens == 0
 */
COLSCORE_TARGET_AVX2 COLSCORE_HOT
inline auto avx2_max_dot_product(std::span<const float> query,
                                 const float* tokens, std::size_t ntokens,
                                 std::size_t dim) noexcept -> float {
    const float* q = query.data();
    float best = -std::numeric_limits<float>::infinity();

    // Four rows per pass: one query load feeds four FMAs
    std::size_t t = 0;
    for (; t + 4 <= ntokens; t += 4) {
        const float* r0 = tokens + t * dim;
        const float* r1 = r0 + dim;
        const float* r2 = r1 + dim;
        const float* r3 = r2 + dim;

        if (t + 8 <= ntokens) {
            COLSCORE_PREFETCH(r3 + dim);
        }

        __m256 a00 = _mm256_setzero_ps(), a01 = _mm256_setzero_ps();
        __m256 a10 = _mm256_setzero_ps(), a11 = _mm256_setzero_ps();
        __m256 a20 = _mm256_setzero_ps(), a21 = _mm256_setzero_ps();
        __m256 a30 = _mm256_setzero_ps(), a31 = _mm256_setzero_ps();

        std::size_t i = 0;
        for (; i + 16 <= dim; i += 16) {
            const __m256 q0 = _mm256_loadu_ps(q + i);
            const __m256 q1 = _mm256_loadu_ps(q + i + 8);

            a00 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r0 + i), a00);
            a01 = _mm256_fmadd_ps(q1, _mm256_loadu_ps(r0 + i + 8), a01);
            a10 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r1 + i), a10);
            a11 = _mm256_fmadd_ps(q1, _mm256_loadu_ps(r1 + i + 8), a11);
            a20 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r2 + i), a20);
            a21 = _mm256_fmadd_ps(q1, _mm256_loadu_ps(r2 + i + 8), a21);
            a30 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r3 + i), a30);
            a31 = _mm256_fmadd_ps(q1, _mm256_loadu_ps(r3 + i + 8), a31);
        }
        if (i + 8 <= dim) {
            const __m256 q0 = _mm256_loadu_ps(q + i);
            a00 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r0 + i), a00);
            a10 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r1 + i), a10);
            a20 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r2 + i), a20);
            a30 = _mm256_fmadd_ps(q0, _mm256_loadu_ps(r3 + i), a30);
            i += 8;
        }

        float s0 = detail::hsum256_ps(_mm256_add_ps(a00, a01));
        float s1 = detail::hsum256_ps(_mm256_add_ps(a10, a11));
        float s2 = detail::hsum256_ps(_mm256_add_ps(a20, a21));
        float s3 = detail::hsum256_ps(_mm256_add_ps(a30, a31));

        for (; i < dim; ++i) {
            const float qi = q[i];
            s0 += qi * r0[i];
            s1 += qi * r1[i];
            s2 += qi * r2[i];
            s3 += qi * r3[i];
        }

        if (s0 > best) best = s0;
        if (s1 > best) best = s1;
        if (s2 > best) best = s2;
        if (s3 > best) best = s3;
    }

    for (; t < ntokens; ++t) {
        const float s = detail::avx2_dot_row(q, tokens + t * dim, dim);
        if (s > best) best = s;
    }
    return best;
}

/** \brief Get AVX2 kernel operations table.
 *
 * Returns static singleton of kernel function pointers.
 */
inline const KernelOps& get_avx2_ops() noexcept {
    static const KernelOps ops{
        "avx2", 8,
        &avx2_dot_product,
        &avx2_squared_norm,
        &avx2_max_dot_product
    };
    return ops;
}

} // namespace colscore::kernels

#endif // defined(COLSCORE_ARCH_X64)
