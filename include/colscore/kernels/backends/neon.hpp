#pragma once

#include "colscore/platform/compiler.hpp"

#if defined(COLSCORE_ARCH_ARM64)

/** \file neon.hpp
 *  \brief 4-wide NEON kernels (mandatory on AArch64).
 */

#include <arm_neon.h>
#include <cstddef>
#include <limits>
#include <span>
#include "colscore/kernels/dispatch.hpp"

namespace colscore::kernels {

namespace detail {

COLSCORE_ALWAYS_INLINE auto neon_dot_row(const float* pa, const float* pb, std::size_t n) noexcept -> float {
    float32x4_t acc0 = vdupq_n_f32(0.0f);
    float32x4_t acc1 = vdupq_n_f32(0.0f);
    float32x4_t acc2 = vdupq_n_f32(0.0f);
    float32x4_t acc3 = vdupq_n_f32(0.0f);
    std::size_t i = 0;

    for (; i + 16 <= n; i += 16) {
        acc0 = vfmaq_f32(acc0, vld1q_f32(pa + i), vld1q_f32(pb + i));
        acc1 = vfmaq_f32(acc1, vld1q_f32(pa + i + 4), vld1q_f32(pb + i + 4));
        acc2 = vfmaq_f32(acc2, vld1q_f32(pa + i + 8), vld1q_f32(pb + i + 8));
        acc3 = vfmaq_f32(acc3, vld1q_f32(pa + i + 12), vld1q_f32(pb + i + 12));
    }
    for (; i + 4 <= n; i += 4) {
        acc0 = vfmaq_f32(acc0, vld1q_f32(pa + i), vld1q_f32(pb + i));
    }

    float result = vaddvq_f32(vaddq_f32(vaddq_f32(acc0, acc1), vaddq_f32(acc2, acc3)));
    for (; i < n; ++i) {
        result += pa[i] * pb[i];
    }
    return result;
}

} // namespace detail

COLSCORE_HOT
inline auto neon_dot_product(std::span<const float> a, std::span<const float> b) noexcept -> float {
    return detail::neon_dot_row(a.data(), b.data(), a.size());
}

inline auto neon_squared_norm(std::span<const float> a) noexcept -> float {
    return detail::neon_dot_row(a.data(), a.data(), a.size());
}

COLSCORE_HOT
inline auto neon_max_dot_product(std::span<const float> query,
                                 const float* tokens, std::size_t ntokens,
                                 std::size_t dim) noexcept -> float {
    float best = -std::numeric_limits<float>::infinity();
    for (std::size_t t = 0; t < ntokens; ++t) {
        const float s = detail::neon_dot_row(query.data(), tokens + t * dim, dim);
        if (s > best) best = s;
    }
    return best;
}

inline const KernelOps& get_neon_ops() noexcept {
    static const KernelOps ops{
        "neon", 4,
        &neon_dot_product,
        &neon_squared_norm,
        &neon_max_dot_product
    };
    return ops;
}

} // namespace colscore::kernels

#endif // defined(COLSCORE_ARCH_ARM64)
