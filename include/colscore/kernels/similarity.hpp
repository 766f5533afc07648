#pragma once

/** \file similarity.hpp
 *  \brief Scalar reference similarity kernels (dot product, squared norm, row max).
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * - For MaxSim semantics, vectors are L2-normalized by the caller so that the dot
 *   product equals cosine similarity. This is never checked here.
 * Determinism: pure functions, fixed summation order (four interleaved partial sums,
 * then the remainder), no allocations, no exceptions.
 */

#include <cstddef>
#include <limits>
#include <span>

#include "colscore/platform/compiler.hpp"

namespace colscore::kernels {

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float dot_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* COLSCORE_RESTRICT pa = a.data();
  const float* COLSCORE_RESTRICT pb = b.data();

  // 4-way unrolled loop, independent accumulators
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      COLSCORE_PREFETCH(pa + i + 16);
      COLSCORE_PREFETCH(pb + i + 16);
    }

    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = (s0 + s1) + (s2 + s3);

  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Squared Euclidean norm: sum(a[i]^2). O(d). */
inline float squared_norm(std::span<const float> a) noexcept {
  return dot_product(a, a);
}

/** \brief Max over rows j < ntokens of dot_product(query, tokens[j]).
 *
 * Rows are row-major with stride dim. Returns -inf when ntokens == 0.
 */
inline float max_dot_product(std::span<const float> query, const float* tokens,
                             std::size_t ntokens, std::size_t dim) noexcept {
  float best = -std::numeric_limits<float>::infinity();
  for (std::size_t t = 0; t < ntokens; ++t) {
    const float s = dot_product(query, std::span<const float>(tokens + t * dim, dim));
    if (s > best) best = s;
  }
  return best;
}

} // namespace colscore::kernels
