#pragma once

/** \file scalar.hpp
 *  \brief Scalar backend implementing KernelOps via similarity.hpp reference kernels.
 */

#include <span>
#include "colscore/kernels/dispatch.hpp"
#include "colscore/kernels/similarity.hpp"

namespace colscore::kernels {

inline float scalar_dot(std::span<const float> a, std::span<const float> b) noexcept { return dot_product(a, b); }
inline float scalar_sqnorm(std::span<const float> a) noexcept { return squared_norm(a); }

inline float scalar_max_dot(std::span<const float> query,
                            const float* tokens, std::size_t ntokens, std::size_t dim) noexcept {
    return max_dot_product(query, tokens, ntokens, dim);
}

inline const KernelOps& get_scalar_ops() noexcept {
  static const KernelOps ops{
      "scalar", 1,
      &scalar_dot, &scalar_sqnorm, &scalar_max_dot
  };
  return ops;
}

} // namespace colscore::kernels
