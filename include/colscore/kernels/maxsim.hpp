#pragma once

/** \file maxsim.hpp
 *  \brief Blocked MaxSim kernel over one query and one document.
 *
 * raw(q, d)        = sum_{i < Tq} max_{j < Td} dot(q_i, d_j)
 * normalized(q, d) = raw(q, d) / Tq
 *
 * Inputs are row-major token matrices with stride dim. Degenerate inputs (Tq == 0 or
 * Td == 0) score 0. Per-token maxima are accumulated in query order, so the result
 * is independent of the blocking plan. Kernels are noexcept and do not allocate.
 */

#include <cstddef>

#include "colscore/kernels/blocking.hpp"
#include "colscore/kernels/dispatch.hpp"

namespace colscore::kernels {

/** \brief Blocked raw MaxSim using the given backend and plan. */
[[nodiscard]] auto maxsim_blocked(const KernelOps& ops,
                                  const float* query, std::size_t query_tokens,
                                  const float* doc, std::size_t doc_tokens,
                                  std::size_t dim, const BlockPlan& plan) noexcept -> float;

/** \brief Raw MaxSim with the adaptive plan for doc_tokens. */
[[nodiscard]] auto maxsim_single(const KernelOps& ops,
                                 const float* query, std::size_t query_tokens,
                                 const float* doc, std::size_t doc_tokens,
                                 std::size_t dim) noexcept -> float;

/** \brief maxsim_single(...) / query_tokens; 0 when query_tokens == 0. */
[[nodiscard]] auto maxsim_single_normalized(const KernelOps& ops,
                                            const float* query, std::size_t query_tokens,
                                            const float* doc, std::size_t doc_tokens,
                                            std::size_t dim) noexcept -> float;

/** \brief Divide a raw score by the query length, 0 for an empty query. */
[[nodiscard]] inline auto normalize_score(float raw, std::size_t query_tokens) noexcept -> float {
    return query_tokens == 0 ? 0.0f : raw / static_cast<float>(query_tokens);
}

} // namespace colscore::kernels
