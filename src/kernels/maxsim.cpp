#include "colscore/kernels/maxsim.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <span>

#include "colscore/platform/compiler.hpp"

namespace colscore::kernels {

COLSCORE_HOT
auto maxsim_blocked(const KernelOps& ops,
                    const float* query, std::size_t query_tokens,
                    const float* doc, std::size_t doc_tokens,
                    std::size_t dim, const BlockPlan& plan) noexcept -> float {
    if (COLSCORE_UNLIKELY(query_tokens == 0 || doc_tokens == 0 || dim == 0)) {
        return 0.0f;
    }

    const std::size_t qb = std::clamp<std::size_t>(plan.query_block, 1, kMaxQueryBlock);
    const std::size_t db = std::max<std::size_t>(plan.doc_block, 1);
    constexpr float kNegInf = -std::numeric_limits<float>::infinity();

    std::array<float, kMaxQueryBlock> maxes;
    float score = 0.0f;

    for (std::size_t q0 = 0; q0 < query_tokens; q0 += qb) {
        const std::size_t qn = std::min(qb, query_tokens - q0);
        std::fill_n(maxes.begin(), qn, kNegInf);

        for (std::size_t d0 = 0; d0 < doc_tokens; d0 += db) {
            const std::size_t dn = std::min(db, doc_tokens - d0);
            const float* block = doc + d0 * dim;
            for (std::size_t i = 0; i < qn; ++i) {
                const std::span<const float> qrow(query + (q0 + i) * dim, dim);
                const float m = ops.max_dot_product(qrow, block, dn, dim);
                if (m > maxes[i]) maxes[i] = m;
            }
        }

        // Query order keeps the sum independent of the document block size
        for (std::size_t i = 0; i < qn; ++i) {
            score += maxes[i];
        }
    }
    return score;
}

auto maxsim_single(const KernelOps& ops,
                   const float* query, std::size_t query_tokens,
                   const float* doc, std::size_t doc_tokens,
                   std::size_t dim) noexcept -> float {
    return maxsim_blocked(ops, query, query_tokens, doc, doc_tokens, dim, plan_blocks(doc_tokens));
}

auto maxsim_single_normalized(const KernelOps& ops,
                              const float* query, std::size_t query_tokens,
                              const float* doc, std::size_t doc_tokens,
                              std::size_t dim) noexcept -> float {
    return normalize_score(maxsim_single(ops, query, query_tokens, doc, doc_tokens, dim), query_tokens);
}

} // namespace colscore::kernels
