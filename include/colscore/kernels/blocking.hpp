#pragma once

/** \file blocking.hpp
 *  \brief Cache-blocking plan for MaxSim traversal.
 *
 * The query axis uses a fixed block (default 8 tokens). The document axis shrinks as
 * documents grow so that one query block plus one document block stay cache resident:
 *
 *   Td <= 64  -> 16
 *   Td <= 128 -> 12
 *   Td <= 256 -> 8
 *   Td <= 512 -> 6
 *   otherwise -> 4
 *
 * Block sizes only reorder the traversal; the computed scores do not depend on them.
 */

#include <algorithm>
#include <cstddef>

namespace colscore::kernels {

inline constexpr std::size_t kDefaultQueryBlock = 8;
inline constexpr std::size_t kMaxQueryBlock = 32;

struct BlockPlan {
    std::size_t query_block;  /**< query tokens per block, in [1, kMaxQueryBlock] */
    std::size_t doc_block;    /**< document tokens per block, >= 1 */
};

/** \brief Adaptive document-token block size for a document of doc_tokens tokens. */
[[nodiscard]] constexpr auto adaptive_doc_block(std::size_t doc_tokens) noexcept -> std::size_t {
    if (doc_tokens <= 64) return 16;
    if (doc_tokens <= 128) return 12;
    if (doc_tokens <= 256) return 8;
    if (doc_tokens <= 512) return 6;
    return 4;
}

/** \brief Build the plan for one document.
 *
 * \param doc_tokens Document token count Td
 * \param query_block Requested query block; 0 selects kDefaultQueryBlock, clamped to [1, 32]
 * \param doc_block Explicit document block; 0 selects adaptive_doc_block(doc_tokens)
 */
[[nodiscard]] constexpr auto plan_blocks(std::size_t doc_tokens,
                                         std::size_t query_block = kDefaultQueryBlock,
                                         std::size_t doc_block = 0) noexcept -> BlockPlan {
    const std::size_t qb = query_block == 0 ? kDefaultQueryBlock
                                            : std::clamp<std::size_t>(query_block, 1, kMaxQueryBlock);
    const std::size_t db = doc_block == 0 ? adaptive_doc_block(doc_tokens) : doc_block;
    return BlockPlan{qb, db};
}

} // namespace colscore::kernels
