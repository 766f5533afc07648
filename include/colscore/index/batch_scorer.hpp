#pragma once

/** \file batch_scorer.hpp
 *  \brief Batched MaxSim scoring with an optional preloaded corpus.
 *
 * Two scoring paths share one kernel:
 * - Uniform: every document has the same Td, fixed stride Td * D, one blocking plan
 * - Variable: per-document offsets from a prefix sum, one plan per document
 *
 * Preloaded corpus:
 * - load_documents validates and packs fully before touching scorer state. A failed
 *   load leaves the previous corpus in place.
 * - Loads swap an immutable std::shared_ptr<const PackedDocuments> under an exclusive
 *   lock; searches copy that pointer under a shared lock and score without holding it.
 * - Copy-in: callers may reuse or free their buffers as soon as load_documents returns.
 *
 * Thread-safety: all const members and search_preloaded are safe for concurrent calls.
 * load_documents / clear_documents may run concurrently with searches.
 * Similarity::Dot assumes L2-normalized embeddings and does not check it unless
 * verify_normalized is set; unnormalized input silently yields unnormalized scores.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <span>
#include <vector>

#include "colscore/error.hpp"
#include "colscore/index/layout.hpp"
#include "colscore/kernels/dispatch.hpp"

namespace colscore::index {

/** \brief Score variant returned to the caller. */
enum class ScoreMode : std::uint8_t {
    Raw,        /**< sum over query tokens of the best document match */
    Normalized  /**< Raw / Tq */
};

/** \brief Token similarity used inside MaxSim. */
enum class Similarity : std::uint8_t {
    Dot,    /**< plain dot product; inputs must already be unit length */
    Cosine  /**< copies are L2-normalized on ingest, then dot product */
};

/** \brief Scorer configuration. */
struct BatchScorerOptions {
    Similarity similarity{Similarity::Dot};
    std::size_t query_block{8};            /**< query tokens per block, clamped to [1, 32] */
    std::size_t doc_block{0};              /**< 0 = adaptive from Td */
    bool detect_uniform{true};             /**< take the fixed-stride path when lengths agree */
    bool parallel{false};                  /**< split documents across OpenMP threads */
    std::size_t parallel_min_docs{64};     /**< below this, stay single-threaded */
    bool verify_normalized{false};         /**< reject non-unit tokens (Dot only) */
    float normalization_tolerance{1e-3f};
};

/** \brief Validate scorer options. */
[[nodiscard]] auto validate_options(const BatchScorerOptions& options)
    -> std::expected<void, core::error>;

class BatchScorer {
public:
    /** \brief Construct with a kernel backend; options must pass validate_options. */
    explicit BatchScorer(const kernels::KernelOps& ops, BatchScorerOptions options = {});
    ~BatchScorer();
    BatchScorer(const BatchScorer&) = delete;
    BatchScorer& operator=(const BatchScorer&) = delete;

    [[nodiscard]] auto kernel() const noexcept -> const kernels::KernelOps& { return *ops_; }
    [[nodiscard]] auto options() const noexcept -> const BatchScorerOptions& { return options_; }

    /** \brief Ingest options derived from the scorer options. */
    [[nodiscard]] auto pack_options() const noexcept -> PackOptions;

    /** \brief Score a query against every document of a flat corpus.
     *
     * \param query Flat query [query_tokens x dim]
     * \param docs Flat documents [sum(token_counts) x dim]
     * \param token_counts Per-document token counts
     * \return one score per document, in token_counts order
     *
     * Errors: invalid_argument on dimension or buffer-length mismatch;
     *         precondition_failed when verify_normalized rejects a token.
     * Complexity: O(Tq * sum(Td) * D)
     */
    [[nodiscard]] auto score_batch(std::span<const float> query, std::size_t query_tokens,
                                   std::span<const float> docs,
                                   std::span<const std::uint32_t> token_counts,
                                   std::size_t dim, ScoreMode mode = ScoreMode::Raw) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Score already packed inputs. Dimensions must agree. */
    [[nodiscard]] auto score_packed(const PackedQuery& query, const PackedDocuments& docs,
                                    ScoreMode mode = ScoreMode::Raw) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Replace the preloaded corpus with a copy of a flat corpus (all-or-nothing). */
    auto load_documents(std::span<const float> docs, std::span<const std::uint32_t> token_counts,
                        std::size_t dim) -> std::expected<void, core::error>;

    /** \brief Replace the preloaded corpus with nested documents (all-or-nothing). */
    auto load_documents(std::span<const TokenEmbeddings> docs, std::size_t dim)
        -> std::expected<void, core::error>;

    /** \brief Score a flat query against the preloaded corpus.
     *
     * Returns an empty vector when nothing is loaded. Query dimension is the corpus
     * dimension, so query.size() must equal query_tokens * dimension_loaded().
     */
    [[nodiscard]] auto search_preloaded(std::span<const float> query, std::size_t query_tokens,
                                        ScoreMode mode = ScoreMode::Raw) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Score a nested query against the preloaded corpus. */
    [[nodiscard]] auto search_preloaded(const TokenEmbeddings& query,
                                        ScoreMode mode = ScoreMode::Raw) const
        -> std::expected<std::vector<float>, core::error>;

    [[nodiscard]] auto num_documents_loaded() const noexcept -> std::size_t;
    [[nodiscard]] auto dimension_loaded() const noexcept -> std::size_t;

    /** \brief Drop the preloaded corpus. In-flight searches keep their snapshot. */
    void clear_documents() noexcept;

private:
    using CorpusPtr = std::shared_ptr<const PackedDocuments>;

    [[nodiscard]] auto snapshot() const noexcept -> CorpusPtr;
    void install(CorpusPtr corpus, const char* source);
    /** \brief Core loop over validated views; out.size() == corpus.num_documents(). */
    void score_view(const QueryView& query, const CorpusView& corpus, ScoreMode mode,
                    std::span<float> out) const noexcept;
    [[nodiscard]] auto score_into_vector(const QueryView& query, const CorpusView& corpus,
                                         ScoreMode mode) const -> std::vector<float>;

    const kernels::KernelOps* ops_;
    BatchScorerOptions options_;

    mutable std::shared_mutex mutex_;
    CorpusPtr corpus_;
};

} // namespace colscore::index
