#pragma once

/**
 * \file maxsim.hpp
 * \brief Public C++ API: MaxSim late-interaction scoring.
 *
 * raw(q, d)        = sum over query tokens of the best dot product with any document token
 * normalized(q, d) = raw(q, d) / Tq
 *
 * Two calling conventions share one internal representation:
 * - nested (one std::vector<float> per token), convenient but copies on every call
 * - flat (one contiguous buffer plus token counts), the performance path
 *
 * Precision contract: with Similarity::Dot (the default) embeddings must already be
 * L2-normalized. This is not checked unless ScorerOptions::scoring.verify_normalized
 * is set; unnormalized input silently produces dot products instead of cosines.
 *
 * Thread-safety: scoring and search_preloaded are safe for concurrent calls;
 * load_documents / clear_documents may run concurrently with them.
 * No exceptions are thrown along scoring paths; errors are propagated via std::expected.
 * Degenerate input (empty query, empty document, empty corpus) is not an error.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "colscore/error.hpp"
#include "colscore/index/batch_scorer.hpp"
#include "colscore/index/layout.hpp"

namespace colscore {

inline constexpr const char* kVersion = "0.3.0";

using index::ScoreMode;
using index::Similarity;
using index::TokenEmbeddings;

/** \brief Construction options. */
struct ScorerOptions {
  /** kernel backend: "auto" | "scalar" | "sse" | "avx2" | "neon", case-insensitive */
  std::string backend{"auto"};
  index::BatchScorerOptions scoring{};
};

/** \brief Capability descriptor. Informational only. */
struct EngineInfo {
  std::string name;
  std::string version;
  std::string backend;                /**< kernel actually selected */
  std::size_t lanes{1};               /**< floats per vector register */
  bool normalized{true};              /**< Similarity::Dot on unit vectors */
  bool parallel{false};               /**< OpenMP document partitioning available and enabled */
  std::vector<std::string> features;
};

class MaxSim {
public:
  /**
   * \brief Create a scorer. The kernel backend is selected once, here.
   * \return scorer; invalid_argument for an unknown backend, config_invalid for bad options
   */
  static auto create(ScorerOptions options = {}) -> std::expected<MaxSim, core::error>;

  MaxSim(MaxSim&&) noexcept;
  MaxSim& operator=(MaxSim&&) noexcept;
  MaxSim(const MaxSim&) = delete;
  MaxSim& operator=(const MaxSim&) = delete;
  ~MaxSim();

  /** \brief Raw MaxSim of one nested query/document pair. */
  auto maxsim(const TokenEmbeddings& query, const TokenEmbeddings& doc) const
      -> std::expected<float, core::error>;
  auto maxsim_normalized(const TokenEmbeddings& query, const TokenEmbeddings& doc) const
      -> std::expected<float, core::error>;

  /** \brief One raw score per nested document, in input order. */
  auto maxsim_batch(const TokenEmbeddings& query, std::span<const TokenEmbeddings> docs) const
      -> std::expected<std::vector<float>, core::error>;
  auto maxsim_batch_normalized(const TokenEmbeddings& query,
                               std::span<const TokenEmbeddings> docs) const
      -> std::expected<std::vector<float>, core::error>;

  /**
   * \brief Raw MaxSim of one flat pair.
   * \param query [query_tokens x dim]
   * \param doc [doc_tokens x dim]
   */
  auto maxsim_flat(std::span<const float> query, std::size_t query_tokens,
                   std::span<const float> doc, std::size_t doc_tokens, std::size_t dim) const
      -> std::expected<float, core::error>;
  auto maxsim_flat_normalized(std::span<const float> query, std::size_t query_tokens,
                              std::span<const float> doc, std::size_t doc_tokens,
                              std::size_t dim) const -> std::expected<float, core::error>;

  /**
   * \brief One raw score per document of a flat corpus.
   * \param docs [sum(token_counts) x dim]
   * \param token_counts per-document token counts
   * Errors: invalid_argument naming the violated length invariant.
   */
  auto maxsim_batch_flat(std::span<const float> query, std::size_t query_tokens,
                         std::span<const float> docs, std::span<const std::uint32_t> token_counts,
                         std::size_t dim) const -> std::expected<std::vector<float>, core::error>;
  auto maxsim_batch_flat_normalized(std::span<const float> query, std::size_t query_tokens,
                                    std::span<const float> docs,
                                    std::span<const std::uint32_t> token_counts,
                                    std::size_t dim) const
      -> std::expected<std::vector<float>, core::error>;

  /** \brief Replace the preloaded corpus (copy-in, all-or-nothing). */
  auto load_documents(std::span<const float> docs, std::span<const std::uint32_t> token_counts,
                      std::size_t dim) -> std::expected<void, core::error>;

  /**
   * \brief Replace the preloaded corpus from nested documents.
   * \param dim 0 infers the dimension from the first token found
   */
  auto load_documents(std::span<const TokenEmbeddings> docs, std::size_t dim = 0)
      -> std::expected<void, core::error>;

  /** \brief Score against the preloaded corpus; empty result when nothing is loaded. */
  auto search_preloaded(std::span<const float> query, std::size_t query_tokens) const
      -> std::expected<std::vector<float>, core::error>;
  auto search_preloaded_normalized(std::span<const float> query, std::size_t query_tokens) const
      -> std::expected<std::vector<float>, core::error>;
  auto search_preloaded(const TokenEmbeddings& query) const
      -> std::expected<std::vector<float>, core::error>;
  auto search_preloaded_normalized(const TokenEmbeddings& query) const
      -> std::expected<std::vector<float>, core::error>;

  auto num_documents_loaded() const noexcept -> std::size_t;
  auto dimension_loaded() const noexcept -> std::size_t;
  void clear_documents() noexcept;

  auto info() const -> EngineInfo;
  /** \brief e.g. "colscore v0.3.0 (normalized: true, SIMD: avx2)" */
  auto get_info() const -> std::string;

  /** \brief L2-normalize each token; zero vectors are returned unchanged. */
  static auto normalize(const TokenEmbeddings& embeddings) -> TokenEmbeddings;

private:
  struct Impl;
  explicit MaxSim(std::unique_ptr<Impl> impl) noexcept;
  std::unique_ptr<Impl> impl_;
};

} // namespace colscore
