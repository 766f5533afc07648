#include "colscore/maxsim.hpp"

#include <iostream>
#include <limits>
#include <string_view>
#include <utility>

#include "colscore/core/platform_utils.hpp"
#include "colscore/kernels/dispatch.hpp"

namespace colscore {

namespace {

constexpr const char* kComponent = "maxsim";

auto resolve_backend(const std::string& requested)
    -> std::expected<const kernels::KernelOps*, core::error> {
  const std::string name = kernels::canonical_backend_name(requested);
  if (name.empty() || name == "auto") {
    return &kernels::select_backend_auto();
  }
  if (!kernels::is_known_backend(name)) {
    return core::make_error(core::error_code::invalid_argument,
        "unknown backend '" + requested + "' (expected auto, scalar, sse, avx2 or neon)", kComponent);
  }
  return &kernels::select_backend(name);
}

// First non-empty sequence decides; query first, then documents in order.
auto infer_pair_dimension(const TokenEmbeddings& query, std::span<const TokenEmbeddings> docs)
    -> std::size_t {
  if (!query.empty()) return query.front().size();
  return index::infer_dimension(docs);
}

auto first_or_zero(std::expected<std::vector<float>, core::error> scores)
    -> std::expected<float, core::error> {
  if (!scores) return std::unexpected(scores.error());
  return scores->empty() ? 0.0f : scores->front();
}

} // namespace

struct MaxSim::Impl {
  Impl(const kernels::KernelOps& ops, ScorerOptions opts)
      : options(std::move(opts)), scorer(ops, options.scoring) {}

  auto score_nested(const TokenEmbeddings& query, std::span<const TokenEmbeddings> docs,
                    ScoreMode mode) const -> std::expected<std::vector<float>, core::error> {
    const std::size_t dim = infer_pair_dimension(query, docs);
    if (dim == 0 && query.empty()) {
      // No token anywhere: every document scores 0
      return std::vector<float>(docs.size(), 0.0f);
    }
    const auto popts = scorer.pack_options();
    auto q = index::pack_query(query, dim, popts);
    if (!q) return std::unexpected(q.error());
    auto d = index::pack_documents(docs, dim, popts);
    if (!d) return std::unexpected(d.error());
    return scorer.score_packed(*q, *d, mode);
  }

  auto score_flat_pair(std::span<const float> query, std::size_t query_tokens,
                       std::span<const float> doc, std::size_t doc_tokens, std::size_t dim,
                       ScoreMode mode) const -> std::expected<float, core::error> {
    if (doc_tokens > std::numeric_limits<std::uint32_t>::max()) {
      return core::make_error(core::error_code::out_of_range,
                              "document token count exceeds 2^32-1", kComponent);
    }
    const std::uint32_t counts[1] = {static_cast<std::uint32_t>(doc_tokens)};
    return first_or_zero(scorer.score_batch(query, query_tokens, doc, counts, dim, mode));
  }

  ScorerOptions options;
  index::BatchScorer scorer;
};

MaxSim::MaxSim(std::unique_ptr<Impl> impl) noexcept : impl_(std::move(impl)) {}
MaxSim::MaxSim(MaxSim&&) noexcept = default;
MaxSim& MaxSim::operator=(MaxSim&&) noexcept = default;
MaxSim::~MaxSim() = default;

auto MaxSim::create(ScorerOptions options) -> std::expected<MaxSim, core::error> {
  auto ops = resolve_backend(options.backend);
  if (!ops) return std::unexpected(ops.error());
  if (auto ok = index::validate_options(options.scoring); !ok) {
    return std::unexpected(ok.error());
  }
  if (core::debug_enabled()) {
    std::cerr << "[colscore][maxsim] create backend=" << (*ops)->name
              << " requested=" << options.backend
              << " similarity=" << (options.scoring.similarity == Similarity::Dot ? "dot" : "cosine")
              << "\n";
  }
  return MaxSim(std::make_unique<Impl>(**ops, std::move(options)));
}

auto MaxSim::maxsim(const TokenEmbeddings& query, const TokenEmbeddings& doc) const
    -> std::expected<float, core::error> {
  return first_or_zero(impl_->score_nested(query, std::span<const TokenEmbeddings>(&doc, 1),
                                           ScoreMode::Raw));
}

auto MaxSim::maxsim_normalized(const TokenEmbeddings& query, const TokenEmbeddings& doc) const
    -> std::expected<float, core::error> {
  return first_or_zero(impl_->score_nested(query, std::span<const TokenEmbeddings>(&doc, 1),
                                           ScoreMode::Normalized));
}

auto MaxSim::maxsim_batch(const TokenEmbeddings& query, std::span<const TokenEmbeddings> docs) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->score_nested(query, docs, ScoreMode::Raw);
}

auto MaxSim::maxsim_batch_normalized(const TokenEmbeddings& query,
                                     std::span<const TokenEmbeddings> docs) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->score_nested(query, docs, ScoreMode::Normalized);
}

auto MaxSim::maxsim_flat(std::span<const float> query, std::size_t query_tokens,
                         std::span<const float> doc, std::size_t doc_tokens,
                         std::size_t dim) const -> std::expected<float, core::error> {
  return impl_->score_flat_pair(query, query_tokens, doc, doc_tokens, dim, ScoreMode::Raw);
}

auto MaxSim::maxsim_flat_normalized(std::span<const float> query, std::size_t query_tokens,
                                    std::span<const float> doc, std::size_t doc_tokens,
                                    std::size_t dim) const -> std::expected<float, core::error> {
  return impl_->score_flat_pair(query, query_tokens, doc, doc_tokens, dim, ScoreMode::Normalized);
}

auto MaxSim::maxsim_batch_flat(std::span<const float> query, std::size_t query_tokens,
                               std::span<const float> docs,
                               std::span<const std::uint32_t> token_counts,
                               std::size_t dim) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->scorer.score_batch(query, query_tokens, docs, token_counts, dim, ScoreMode::Raw);
}

auto MaxSim::maxsim_batch_flat_normalized(std::span<const float> query, std::size_t query_tokens,
                                          std::span<const float> docs,
                                          std::span<const std::uint32_t> token_counts,
                                          std::size_t dim) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->scorer.score_batch(query, query_tokens, docs, token_counts, dim,
                                   ScoreMode::Normalized);
}

auto MaxSim::load_documents(std::span<const float> docs,
                            std::span<const std::uint32_t> token_counts, std::size_t dim)
    -> std::expected<void, core::error> {
  return impl_->scorer.load_documents(docs, token_counts, dim);
}

auto MaxSim::load_documents(std::span<const TokenEmbeddings> docs, std::size_t dim)
    -> std::expected<void, core::error> {
  if (dim == 0) {
    dim = index::infer_dimension(docs);
    if (dim == 0) {
      return core::make_error(core::error_code::invalid_argument,
          "cannot infer embedding dimension: no document has a token", kComponent);
    }
  }
  return impl_->scorer.load_documents(docs, dim);
}

auto MaxSim::search_preloaded(std::span<const float> query, std::size_t query_tokens) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->scorer.search_preloaded(query, query_tokens, ScoreMode::Raw);
}

auto MaxSim::search_preloaded_normalized(std::span<const float> query,
                                         std::size_t query_tokens) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->scorer.search_preloaded(query, query_tokens, ScoreMode::Normalized);
}

auto MaxSim::search_preloaded(const TokenEmbeddings& query) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->scorer.search_preloaded(query, ScoreMode::Raw);
}

auto MaxSim::search_preloaded_normalized(const TokenEmbeddings& query) const
    -> std::expected<std::vector<float>, core::error> {
  return impl_->scorer.search_preloaded(query, ScoreMode::Normalized);
}

auto MaxSim::num_documents_loaded() const noexcept -> std::size_t {
  return impl_->scorer.num_documents_loaded();
}

auto MaxSim::dimension_loaded() const noexcept -> std::size_t {
  return impl_->scorer.dimension_loaded();
}

void MaxSim::clear_documents() noexcept { impl_->scorer.clear_documents(); }

auto MaxSim::info() const -> EngineInfo {
  const auto& ops = impl_->scorer.kernel();
  const auto& s = impl_->options.scoring;

  EngineInfo out;
  out.name = "colscore";
  out.version = kVersion;
  out.backend = ops.name;
  out.lanes = ops.lanes;
  out.normalized = s.similarity == Similarity::Dot;
#if defined(_OPENMP)
  out.parallel = s.parallel;
#endif
  if (ops.lanes > 1) out.features.emplace_back("simd");
  out.features.emplace_back(out.normalized ? "normalized-mode" : "cosine-similarity");
  out.features.emplace_back("batch-processing");
  out.features.emplace_back("preloaded-corpus");
  out.features.emplace_back("cache-blocking");
  if (out.parallel) out.features.emplace_back("openmp");
  if (s.verify_normalized) out.features.emplace_back("verify-normalized");
  return out;
}

auto MaxSim::get_info() const -> std::string {
  const EngineInfo i = info();
  return i.name + " v" + i.version + " (normalized: " + (i.normalized ? "true" : "false") +
         ", SIMD: " + i.backend + ")";
}

auto MaxSim::normalize(const TokenEmbeddings& embeddings) -> TokenEmbeddings {
  TokenEmbeddings out = embeddings;
  for (auto& token : out) {
    index::normalize_rows(token, token.size());
  }
  return out;
}

} // namespace colscore
