#include "colscore/index/batch_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include "colscore/core/platform_utils.hpp"
#include "colscore/kernels/blocking.hpp"
#include "colscore/kernels/maxsim.hpp"

namespace colscore::index {

namespace {

constexpr const char* kComponent = "scorer";

} // namespace

auto validate_options(const BatchScorerOptions& options) -> std::expected<void, core::error> {
    if (!(options.normalization_tolerance >= 0.0f) || !std::isfinite(options.normalization_tolerance)) {
        return core::make_error(core::error_code::config_invalid,
                                "normalization_tolerance must be finite and non-negative", kComponent);
    }
    if (options.query_block > kernels::kMaxQueryBlock) {
        return core::make_error(core::error_code::config_invalid,
            "query_block must be at most " + std::to_string(kernels::kMaxQueryBlock), kComponent);
    }
    return {};
}

BatchScorer::BatchScorer(const kernels::KernelOps& ops, BatchScorerOptions options)
    : ops_(&ops), options_(options) {}

BatchScorer::~BatchScorer() = default;

auto BatchScorer::pack_options() const noexcept -> PackOptions {
    PackOptions p;
    p.normalize_rows = options_.similarity == Similarity::Cosine;
    p.verify_normalized = options_.verify_normalized && options_.similarity == Similarity::Dot;
    p.normalization_tolerance = options_.normalization_tolerance;
    return p;
}

void BatchScorer::score_view(const QueryView& query, const CorpusView& corpus, ScoreMode mode,
                             std::span<float> out) const noexcept {
    const std::size_t n = corpus.num_documents();
    if (n == 0) return;
    if (query.tokens == 0) {
        std::fill(out.begin(), out.end(), 0.0f);
        return;
    }

    const auto& ops = *ops_;
    const DocumentLayout& layout = *corpus.layout;
    const std::size_t dim = corpus.dim;
    const float* docs = corpus.data;
    const bool normalized = mode == ScoreMode::Normalized;
    [[maybe_unused]] const bool par = options_.parallel && n >= options_.parallel_min_docs;

    if (options_.detect_uniform && layout.uniform_tokens) {
        // Uniform: fixed stride, one plan for the whole batch
        const std::size_t td = *layout.uniform_tokens;
        const std::size_t stride = td * dim;
        const kernels::BlockPlan plan =
            kernels::plan_blocks(td, options_.query_block, options_.doc_block);

        #pragma omp parallel for schedule(dynamic, 16) if(par)
        for (long long i = 0; i < static_cast<long long>(n); ++i) {
            const std::size_t d = static_cast<std::size_t>(i);
            const float raw = kernels::maxsim_blocked(ops, query.data, query.tokens,
                                                      docs + d * stride, td, dim, plan);
            out[d] = normalized ? kernels::normalize_score(raw, query.tokens) : raw;
        }
        return;
    }

    // Variable: prefix-sum offsets, plan per document
    #pragma omp parallel for schedule(dynamic, 16) if(par)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const std::size_t d = static_cast<std::size_t>(i);
        const std::size_t td = layout.token_counts[d];
        const kernels::BlockPlan plan =
            kernels::plan_blocks(td, options_.query_block, options_.doc_block);
        const float raw = kernels::maxsim_blocked(ops, query.data, query.tokens,
                                                  docs + layout.offsets[d], td, dim, plan);
        out[d] = normalized ? kernels::normalize_score(raw, query.tokens) : raw;
    }
}

auto BatchScorer::score_into_vector(const QueryView& query, const CorpusView& corpus,
                                    ScoreMode mode) const -> std::vector<float> {
    std::vector<float> scores(corpus.num_documents(), 0.0f);
    score_view(query, corpus, mode, scores);
    return scores;
}

auto BatchScorer::score_batch(std::span<const float> query, std::size_t query_tokens,
                              std::span<const float> docs,
                              std::span<const std::uint32_t> token_counts,
                              std::size_t dim, ScoreMode mode) const
    -> std::expected<std::vector<float>, core::error> {
    const PackOptions popts = pack_options();

    if (options_.similarity == Similarity::Cosine) {
        // Cosine needs normalized copies; scoring then runs on the packed data
        auto q = pack_query(query, query_tokens, dim, popts);
        if (!q) return std::unexpected(q.error());
        auto d = pack_documents(docs, token_counts, dim, popts);
        if (!d) return std::unexpected(d.error());
        return score_into_vector(q->view(), d->view(), mode);
    }

    // Dot: borrow the caller's buffers, only the offsets are computed
    if (auto ok = validate_query(query, query_tokens, dim); !ok) return std::unexpected(ok.error());
    if (auto total = validate_documents(docs, token_counts, dim); !total) {
        return std::unexpected(total.error());
    }
    if (popts.verify_normalized) {
        if (auto ok = verify_unit_rows(query, dim, popts.normalization_tolerance, "query"); !ok) {
            return std::unexpected(ok.error());
        }
    }

    const DocumentLayout layout = make_layout(token_counts, dim);
    if (popts.verify_normalized) {
        if (auto ok = verify_document_rows(docs, layout, dim, popts.normalization_tolerance); !ok) {
            return std::unexpected(ok.error());
        }
    }
    const QueryView qv{query.data(), query_tokens, dim};
    const CorpusView cv{docs.data(), &layout, dim};
    return score_into_vector(qv, cv, mode);
}

auto BatchScorer::score_packed(const PackedQuery& query, const PackedDocuments& docs,
                               ScoreMode mode) const
    -> std::expected<std::vector<float>, core::error> {
    if (query.tokens > 0 && docs.num_documents() > 0 && query.dim != docs.dim) {
        return core::make_error(core::error_code::invalid_argument,
            "query dimension " + std::to_string(query.dim) + " does not match document dimension " +
                std::to_string(docs.dim),
            kComponent);
    }
    return score_into_vector(query.view(), docs.view(), mode);
}

auto BatchScorer::snapshot() const noexcept -> CorpusPtr {
    std::shared_lock lock(mutex_);
    return corpus_;
}

void BatchScorer::install(CorpusPtr corpus, const char* source) {
    if (core::debug_enabled()) {
        std::cerr << "[colscore][load] source=" << source
                  << " docs=" << corpus->num_documents()
                  << " tokens=" << corpus->layout.total_tokens
                  << " dim=" << corpus->dim
                  << " uniform=" << (corpus->layout.uniform_tokens ? "yes" : "no")
                  << " backend=" << ops_->name << "\n";
    }
    std::unique_lock lock(mutex_);
    corpus_ = std::move(corpus);
}

auto BatchScorer::load_documents(std::span<const float> docs,
                                 std::span<const std::uint32_t> token_counts,
                                 std::size_t dim) -> std::expected<void, core::error> {
    auto packed = pack_documents(docs, token_counts, dim, pack_options());
    if (!packed) {
        if (core::debug_enabled()) {
            std::cerr << "[colscore][load] rejected: " << packed.error().message << "\n";
        }
        return std::unexpected(packed.error());
    }
    install(std::make_shared<const PackedDocuments>(std::move(*packed)), "flat");
    return {};
}

auto BatchScorer::load_documents(std::span<const TokenEmbeddings> docs, std::size_t dim)
    -> std::expected<void, core::error> {
    auto packed = pack_documents(docs, dim, pack_options());
    if (!packed) {
        if (core::debug_enabled()) {
            std::cerr << "[colscore][load] rejected: " << packed.error().message << "\n";
        }
        return std::unexpected(packed.error());
    }
    install(std::make_shared<const PackedDocuments>(std::move(*packed)), "nested");
    return {};
}

auto BatchScorer::search_preloaded(std::span<const float> query, std::size_t query_tokens,
                                   ScoreMode mode) const
    -> std::expected<std::vector<float>, core::error> {
    const CorpusPtr corpus = snapshot();
    if (!corpus) return std::vector<float>{};

    if (options_.similarity == Similarity::Cosine) {
        auto q = pack_query(query, query_tokens, corpus->dim, pack_options());
        if (!q) return std::unexpected(q.error());
        return score_into_vector(q->view(), corpus->view(), mode);
    }

    if (auto ok = validate_query(query, query_tokens, corpus->dim); !ok) {
        return std::unexpected(ok.error());
    }
    if (options_.verify_normalized) {
        if (auto ok = verify_unit_rows(query, corpus->dim, options_.normalization_tolerance, "query");
            !ok) {
            return std::unexpected(ok.error());
        }
    }
    return score_into_vector(QueryView{query.data(), query_tokens, corpus->dim}, corpus->view(), mode);
}

auto BatchScorer::search_preloaded(const TokenEmbeddings& query, ScoreMode mode) const
    -> std::expected<std::vector<float>, core::error> {
    const CorpusPtr corpus = snapshot();
    if (!corpus) return std::vector<float>{};

    auto q = pack_query(query, corpus->dim, pack_options());
    if (!q) return std::unexpected(q.error());
    return score_into_vector(q->view(), corpus->view(), mode);
}

auto BatchScorer::num_documents_loaded() const noexcept -> std::size_t {
    const CorpusPtr corpus = snapshot();
    return corpus ? corpus->num_documents() : 0;
}

auto BatchScorer::dimension_loaded() const noexcept -> std::size_t {
    const CorpusPtr corpus = snapshot();
    return corpus ? corpus->dim : 0;
}

void BatchScorer::clear_documents() noexcept {
    CorpusPtr old;
    {
        std::unique_lock lock(mutex_);
        old.swap(corpus_);
    }
    if (core::debug_enabled()) {
        std::cerr << "[colscore][load] cleared docs=" << (old ? old->num_documents() : 0) << "\n";
    }
}

} // namespace colscore::index
