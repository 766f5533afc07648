/** \file batch_scorer_test.cpp
 *  \brief Batch scoring paths, preloaded corpus lifecycle and concurrency.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <colscore/index/batch_scorer.hpp>
#include <colscore/kernels/dispatch.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <tests/support/embedding_fixtures.hpp>

using namespace colscore;
using namespace colscore::index;
using Catch::Matchers::WithinAbs;

namespace {

struct Corpus {
  std::vector<TokenEmbeddings> nested;
  std::vector<float> flat;
  std::vector<std::uint32_t> counts;
};

Corpus make_corpus(const std::vector<std::size_t>& lengths, std::size_t dim, std::mt19937& rng) {
  Corpus c;
  for (auto len : lengths) c.nested.push_back(test::random_tokens(len, dim, rng));
  c.flat = test::flatten(c.nested);
  c.counts = test::token_counts(c.nested);
  return c;
}

} // namespace

TEST_CASE("score_batch agrees with the reference for variable lengths", "[scorer]") {
  std::mt19937 rng(17);
  const std::size_t dim = 32;
  const auto corpus = make_corpus({5, 70, 1, 130, 300, 600, 12}, dim, rng);
  const auto query = test::random_tokens(9, dim, rng);
  const auto qf = test::flatten(query);

  for (const auto* ops : test::available_backends()) {
    INFO("backend " << ops->name);
    BatchScorer scorer(*ops);
    auto scores = scorer.score_batch(qf, 9, corpus.flat, corpus.counts, dim);
    REQUIRE(scores.has_value());
    REQUIRE(scores->size() == corpus.counts.size());
    for (std::size_t i = 0; i < scores->size(); ++i) {
      REQUIRE_THAT((*scores)[i], WithinAbs(test::reference_maxsim(query, corpus.nested[i]), 1e-3));
    }
  }
}

TEST_CASE("uniform and variable paths agree when lengths are uniform", "[scorer]") {
  std::mt19937 rng(23);
  const std::size_t dim = 24;
  const auto corpus = make_corpus({40, 40, 40, 40, 40}, dim, rng);
  const auto qf = test::flatten(test::random_tokens(6, dim, rng));

  BatchScorerOptions uniform_opts;
  BatchScorerOptions variable_opts;
  variable_opts.detect_uniform = false;

  const auto& ops = kernels::select_backend_auto();
  BatchScorer uniform(ops, uniform_opts);
  BatchScorer variable(ops, variable_opts);

  for (auto mode : {ScoreMode::Raw, ScoreMode::Normalized}) {
    auto a = uniform.score_batch(qf, 6, corpus.flat, corpus.counts, dim, mode);
    auto b = variable.score_batch(qf, 6, corpus.flat, corpus.counts, dim, mode);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->size() == b->size());
    for (std::size_t i = 0; i < a->size(); ++i) {
      REQUIRE_THAT((*a)[i], WithinAbs((*b)[i], 1e-6));
    }
  }
}

TEST_CASE("degenerate inputs score zero or nothing", "[scorer]") {
  BatchScorer scorer(kernels::select_backend("scalar"));
  const std::vector<float> docs{1, 0, 0, 1, 1, 0};
  const std::vector<std::uint32_t> counts{1, 0, 2};

  SECTION("empty query gives one zero per document") {
    auto s = scorer.score_batch({}, 0, docs, counts, 2);
    REQUIRE(s.has_value());
    REQUIRE(*s == std::vector<float>{0.0f, 0.0f, 0.0f});
  }
  SECTION("empty corpus gives an empty result") {
    const std::vector<float> q{1, 0};
    auto s = scorer.score_batch(q, 1, {}, {}, 2);
    REQUIRE(s.has_value());
    REQUIRE(s->empty());
  }
  SECTION("empty document scores zero") {
    const std::vector<float> q{1, 0};
    auto s = scorer.score_batch(q, 1, docs, counts, 2);
    REQUIRE(s.has_value());
    REQUIRE((*s)[0] == 1.0f);
    REQUIRE((*s)[1] == 0.0f);
    REQUIRE((*s)[2] == 1.0f);
  }
}

TEST_CASE("score_batch rejects inconsistent buffers", "[scorer]") {
  BatchScorer scorer(kernels::select_backend("scalar"));
  const std::vector<float> q{1, 0};
  const std::vector<float> docs{1, 0, 0};
  const std::vector<std::uint32_t> counts{2};

  auto s = scorer.score_batch(q, 1, docs, counts, 2);
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.error().code == core::error_code::invalid_argument);
  REQUIRE(s.error().message == "document buffer length 3 does not match expected token_count*dim=4");

  auto z = scorer.score_batch(q, 1, {}, {}, 0);
  REQUIRE_FALSE(z.has_value());
}

TEST_CASE("preloaded corpus: load, search, replace, clear", "[scorer][preload]") {
  std::mt19937 rng(31);
  const std::size_t dim = 48;
  const auto corpus = make_corpus({128, 256, 192}, dim, rng);
  REQUIRE(corpus.flat.size() == 27648);
  const auto qf = test::flatten(test::random_tokens(4, dim, rng));

  BatchScorer scorer(kernels::select_backend_auto());
  REQUIRE(scorer.num_documents_loaded() == 0);

  SECTION("search before load is empty") {
    auto s = scorer.search_preloaded(qf, 4);
    REQUIRE(s.has_value());
    REQUIRE(s->empty());
  }

  REQUIRE(scorer.load_documents(corpus.flat, corpus.counts, dim).has_value());
  REQUIRE(scorer.num_documents_loaded() == 3);
  REQUIRE(scorer.dimension_loaded() == dim);

  SECTION("search matches score_batch and is idempotent") {
    auto direct = scorer.score_batch(qf, 4, corpus.flat, corpus.counts, dim);
    auto first = scorer.search_preloaded(qf, 4);
    auto second = scorer.search_preloaded(qf, 4);
    REQUIRE(direct.has_value());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == *second);
    REQUIRE(*first == *direct);
  }

  SECTION("caller buffers can change after load") {
    auto before = scorer.search_preloaded(qf, 4);
    auto mutated = corpus.flat;
    REQUIRE(scorer.load_documents(mutated, corpus.counts, dim).has_value());
    std::fill(mutated.begin(), mutated.end(), 0.0f);
    auto after = scorer.search_preloaded(qf, 4);
    REQUIRE(*before == *after);
  }

  SECTION("failed load keeps the previous corpus") {
    auto before = scorer.search_preloaded(qf, 4);
    std::vector<float> short_buf(corpus.flat.begin(), corpus.flat.end() - 1);
    auto r = scorer.load_documents(short_buf, corpus.counts, dim);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().message ==
            "document buffer length 27647 does not match expected token_count*dim=27648");
    REQUIRE(scorer.num_documents_loaded() == 3);
    REQUIRE(*scorer.search_preloaded(qf, 4) == *before);
  }

  SECTION("successful load replaces the corpus") {
    const auto other = make_corpus({3, 3}, dim, rng);
    REQUIRE(scorer.load_documents(std::span<const TokenEmbeddings>(other.nested), dim).has_value());
    REQUIRE(scorer.num_documents_loaded() == 2);
  }

  SECTION("query dimension must match the corpus") {
    const std::vector<float> wrong(4 * (dim - 1), 0.0f);
    auto s = scorer.search_preloaded(wrong, 4);
    REQUIRE_FALSE(s.has_value());
    REQUIRE(s.error().code == core::error_code::invalid_argument);

    const TokenEmbeddings nested_wrong{std::vector<float>(dim + 1, 0.0f)};
    REQUIRE_FALSE(scorer.search_preloaded(nested_wrong).has_value());
  }

  SECTION("empty query against a loaded corpus is zero-filled") {
    auto s = scorer.search_preloaded({}, 0);
    REQUIRE(s.has_value());
    REQUIRE(*s == std::vector<float>(3, 0.0f));
  }

  SECTION("clear drops the corpus") {
    scorer.clear_documents();
    REQUIRE(scorer.num_documents_loaded() == 0);
    REQUIRE(scorer.dimension_loaded() == 0);
    REQUIRE(scorer.search_preloaded(qf, 4)->empty());
  }
}

TEST_CASE("parallel scoring matches serial scoring", "[scorer][parallel]") {
  std::mt19937 rng(41);
  const std::size_t dim = 16;
  std::vector<std::size_t> lengths;
  for (int i = 0; i < 200; ++i) lengths.push_back(1 + static_cast<std::size_t>(i % 37));
  const auto corpus = make_corpus(lengths, dim, rng);
  const auto qf = test::flatten(test::random_tokens(5, dim, rng));

  BatchScorerOptions par;
  par.parallel = true;
  par.parallel_min_docs = 1;
  const auto& ops = kernels::select_backend_auto();
  BatchScorer serial(ops);
  BatchScorer parallel(ops, par);

  auto a = serial.score_batch(qf, 5, corpus.flat, corpus.counts, dim);
  auto b = parallel.score_batch(qf, 5, corpus.flat, corpus.counts, dim);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(*a == *b);
}

TEST_CASE("cosine similarity normalizes copies on ingest", "[scorer][cosine]") {
  BatchScorerOptions opts;
  opts.similarity = Similarity::Cosine;
  BatchScorer scorer(kernels::select_backend("scalar"), opts);

  const std::vector<float> q{3, 0};
  const std::vector<float> docs{5, 0, 0, 2, -4, 0, 0, 0};
  const std::vector<std::uint32_t> counts{1, 1, 1, 1};

  auto s = scorer.score_batch(q, 1, docs, counts, 2);
  REQUIRE(s.has_value());
  REQUIRE_THAT((*s)[0], WithinAbs(1.0, 1e-6));
  REQUIRE_THAT((*s)[1], WithinAbs(0.0, 1e-6));
  REQUIRE_THAT((*s)[2], WithinAbs(-1.0, 1e-6));
  REQUIRE((*s)[3] == 0.0f); // zero vector stays zero

  REQUIRE(scorer.load_documents(docs, counts, 2).has_value());
  auto p = scorer.search_preloaded(q, 1);
  REQUIRE(p.has_value());
  REQUIRE(*p == *s);
}

TEST_CASE("verify_normalized rejects non-unit tokens", "[scorer]") {
  BatchScorerOptions opts;
  opts.verify_normalized = true;
  BatchScorer scorer(kernels::select_backend("scalar"), opts);

  const std::vector<float> unit{1, 0};
  const std::vector<float> loose{2, 0};
  const std::vector<std::uint32_t> counts{1};

  REQUIRE(scorer.score_batch(unit, 1, unit, counts, 2).has_value());
  auto bad = scorer.score_batch(unit, 1, loose, counts, 2);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::precondition_failed);

  auto bad_load = scorer.load_documents(loose, counts, 2);
  REQUIRE_FALSE(bad_load.has_value());
  REQUIRE(scorer.num_documents_loaded() == 0);
}

TEST_CASE("verify_normalized names the offending document on every path", "[scorer]") {
  BatchScorerOptions opts;
  opts.verify_normalized = true;
  BatchScorer scorer(kernels::select_backend("scalar"), opts);

  const std::vector<float> query{1, 0};
  const std::vector<float> docs{1, 0, 0, 1, 2, 0};
  const std::vector<std::uint32_t> counts{2, 1};

  auto borrowed = scorer.score_batch(query, 1, docs, counts, 2);
  REQUIRE_FALSE(borrowed.has_value());
  REQUIRE(borrowed.error().message.find("document 1 token 0 has L2 norm 2") != std::string::npos);

  auto loaded = scorer.load_documents(docs, counts, 2);
  REQUIRE_FALSE(loaded.has_value());
  REQUIRE(loaded.error().message.find("document 1 token 0 has L2 norm 2") != std::string::npos);
}

template <typename Scorer>
concept exposes_score_view = requires(const Scorer& s, const QueryView& q, const CorpusView& c,
                                      std::span<float> out) {
  s.score_view(q, c, ScoreMode::Raw, out);
};

TEST_CASE("raw output spans are not part of the scorer interface", "[scorer]") {
  STATIC_REQUIRE_FALSE(exposes_score_view<BatchScorer>);
}

TEST_CASE("options validation", "[scorer]") {
  BatchScorerOptions ok;
  REQUIRE(validate_options(ok).has_value());

  BatchScorerOptions bad_tol;
  bad_tol.normalization_tolerance = -1.0f;
  REQUIRE(validate_options(bad_tol).error().code == core::error_code::config_invalid);

  BatchScorerOptions bad_block;
  bad_block.query_block = 64;
  REQUIRE_FALSE(validate_options(bad_block).has_value());
}

TEST_CASE("searches run concurrently with loads", "[scorer][preload][concurrency]") {
  std::mt19937 rng(53);
  const std::size_t dim = 8;
  const auto a = make_corpus({4, 4, 4}, dim, rng);
  const auto b = make_corpus({2, 6}, dim, rng);
  const auto qf = test::flatten(test::random_tokens(3, dim, rng));

  BatchScorer scorer(kernels::select_backend_auto());
  REQUIRE(scorer.load_documents(a.flat, a.counts, dim).has_value());
  const auto expect_a = *scorer.search_preloaded(qf, 3);
  REQUIRE(scorer.load_documents(b.flat, b.counts, dim).has_value());
  const auto expect_b = *scorer.search_preloaded(qf, 3);

  std::atomic<bool> stop{false};
  std::atomic<int> mismatches{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        auto s = scorer.search_preloaded(qf, 3);
        if (!s || (*s != expect_a && *s != expect_b)) mismatches.fetch_add(1);
      }
    });
  }
  for (int i = 0; i < 200; ++i) {
    const auto& c = (i % 2 == 0) ? a : b;
    if (!scorer.load_documents(c.flat, c.counts, dim)) mismatches.fetch_add(1);
  }
  stop.store(true);
  for (auto& th : readers) th.join();
  REQUIRE(mismatches.load() == 0);
}
