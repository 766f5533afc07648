#include <catch2/catch_all.hpp>
#include <colscore/kernels/dispatch.hpp>
#include <colscore/kernels/backends/scalar.hpp>
#include <algorithm>
#include <limits>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tests/support/embedding_fixtures.hpp>

using namespace colscore::kernels;
using Catch::Matchers::WithinAbs;

static void make_nonzero(std::vector<float>& v, std::mt19937& rng){
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  do { for (auto& x : v) x = dist(rng); } while (std::all_of(v.begin(), v.end(), [](float x){return x==0.0f;}));
}

TEST_CASE("backend selection returns stable references", "[kernels][dispatch]") {
  const auto& s1 = select_backend("scalar");
  const auto& s2 = select_backend("scalar");
  REQUIRE(&s1 == &s2);
  REQUIRE(std::string_view(s1.name) == "scalar");
  REQUIRE(s1.lanes == 1);

  for (const char* name : {"sse", "avx2", "neon", "auto"}) {
    const auto& a = select_backend(name);
    const auto& b = select_backend(name);
    REQUIRE(&a == &b);
  }

  const auto& u = select_backend("does-not-exist");
  REQUIRE(&u == &s1); // fallback to scalar

  const auto& auto1 = select_backend_auto();
  const auto& auto2 = select_backend_auto();
  REQUIRE(&auto1 == &auto2);
  REQUIRE(is_known_backend(auto1.name));
}

TEST_CASE("backend names and fallbacks follow CPU features", "[kernels][dispatch]") {
  REQUIRE(is_known_backend("scalar"));
  REQUIRE(is_known_backend("sse"));
  REQUIRE(is_known_backend("avx2"));
  REQUIRE(is_known_backend("neon"));
  REQUIRE(is_known_backend("auto"));
  REQUIRE_FALSE(is_known_backend("avx512"));
  REQUIRE_FALSE(is_known_backend("SCALAR"));

  const auto& f = cpu_features();
  const std::string avx2_name = select_backend("avx2").name;
#if defined(__x86_64__) || defined(_M_X64)
  REQUIRE(f.has_sse2);
  REQUIRE(std::string_view(select_backend("sse").name) == "sse");
  REQUIRE(avx2_name == ((f.has_avx2 && f.has_fma) ? "avx2" : "sse"));
  REQUIRE(std::string_view(select_backend("neon").name) == "scalar");
#elif defined(__aarch64__)
  REQUIRE(f.has_neon);
  REQUIRE(std::string_view(select_backend("neon").name) == "neon");
  REQUIRE(avx2_name == "scalar");
#else
  REQUIRE(avx2_name == "scalar");
#endif
}

TEST_CASE("every available backend matches scalar within tolerance", "[kernels][dispatch]") {
  const auto& scalar = get_scalar_ops();
  std::seed_seq seed{31,59,27}; std::mt19937 rng(seed);

  for (const auto* ops : colscore::test::available_backends()) {
    INFO("backend " << ops->name);
    for (int d : {1,3,4,7,8,15,16,17,31,48,64,128,130}) {
      std::vector<float> a(d), b(d);
      make_nonzero(a, rng); make_nonzero(b, rng);
      REQUIRE_THAT(ops->dot_product(a, b), WithinAbs(scalar.dot_product(a, b), 1e-4));
      REQUIRE_THAT(ops->squared_norm(a), WithinAbs(scalar.squared_norm(a), 1e-4));
    }
  }
}

TEST_CASE("max_dot_product evaluates rows exactly like dot_product", "[kernels][dispatch]") {
  std::mt19937 rng(2024);
  for (const auto* ops : colscore::test::available_backends()) {
    INFO("backend " << ops->name);
    for (std::size_t dim : {1u, 5u, 8u, 24u, 48u, 129u}) {
      for (std::size_t n : {0u, 1u, 3u, 4u, 5u, 9u, 17u}) {
        const auto q = colscore::test::random_unit(dim, rng);
        std::vector<float> rows;
        for (std::size_t t = 0; t < n; ++t) {
          const auto r = colscore::test::random_unit(dim, rng);
          rows.insert(rows.end(), r.begin(), r.end());
        }
        float expected = -std::numeric_limits<float>::infinity();
        for (std::size_t t = 0; t < n; ++t) {
          const float s = ops->dot_product(q, std::span<const float>(rows.data() + t * dim, dim));
          if (s > expected) expected = s;
        }
        REQUIRE(ops->max_dot_product(q, rows.data(), n, dim) == expected);
      }
    }
  }
}
