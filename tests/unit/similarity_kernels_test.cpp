#include <catch2/catch_all.hpp>
#include <colscore/kernels/similarity.hpp>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include <tests/support/embedding_fixtures.hpp>

using namespace colscore::kernels;
using Catch::Matchers::WithinAbs;

TEST_CASE("dot_product of a unit vector with itself is one", "[kernels][similarity]") {
  std::mt19937 rng(7);
  for (std::size_t d : {1u, 2u, 3u, 5u, 16u, 48u, 128u, 131u}) {
    const auto a = colscore::test::random_unit(d, rng);
    REQUIRE_THAT(dot_product(a, a), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(squared_norm(a), WithinAbs(1.0, 1e-5));
  }
}

TEST_CASE("dot_product of orthogonal and opposite unit vectors", "[kernels][similarity]") {
  SECTION("orthogonal") {
    std::vector<float> a(37, 0.0f), b(37, 0.0f);
    a[3] = 1.0f;
    b[36] = 1.0f;
    REQUIRE(dot_product(a, b) == 0.0f);
  }
  SECTION("negation") {
    std::mt19937 rng(11);
    const auto a = colscore::test::random_unit(67, rng);
    std::vector<float> neg(a.size());
    for (std::size_t i = 0; i < a.size(); ++i) neg[i] = -a[i];
    REQUIRE_THAT(dot_product(a, neg), WithinAbs(-1.0, 1e-5));
  }
}

TEST_CASE("dot_product covers remainder elements", "[kernels][similarity]") {
  // Integer-valued inputs make every partial sum exact
  for (std::size_t d = 1; d <= 23; ++d) {
    std::vector<float> a(d), b(d);
    float expected = 0.0f;
    for (std::size_t i = 0; i < d; ++i) {
      a[i] = static_cast<float>(i + 1);
      b[i] = static_cast<float>((i % 3) + 1);
      expected += a[i] * b[i];
    }
    REQUIRE(dot_product(a, b) == expected);
  }
}

TEST_CASE("max_dot_product returns the best row or -inf", "[kernels][similarity]") {
  const std::vector<float> q{1.0f, 0.0f, 0.0f};
  const std::vector<float> rows{
      0.0f, 1.0f, 0.0f,
      1.0f, 0.0f, 0.0f,
      -1.0f, 0.0f, 0.0f,
  };
  REQUIRE(max_dot_product(q, rows.data(), 3, 3) == 1.0f);
  REQUIRE(max_dot_product(q, rows.data(), 1, 3) == 0.0f);
  REQUIRE(max_dot_product(q, rows.data(), 0, 3) == -std::numeric_limits<float>::infinity());
}
