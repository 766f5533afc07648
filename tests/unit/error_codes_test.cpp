#include <colscore/error.hpp>
#include <catch2/catch_all.hpp>

#include <expected>

TEST_CASE("error codes stable subset", "[errors]") {
  using colscore::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::precondition_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
  REQUIRE(static_cast<unsigned>(error_code::out_of_range) == 9004u);
}

TEST_CASE("make_error fills every field", "[errors]") {
  using namespace colscore::core;
  std::expected<int, error> r = make_error(error_code::invalid_argument, "bad dim", "layout");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::invalid_argument);
  REQUIRE(r.error().message == "bad dim");
  REQUIRE(r.error().component == "layout");
}
