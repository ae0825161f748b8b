#include <hybridkb/error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <expected>

TEST_CASE("error codes stable subset", "[errors]") {
  using hybridkb::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::malformed_predicate) == 4002u);
  REQUIRE(static_cast<unsigned>(error_code::unavailable) == 7001u);
  REQUIRE(static_cast<unsigned>(error_code::deadline_exceeded) == 8002u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::index_unavailable) == 9003u);
}

TEST_CASE("error code names", "[errors]") {
  using hybridkb::core::error_code;
  using hybridkb::core::to_string;
  STATIC_REQUIRE(to_string(error_code::malformed_predicate) == "malformed_predicate");
  REQUIRE(to_string(error_code::index_unavailable) == "index_unavailable");
  REQUIRE(to_string(error_code::deadline_exceeded) == "deadline_exceeded");
}

TEST_CASE("make_error fills the unexpected branch", "[errors]") {
  using namespace hybridkb::core;
  auto f = []() -> std::expected<int, error> {
    return make_error(error_code::not_found, "missing", "test");
  };
  auto r = f();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::not_found);
  REQUIRE(r.error().message == "missing");
  REQUIRE(r.error().component == "test");
}
