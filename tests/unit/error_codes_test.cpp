#include <calibet/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using calibet::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::insufficient_data) == 4002u);
  REQUIRE(static_cast<unsigned>(error_code::shape_mismatch) == 4003u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("error code names", "[errors]") {
  using calibet::core::error_code;
  REQUIRE(calibet::core::to_string(error_code::numeric_failure) == "numeric_failure");
  REQUIRE(calibet::core::to_string(error_code::config_invalid) == "config_invalid");

  auto e = calibet::core::make_error(error_code::not_found, "missing", "registry");
  REQUIRE(e.error().code == error_code::not_found);
  REQUIRE(e.error().component == "registry");
}
