#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/price_limit.h"

using namespace Catch;

TEST_CASE("Limit width follows the price bands", "[price_limit]") {
  REQUIRE(limit_width(99) == 30);
  REQUIRE(limit_width(100) == 50);
  REQUIRE(limit_width(1'250) == 300);
  REQUIRE(limit_width(1'500) == 400);
  REQUIRE(limit_width(3'000) == 700);
  REQUIRE(limit_width(50'000'000) == 3'000'000);
}

TEST_CASE("Limit stages widen the band", "[price_limit]") {
  REQUIRE(limit_width(1'250, 2) == 600);
  REQUIRE(limit_width(1'250, 3) == 900);
  REQUIRE(limit_width(1'250, 5) == 900);
  REQUIRE(limit_width(1'250, 0) == 300);
}

TEST_CASE("Limit prices", "[price_limit]") {
  REQUIRE(limit_up_price(1'250) == Approx(1'550));
  REQUIRE(limit_down_price(1'250) == Approx(950));
  REQUIRE(limit_down_price(50) == Approx(20));
  REQUIRE(limit_down_price(20) == Approx(1));
}
