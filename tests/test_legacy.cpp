#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fixtures.h"
#include "sig/legacy.h"

#include <utility>

using namespace Catch;

inline StockSnapshot active_snapshot(double change_rate, int64_t volume) {
  StockSnapshot s;
  s.symbol = "6920";
  s.name = "Active Co";
  s.price = 1200;
  s.change_rate = change_rate;
  s.volume = volume;
  s.as_of = at("2024-05-15 15:00:00");
  return s;
}

inline bool says(const DetectionVerdict& v, std::string_view what) {
  return v.reason.find(what) != std::string::npos;
}

TEST_CASE("Legacy A needs a large move on heavy volume", "[legacy]") {
  LegacyConfig cfg;
  IndicatorSet ind;
  ind.rsi = 75;

  for (auto [cr, volume] : {std::pair{2.0, int64_t{25'000'000}},
                            std::pair{20.0, int64_t{10'000'000}},
                            std::pair{4.9, int64_t{3'000'000}}}) {
    auto v = detect_legacy_a(active_snapshot(cr, volume), ind, cfg);
    REQUIRE(v.pattern == Pattern::ALegacy);
    REQUIRE(v.outcome == Outcome::Rejected);
    REQUIRE(says(v, "below basic rule"));
  }
}

TEST_CASE("Legacy A needs confirming momentum", "[legacy]") {
  LegacyConfig cfg;
  auto s = active_snapshot(20, 25'000'000);

  SECTION("neutral indicators") {
    auto v = detect_legacy_a(s, IndicatorSet{}, cfg);
    REQUIRE(v.outcome == Outcome::Rejected);
    REQUIRE(v.reason == "no confirming momentum");
  }

  SECTION("overbought RSI alone") {
    IndicatorSet ind;
    ind.rsi = 72;
    auto v = detect_legacy_a(s, ind, cfg);
    REQUIRE(v.detected());
    REQUIRE(v.confidence == Approx(0.7));
    REQUIRE(v.strength == Approx(70.0));
    REQUIRE(v.evidence.matched_conditions.size() == 1);
    REQUIRE(says(v, "RSI 72.0"));
  }

  SECTION("every condition") {
    IndicatorSet ind;
    ind.rsi = 80;
    ind.trend = Trend::Up;
    ind.volume_ratio = 2.5;
    auto v = detect_legacy_a(s, ind, cfg);
    REQUIRE(v.detected());
    REQUIRE(v.evidence.matched_conditions.size() == 3);
    REQUIRE(says(v, "uptrend"));
  }
}

TEST_CASE("Legacy B lists every missed recovery condition", "[legacy]") {
  LegacyConfig cfg;
  IndicatorSet ind;

  auto v = detect_legacy_b(active_snapshot(1.0, 1'000'000), ind, cfg);
  REQUIRE(v.pattern == Pattern::BLegacy);
  REQUIRE(v.outcome == Outcome::Rejected);
  REQUIRE(v.reason.starts_with("recovery rule not met: "));
  REQUIRE(says(v, "RSI 50.0"));
  REQUIRE(says(v, "change rate 1.0%"));
  REQUIRE(says(v, "volume"));

  SECTION("only RSI short") {
    auto only = detect_legacy_b(active_snapshot(3, 6'000'000), ind, cfg);
    REQUIRE(only.outcome == Outcome::Rejected);
    REQUIRE(says(only, "RSI 50.0"));
    REQUIRE_FALSE(says(only, "change rate"));
  }
}

TEST_CASE("Legacy B needs a reversal sign", "[legacy]") {
  LegacyConfig cfg;
  auto s = active_snapshot(3, 6'000'000);
  IndicatorSet ind;
  ind.rsi = 65;

  SECTION("falling with no support") {
    ind.trend = Trend::Down;
    ind.macd = -1.5;
    ind.bollinger_position = -0.8;
    auto v = detect_legacy_b(s, ind, cfg);
    REQUIRE(v.outcome == Outcome::Rejected);
    REQUIRE(v.reason == "no reversal confirmation");
  }

  SECTION("sideways is enough") {
    auto v = detect_legacy_b(s, ind, cfg);
    REQUIRE(v.detected());
    REQUIRE(v.confidence == Approx(0.6));
    REQUIRE(v.strength == Approx(60.0));
    REQUIRE(says(v, "sideways"));
  }

  SECTION("positive MACD in a downtrend") {
    ind.trend = Trend::Down;
    ind.macd = 0.4;
    ind.bollinger_position = -0.9;
    auto v = detect_legacy_b(s, ind, cfg);
    REQUIRE(v.detected());
    REQUIRE(v.evidence.matched_conditions ==
            std::vector<std::string>{"MACD positive"});
  }
}
