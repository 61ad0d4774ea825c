#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/snapshot.h"
#include "fixtures.h"
#include "ind/indicators.h"

#include <cmath>

using namespace Catch;

TEST_CASE("Short series keep neutral defaults", "[indicators]") {
  IndicatorsConfig cfg;

  SECTION("no bars") {
    auto ind = compute_indicators({}, cfg);
    REQUIRE(ind.rsi == 50.0);
    REQUIRE(ind.macd == 0.0);
    REQUIRE(ind.bollinger_position == 0.0);
    REQUIRE(ind.volume_ratio == 1.0);
    REQUIRE(ind.trend == Trend::Sideways);
    REQUIRE_FALSE(ind.sma5.has_value());
  }

  SECTION("ten bars") {
    auto candles = daily_candles(linear(100, 1, 10), at("2024-03-01 15:00:00"));
    auto ind = compute_indicators(candles, cfg);
    REQUIRE(ind.rsi == 50.0);
    REQUIRE(ind.macd == 0.0);
    REQUIRE(ind.bollinger_position == 0.0);
    REQUIRE(ind.volume_ratio == 1.0);
    REQUIRE(ind.sma5.value() == Approx(107.0));
    REQUIRE_FALSE(ind.sma20.has_value());
  }
}

TEST_CASE("Directional series", "[indicators]") {
  IndicatorsConfig cfg;
  auto day = at("2024-03-01 15:00:00");

  SECTION("rising") {
    auto ind = compute_indicators(daily_candles(linear(1, 1, 30), day), cfg);
    REQUIRE(ind.rsi == Approx(100.0));
    REQUIRE(ind.macd > 0.0);
    REQUIRE(ind.trend == Trend::Up);
    REQUIRE(ind.bollinger_position > 0.0);
    REQUIRE(ind.bollinger_position <= 1.0);
    REQUIRE(ind.roc > 0.0);
  }

  SECTION("falling") {
    auto ind = compute_indicators(daily_candles(linear(100, -1, 30), day), cfg);
    REQUIRE(ind.rsi == Approx(0.0));
    REQUIRE(ind.macd < 0.0);
    REQUIRE(ind.trend == Trend::Down);
    REQUIRE(ind.bollinger_position < 0.0);
  }

  SECTION("alternating") {
    std::vector<double> prices;
    for (int i = 0; i < 15; i++)
      prices.push_back(i % 2 ? 11.0 : 10.0);
    RSI rsi{prices, 14};
    REQUIRE(rsi.values.size() == prices.size());
    REQUIRE(std::isnan(rsi.values.front()));
    REQUIRE(rsi.values.back() == Approx(50.0));
  }
}

TEST_CASE("Bollinger position is bounded", "[indicators]") {
  std::vector<double> flat(20, 100.0);
  REQUIRE(bollinger_position(flat, 20, 2.0) == 0.0);

  auto spiked = std::vector<double>(19, 100.0);
  spiked.push_back(200.0);
  REQUIRE(bollinger_position(spiked, 20, 2.0) == 1.0);

  auto crashed = std::vector<double>(19, 100.0);
  crashed.push_back(10.0);
  REQUIRE(bollinger_position(crashed, 20, 2.0) == -1.0);
}

TEST_CASE("Volume ratio against the prior average", "[indicators]") {
  std::vector<double> volumes(20, 1000.0);
  volumes.push_back(3000.0);
  REQUIRE(volume_ratio(volumes, 20) == Approx(3.0));

  volumes.pop_back();
  REQUIRE(volume_ratio(volumes, 20) == 1.0);
}

TEST_CASE("Moving averages and resampling", "[indicators]") {
  auto values = linear(1, 1, 12);

  REQUIRE(sma(values, 5).value() == Approx(10.0));
  REQUIRE(sma(values, 5, 1).value() == Approx(9.0));
  REQUIRE_FALSE(sma(values, 13).has_value());
  REQUIRE_FALSE(sma(values, 0).has_value());

  REQUIRE(resample_last(values, 5) == std::vector<double>{2, 7, 12});
  REQUIRE(resample_last(values, 1) == values);
  REQUIRE(resample_last(values, 0).empty());

  REQUIRE(rate_of_change({100, 110}, 1) == Approx(10.0));
  REQUIRE(rate_of_change({100}, 1) == 0.0);
}

TEST_CASE("Provider values override computed indicators", "[indicators]") {
  auto s = turnaround_snapshot();
  s.candles = daily_candles(linear(100, -1, 30), s.as_of);
  s.signals.trend = "up";
  s.signals.bollinger_position = 2.5;
  s.signals.ma5 = 870;

  auto ind = s.indicators({});
  REQUIRE(ind.rsi == 62.0);
  REQUIRE(ind.volume_ratio == 1.8);
  REQUIRE(ind.trend == Trend::Up);
  REQUIRE(ind.bollinger_position == 1.0);
  REQUIRE(ind.sma5.value() == 870.0);
  REQUIRE(ind.macd < 0.0);

  REQUIRE(parse_trend("bearish") == Trend::Down);
  REQUIRE(parse_trend("flat") == Trend::Sideways);
}
