#include "core/snapshot.h"

#include <algorithm>
#include <cmath>
#include <format>

double StockSnapshot::prev_close() const {
  auto denom = 1.0 + change_rate / 100.0;
  if (denom <= 0.0)
    return price;
  return price / denom;
}

std::vector<double> StockSnapshot::closes() const {
  std::vector<double> res;
  res.reserve(candles.size());
  for (auto& c : candles)
    res.push_back(c.close);
  return res;
}

std::optional<std::string> StockSnapshot::invalid_reason() const {
  if (symbol.empty())
    return "missing symbol";
  if (!std::isfinite(price) || price <= 0.0)
    return std::format("invalid price {}", price);
  if (!std::isfinite(change_rate))
    return "invalid change rate";
  if (volume < 0)
    return std::format("invalid volume {}", volume);
  if (change_rate <= -100.0)
    return std::format("change rate {:.1f}% out of range", change_rate);
  return std::nullopt;
}

Trend parse_trend(std::string_view str) noexcept {
  if (str == "up" || str == "bullish")
    return Trend::Up;
  if (str == "down" || str == "bearish")
    return Trend::Down;
  return Trend::Sideways;
}

IndicatorSet StockSnapshot::indicators(const IndicatorsConfig& cfg) const noexcept {
  auto ind = compute_indicators(candles, cfg);

  auto& s = signals;
  if (s.rsi)
    ind.rsi = *s.rsi;
  if (s.macd)
    ind.macd = *s.macd;
  if (s.bollinger_position)
    ind.bollinger_position = std::clamp(*s.bollinger_position, -1.0, 1.0);
  if (s.volume_ratio)
    ind.volume_ratio = *s.volume_ratio;
  if (s.trend)
    ind.trend = parse_trend(*s.trend);
  if (s.ma5)
    ind.sma5 = *s.ma5;
  if (s.ma5_prev)
    ind.sma5_prev = *s.ma5_prev;

  return ind;
}
