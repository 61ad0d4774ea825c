#pragma once

#include "ind/candle.h"
#include "ind/indicators.h"
#include "util/config.h"
#include "util/times.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Indicator values supplied by the data provider, these win over anything
// computed from the raw series.
struct PrecomputedSignals {
  std::optional<double> rsi;
  std::optional<double> macd;
  std::optional<double> bollinger_position;
  std::optional<double> volume_ratio;
  std::optional<std::string> trend;  // "up", "down" or "sideways"
  std::optional<double> ma5;
  std::optional<double> ma5_prev;
};

struct Quarter {
  std::string period;
  double net_income = 0.0;

  bool profitable() const { return net_income > 0.0; }
};

struct StockSnapshot {
  std::string symbol;
  std::string name;

  double price = 0.0;
  double change = 0.0;
  double change_rate = 0.0;  // percent
  int64_t volume = 0;
  LocalTimePoint as_of{};

  // Daily bars, oldest first
  std::vector<Candle> candles = {};
  PrecomputedSignals signals = {};

  // Listing / earnings facts from reference data
  std::optional<bool> listing_eligible;
  std::optional<double> years_listed;
  std::optional<bool> within_earnings_window;
  std::optional<LocalTimePoint> last_earnings_date;

  std::optional<double> lower_shadow_ratio;
  std::optional<double> stop_high_price;

  // Quarterly results newest first, or the summarized turnaround facts
  std::vector<Quarter> quarters = {};
  std::optional<int> consecutive_loss_quarters;
  std::optional<bool> latest_quarter_profit;
  std::optional<double> ma5_crossover;

  double prev_close() const;
  std::vector<double> closes() const;

  // Empty when the snapshot can be evaluated
  std::optional<std::string> invalid_reason() const;

  IndicatorSet indicators(const IndicatorsConfig& cfg) const noexcept;
};

Trend parse_trend(std::string_view str) noexcept;
