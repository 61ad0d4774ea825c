#pragma once

#include "ind/candle.h"
#include "util/config.h"

#include <optional>
#include <vector>

enum class Trend { Up, Down, Sideways };

struct EMA {
  std::vector<double> values;

  EMA() noexcept = default;
  EMA(const std::vector<double>& prices, int period) noexcept;
};

// Wilder smoothed RSI, values[i] is NaN until `period` deltas are available
struct RSI {
  std::vector<double> values;

 private:
  int period;
  double last_price = 0.0;
  double avg_gain = 0.0;
  double avg_loss = 0.0;

 public:
  RSI(const std::vector<double>& prices, int period = 14) noexcept;

  void push_back(double price) noexcept;
};

struct MACD {
  std::vector<double> macd_line;
  EMA signal_ema;
  std::vector<double> histogram;

 private:
  EMA fast_ema;
  EMA slow_ema;

 public:
  MACD(const std::vector<double>& prices,
       int fast = 12,
       int slow = 26,
       int signal = 9) noexcept;
};

struct IndicatorSet {
  double rsi = 50.0;
  double macd = 0.0;
  double bollinger_position = 0.0;
  double volume_ratio = 1.0;
  Trend trend = Trend::Sideways;

  double roc = 0.0;

  std::optional<double> sma5;
  std::optional<double> sma5_prev;
  std::optional<double> sma20;
  std::optional<double> sma50;
};

// Mean of the `period` values ending `offset` elements before the back
std::optional<double> sma(const std::vector<double>& values,
                          size_t period,
                          size_t offset = 0) noexcept;

double bollinger_position(const std::vector<double>& prices,
                          size_t period,
                          double k) noexcept;

double volume_ratio(const std::vector<double>& volumes, size_t period) noexcept;

Trend trend_direction(const std::vector<double>& prices,
                      const IndicatorsConfig& cfg) noexcept;

double rate_of_change(const std::vector<double>& prices, size_t period) noexcept;

// Collapses consecutive groups of `n` bars into one, newest group may be short
std::vector<double> resample_last(const std::vector<double>& prices, size_t n);

// Never fails; anything below its lookback stays at the neutral default
IndicatorSet compute_indicators(const std::vector<Candle>& candles,
                                const IndicatorsConfig& cfg) noexcept;
