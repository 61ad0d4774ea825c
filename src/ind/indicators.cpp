#include "ind/indicators.h"
#include "util/math.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

EMA::EMA(const std::vector<double>& prices, int period) noexcept
    : values(prices.size()) {
  auto n = static_cast<int>(prices.size());

  double sma = 0;
  for (int i = 0; i < std::min(period, n); i++) {
    sma = sma * i / (i + 1) + prices[i] / (i + 1);
    values[i] = sma;
  }

  auto alpha = 2.0 / (period + 1);
  for (int i = period; i < n; i++)
    values[i] = (prices[i] - values[i - 1]) * alpha + values[i - 1];
}

inline double rsi_of(double avg_gain, double avg_loss) {
  if (avg_gain == 0.0 && avg_loss == 0.0)
    return 50.0;
  double rs = avg_loss == 0.0 ? std::numeric_limits<double>::infinity()
                              : avg_gain / avg_loss;
  return 100.0 - (100.0 / (1.0 + rs));
}

RSI::RSI(const std::vector<double>& prices, int period) noexcept
    : values(), period(period) {
  if (prices.size() < size_t(period + 1))
    return;

  values.reserve(prices.size());
  values.push_back(std::numeric_limits<double>::quiet_NaN());

  double gains = 0.0, losses = 0.0;
  for (int i = 1; i <= period; ++i) {
    double change = prices[i] - prices[i - 1];
    gains += change > 0 ? change : 0.0;
    losses += change < 0 ? -change : 0.0;
    values.push_back(std::numeric_limits<double>::quiet_NaN());
  }

  avg_gain = gains / period;
  avg_loss = losses / period;
  values.back() = rsi_of(avg_gain, avg_loss);
  last_price = prices[period];

  for (size_t i = period + 1; i < prices.size(); ++i)
    push_back(prices[i]);
}

void RSI::push_back(double price) noexcept {
  double change = price - last_price;
  last_price = price;

  double gain = change > 0 ? change : 0.0;
  double loss = change < 0 ? -change : 0.0;

  avg_gain = (avg_gain * (period - 1) + gain) / period;
  avg_loss = (avg_loss * (period - 1) + loss) / period;

  values.push_back(rsi_of(avg_gain, avg_loss));
}

MACD::MACD(const std::vector<double>& prices,
           int fast,
           int slow,
           int signal) noexcept
    : macd_line(prices.size()),
      fast_ema{prices, fast},
      slow_ema{prices, slow}  //
{
  size_t n = prices.size();
  for (size_t i = 0; i < n; ++i)
    macd_line[i] = fast_ema.values[i] - slow_ema.values[i];

  signal_ema = EMA(macd_line, signal);
  auto& signal_line = signal_ema.values;
  for (size_t i = 0; i < n; ++i)
    histogram.push_back(macd_line[i] - signal_line[i]);
}

std::optional<double> sma(const std::vector<double>& values,
                          size_t period,
                          size_t offset) noexcept {
  if (period == 0 || values.size() < period + offset)
    return std::nullopt;
  auto last = values.end() - offset;
  return mean(last - period, last);
}

double bollinger_position(const std::vector<double>& prices,
                          size_t period,
                          double k) noexcept {
  if (period == 0 || prices.size() < period)
    return 0.0;

  auto first = prices.end() - period;
  auto mid = mean(first, prices.end());
  auto band = k * stddev(first, prices.end());
  if (band <= 0.0)
    return 0.0;

  return std::clamp((prices.back() - mid) / band, -1.0, 1.0);
}

double volume_ratio(const std::vector<double>& volumes, size_t period) noexcept {
  if (period == 0 || volumes.size() < period + 1)
    return 1.0;

  auto avg = *sma(volumes, period, 1);
  if (avg <= 0.0)
    return 1.0;
  return volumes.back() / avg;
}

Trend trend_direction(const std::vector<double>& prices,
                      const IndicatorsConfig& cfg) noexcept {
  auto recent = cfg.trend_recent;
  if (recent == 0 || prices.size() < 2 * recent)
    return Trend::Sideways;

  auto window = std::min(cfg.trend_window, prices.size());
  auto recent_avg = *sma(prices, recent);
  auto prior_avg = *sma(prices, window - recent, recent);
  if (prior_avg <= 0.0)
    return Trend::Sideways;

  auto change = (recent_avg - prior_avg) / prior_avg;
  if (change > cfg.trend_deadband)
    return Trend::Up;
  if (change < -cfg.trend_deadband)
    return Trend::Down;
  return Trend::Sideways;
}

double rate_of_change(const std::vector<double>& prices, size_t period) noexcept {
  if (period == 0 || prices.size() <= period)
    return 0.0;
  auto base = prices[prices.size() - 1 - period];
  if (base <= 0.0)
    return 0.0;
  return (prices.back() - base) / base * 100.0;
}

std::vector<double> resample_last(const std::vector<double>& prices, size_t n) {
  std::vector<double> out;
  if (n == 0)
    return out;

  for (size_t i = prices.size(); i > 0; i -= std::min(i, n))
    out.push_back(prices[i - 1]);

  std::reverse(out.begin(), out.end());
  return out;
}

IndicatorSet compute_indicators(const std::vector<Candle>& candles,
                                const IndicatorsConfig& cfg) noexcept {
  IndicatorSet ind;
  if (candles.empty())
    return ind;

  std::vector<double> closes, volumes;
  closes.reserve(candles.size());
  volumes.reserve(candles.size());
  for (auto& c : candles) {
    closes.push_back(c.close);
    volumes.push_back(static_cast<double>(c.volume));
  }

  if (closes.size() > size_t(cfg.rsi_period)) {
    RSI rsi{closes, cfg.rsi_period};
    if (!rsi.values.empty() && std::isfinite(rsi.values.back()))
      ind.rsi = rsi.values.back();
  }

  if (closes.size() >= size_t(cfg.macd_slow)) {
    MACD macd{closes, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal};
    ind.macd = macd.macd_line.back();
  }

  ind.bollinger_position =
      bollinger_position(closes, cfg.bollinger_period, cfg.bollinger_k);
  ind.volume_ratio = volume_ratio(volumes, cfg.volume_period);
  ind.trend = trend_direction(closes, cfg);
  ind.roc = rate_of_change(closes, cfg.roc_period);

  ind.sma5 = sma(closes, 5);
  ind.sma5_prev = sma(closes, 5, 1);
  ind.sma20 = sma(closes, 20);
  ind.sma50 = sma(closes, 50);

  return ind;
}
