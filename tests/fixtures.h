#pragma once

#include "core/history.h"
#include "core/snapshot.h"
#include "ind/candle.h"
#include "util/times.h"

#include <stdexcept>
#include <string>
#include <vector>

inline LocalTimePoint at(std::string_view datetime) {
  return datetime_to_local(datetime);
}

// Newly listed stock stuck at its limit on the day after earnings
inline StockSnapshot stop_high_snapshot() {
  StockSnapshot s;
  s.symbol = "5032";
  s.name = "Limit Up Co";
  s.price = 1500;
  s.change = 250;
  s.change_rate = 20.0;
  s.volume = 25'000'000;
  s.as_of = at("2024-05-15 15:00:00");
  s.listing_eligible = true;
  s.within_earnings_window = true;
  s.lower_shadow_ratio = 0.03;
  return s;
}

// Profitable quarter after three losses, crossing a rising MA5
inline StockSnapshot turnaround_snapshot() {
  StockSnapshot s;
  s.symbol = "4385";
  s.name = "Turnaround Co";
  s.price = 890;
  s.change = 24.2;
  s.change_rate = 2.8;
  s.volume = 12'000'000;
  s.as_of = at("2024-08-09 15:00:00");
  s.signals.rsi = 62;
  s.signals.volume_ratio = 1.8;
  s.consecutive_loss_quarters = 3;
  s.latest_quarter_profit = true;
  s.ma5_crossover = 0.025;
  return s;
}

inline std::vector<Candle> daily_candles(const std::vector<double>& closes,
                                         LocalTimePoint last_day,
                                         int64_t volume = 1'000'000) {
  std::vector<Candle> res;
  auto n = static_cast<int>(closes.size());
  for (int i = 0; i < n; i++) {
    Candle c;
    c.datetime = last_day - days{n - 1 - i};
    c.open = closes[i];
    c.high = closes[i];
    c.low = closes[i];
    c.close = closes[i];
    c.volume = volume;
    res.push_back(c);
  }
  return res;
}

inline std::vector<double> linear(double start, double step, size_t n) {
  std::vector<double> res;
  for (size_t i = 0; i < n; i++)
    res.push_back(start + step * i);
  return res;
}

inline HistoryRecord history_record(const std::string& symbol,
                                    DetectionType type,
                                    LocalTimePoint when,
                                    double strength = 0.0) {
  HistoryRecord rec;
  rec.symbol = symbol;
  rec.type = type;
  rec.timestamp = when;
  rec.reason = "fixture";
  rec.strength = strength;
  return rec;
}

// Fails every write, used to drive detectors into their error path
class BrokenHistoryStore : public HistoryStore {
 public:
  void record(const HistoryRecord&) override {
    throw std::runtime_error("disk full");
  }
  bool record_unless_since(const HistoryRecord&, LocalTimePoint) override {
    throw std::runtime_error("disk full");
  }
  std::vector<HistoryRecord> query(const std::string&,
                                   HistoryQuery) const override {
    return {};
  }
};
