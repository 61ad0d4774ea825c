#pragma once

#include "sig/trading_signal.h"
#include "util/times.h"

#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

// Bounded log of emitted signals plus the latest signal per symbol while it
// is still fresh.
class SignalLog {
  const size_t capacity;
  const hours active_window;

  mutable std::mutex mtx;
  std::deque<TradingSignal> signals;
  std::unordered_map<std::string, TradingSignal> active;
  std::map<Action, size_t> by_action;
  size_t total = 0;

 public:
  SignalLog(size_t capacity = 1000, hours active_window = hours{24}) noexcept
      : capacity{capacity ? capacity : 1}, active_window{active_window} {}

  void add(const TradingSignal& sig);

  // Drops expired entries as a side effect
  std::vector<TradingSignal> active_signals(LocalTimePoint now);
  std::vector<TradingSignal> recent(size_t n) const;

  size_t size() const;
  size_t total_signals() const;
  size_t count(Action action) const;
};
