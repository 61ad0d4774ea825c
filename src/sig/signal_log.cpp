#include "sig/signal_log.h"

#include <algorithm>

void SignalLog::add(const TradingSignal& sig) {
  std::lock_guard lk{mtx};

  signals.push_back(sig);
  while (signals.size() > capacity)
    signals.pop_front();

  total++;
  by_action[sig.action]++;

  if (sig.action != Action::Error)
    active.insert_or_assign(sig.symbol, sig);
}

std::vector<TradingSignal> SignalLog::active_signals(LocalTimePoint now) {
  std::lock_guard lk{mtx};

  std::erase_if(active, [&](auto& kv) {
    return now - kv.second.timestamp >= active_window;
  });

  std::vector<TradingSignal> res;
  for (auto& [_, sig] : active)
    res.push_back(sig);

  std::sort(res.begin(), res.end(),
            [](auto& l, auto& r) { return l.strength > r.strength; });
  return res;
}

std::vector<TradingSignal> SignalLog::recent(size_t n) const {
  std::lock_guard lk{mtx};
  n = std::min(n, signals.size());
  return std::vector<TradingSignal>(signals.end() - n, signals.end());
}

size_t SignalLog::size() const {
  std::lock_guard lk{mtx};
  return signals.size();
}

size_t SignalLog::total_signals() const {
  std::lock_guard lk{mtx};
  return total;
}

size_t SignalLog::count(Action action) const {
  std::lock_guard lk{mtx};
  auto it = by_action.find(action);
  return it == by_action.end() ? 0 : it->second;
}
