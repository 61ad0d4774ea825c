#include "core/scanner.h"
#include "mt/sleeper.h"
#include "mt/thread_pool.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

std::vector<TradingSignal> ScanReport::with_detections() const {
  std::vector<TradingSignal> res;
  std::copy_if(signals.begin(), signals.end(), std::back_inserter(res),
               [](auto& s) { return s.any_detected(); });
  return res;
}

std::vector<TradingSignal> ScanReport::executable() const {
  std::vector<TradingSignal> res;
  std::copy_if(signals.begin(), signals.end(), std::back_inserter(res),
               [](auto& s) { return s.executable; });
  return res;
}

TradingSignal Scanner::scan_one(const std::string& symbol) {
  auto snap = provider.snapshot(symbol);
  if (!snap)
    throw std::runtime_error("no market data");

  if (snap->quarters.empty() && !snap->latest_quarter_profit)
    snap->quarters = provider.earnings(symbol);

  calendar.enrich(*snap);
  return integrator.evaluate(*snap, engine);
}

ScanReport Scanner::scan(std::vector<std::string> symbols) {
  ScanReport report;

  // one evaluation per symbol per scan
  std::unordered_set<std::string> seen;
  std::erase_if(symbols, [&](auto& sym) { return !seen.insert(sym).second; });
  report.n_requested = symbols.size();

  std::mutex mtx;
  std::atomic<size_t> n_started{0};
  auto total = symbols.size();

  auto func = [&](std::string&& symbol) {
    auto n = n_started++;
    if (!sleeper.sleep_for(cfg.delay(n, total)))
      return false;

    try {
      auto sig = scan_one(symbol);
      std::lock_guard lk{mtx};
      if (sig.action == Action::Error)
        report.failures.push_back({symbol, sig.error});
      report.signals.push_back(std::move(sig));
    } catch (const std::exception& ex) {
      spdlog::error("[scan] ({}) {}", symbol, ex.what());
      std::lock_guard lk{mtx};
      report.failures.push_back({symbol, ex.what()});
    }

    return true;
  };

  Timer timer;
  {
    thread_pool<std::string> pool{cfg.concurrency, func, std::move(symbols)};
  }
  report.elapsed_ms = timer.diff_ms();
  report.interrupted = sleeper.should_shutdown();

  std::stable_sort(report.signals.begin(), report.signals.end(),
                   [](auto& l, auto& r) { return l.strength > r.strength; });

  spdlog::info("[scan] {} symbols, {} signals, {} failures in {:.0f}ms",
               report.n_requested, report.signals.size(),
               report.failures.size(), report.elapsed_ms);
  return report;
}
