#pragma once

#include "core/calendar.h"
#include "core/provider.h"
#include "sig/integrator.h"
#include "util/config.h"

#include <string>
#include <vector>

struct ScanFailure {
  std::string symbol;
  std::string reason;
};

struct ScanReport {
  std::vector<TradingSignal> signals;  // strongest first
  std::vector<ScanFailure> failures;
  size_t n_requested = 0;
  double elapsed_ms = 0.0;
  bool interrupted = false;

  std::vector<TradingSignal> with_detections() const;
  std::vector<TradingSignal> executable() const;
};

// Fans a symbol list out over a bounded worker pool. A symbol that fails
// is logged and reported, it never aborts the batch.
class Scanner {
  MarketDataProvider& provider;
  SignalIntegrator& integrator;
  const Calendar& calendar;
  const EngineConfig& engine;
  const ScanConfig& cfg;

  TradingSignal scan_one(const std::string& symbol);

 public:
  Scanner(MarketDataProvider& provider,
          SignalIntegrator& integrator,
          const Calendar& calendar,
          const EngineConfig& engine,
          const ScanConfig& cfg) noexcept
      : provider{provider},
        integrator{integrator},
        calendar{calendar},
        engine{engine},
        cfg{cfg}  //
  {}

  ScanReport scan(std::vector<std::string> symbols);
};
