#pragma once

#include "core/history.h"
#include "core/snapshot.h"
#include "ind/indicators.h"
#include "sig/verdict.h"
#include "util/config.h"

struct TurnaroundCheck {
  bool passed = false;
  int loss_quarters = 0;
  double improvement = 0.0;
  double confidence = 0.0;
  std::string reason = "";
};

TurnaroundCheck check_turnaround(const StockSnapshot& s,
                                 const TurnaroundConfig& cfg);

struct CrossoverCheck {
  std::optional<double> ma5;
  std::optional<double> crossover;
  std::vector<std::string> failed = {};
};

CrossoverCheck check_ma5_crossover(const StockSnapshot& s,
                                   const IndicatorSet& ind,
                                   const TurnaroundConfig& cfg);

// Every failing entry sub-condition, empty when all pass
std::vector<std::string> failed_entry_conditions(const StockSnapshot& s,
                                                 const IndicatorSet& ind,
                                                 const TurnaroundConfig& cfg);

// Loss-to-profit turnaround confirmed by price crossing above a rising MA5.
// Appends a PatternB record on detection.
DetectionVerdict detect_turnaround(const StockSnapshot& s,
                                   const IndicatorSet& ind,
                                   HistoryStore& history,
                                   const TurnaroundConfig& cfg) noexcept;
