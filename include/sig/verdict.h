#pragma once

#include "risk/risk.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Pattern { A, ALegacy, B, BLegacy };
enum class Outcome { Detected, Rejected, Error };

struct Evidence {
  // Stop-high sticking
  std::optional<double> stop_high_price;
  std::optional<double> limit_price;
  std::optional<double> reach_ratio;
  std::optional<bool> at_regulatory_limit;
  std::optional<double> lower_shadow_ratio;
  std::optional<int> days_since_earnings;

  // Turnaround
  std::optional<int> loss_quarters;
  std::optional<double> improvement_rate;
  std::optional<double> ma5;
  std::optional<double> ma5_crossover;

  std::vector<std::string> failed_conditions;
  std::vector<std::string> matched_conditions;
};

struct TradePlan {
  double entry = 0.0;
  double target = 0.0;
  double stop = 0.0;
  int max_holding_days = 0;
};

struct DetectionVerdict {
  Pattern pattern = Pattern::A;
  Outcome outcome = Outcome::Rejected;
  std::string reason;
  double strength = 0.0;
  double confidence = 0.0;
  Evidence evidence;
  std::optional<TradePlan> plan;
  std::optional<RiskAssessment> risk;

  bool detected() const { return outcome == Outcome::Detected; }

  static DetectionVerdict rejected(Pattern pattern,
                                   std::string reason,
                                   Evidence evidence = {}) {
    return {pattern, Outcome::Rejected, std::move(reason), 0.0, 0.0,
            std::move(evidence)};
  }

  static DetectionVerdict error(Pattern pattern, std::string_view what) {
    return {pattern, Outcome::Error, "evaluation error: " + std::string{what}};
  }
};
