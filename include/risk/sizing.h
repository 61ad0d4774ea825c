#pragma once

#include "util/config.h"

#include <cstdint>
#include <string>

struct PositionSize {
  int64_t shares = 0;
  double value = 0.0;
  double exposure = 0.0;  // fraction of the portfolio
  double risk_amount = 0.0;

  bool capped_by_exposure = false;
  std::string rationale = "";

  PositionSize() = default;
  PositionSize(double entry, double stop, const RiskConfig& cfg);
};
