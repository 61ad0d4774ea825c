#pragma once

#include "util/times.h"

#include <algorithm>
#include <cstdint>

struct Candle {
  LocalTimePoint datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  int64_t volume = 0;

  LocalTimePoint time() const { return datetime; }

  // Fraction of the session range below the body, 0 for a flat candle
  double lower_shadow_ratio() const {
    auto range = high - low;
    if (range <= 0.0)
      return 0.0;
    return (std::min(open, close) - low) / range;
  }
};
