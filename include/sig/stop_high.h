#pragma once

#include "core/history.h"
#include "core/snapshot.h"
#include "ind/indicators.h"
#include "sig/verdict.h"
#include "util/config.h"

struct EarningsWindow {
  bool inside = false;
  std::optional<int> days_since;
};

EarningsWindow earnings_window(const StockSnapshot& s, int post_earnings_days);

// Estimated lower shadow: explicit fact, then today's candle, then a
// change-rate based guess.
double estimate_lower_shadow(const StockSnapshot& s);

// Implied stop-high price for the session
double implied_stop_high(const StockSnapshot& s);

// Stop-high sticking breakout. Appends a StopHigh observation once per day
// when the price sticks to the limit, and a PatternA record on detection.
DetectionVerdict detect_stop_high(const StockSnapshot& s,
                                  const IndicatorSet& ind,
                                  HistoryStore& history,
                                  const StopHighConfig& cfg) noexcept;
