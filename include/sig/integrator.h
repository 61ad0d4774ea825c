#pragma once

#include "core/history.h"
#include "core/snapshot.h"
#include "ind/indicators.h"
#include "sig/signal_log.h"
#include "sig/trading_signal.h"
#include "util/config.h"

// Technical sub-scores, each 0..100
double momentum_score(const IndicatorSet& ind);
double trend_score(const IndicatorSet& ind);
double volume_score(double volume_ratio);
double support_resistance_score(double change_rate);
double volatility_score(double change_rate);

// Agreement of daily, weekly and short-term trend directions
double timeframe_score(const StockSnapshot& s,
                       const IndicatorSet& ind,
                       const IndicatorsConfig& cfg);

double logic_score(const std::vector<DetectionVerdict>& detections,
                   const SignalConfig& cfg);

double composite_strength(const ComponentScores& scores,
                          const SignalConfig& cfg);

Action action_for(double strength,
                  double technical,
                  bool pattern_a,
                  const SignalConfig& cfg);

class SignalIntegrator {
  HistoryStore& history;
  SignalLog& log;

  TradingSignal integrate(const StockSnapshot& s, const EngineConfig& cfg);

 public:
  SignalIntegrator(HistoryStore& history, SignalLog& log) noexcept
      : history{history}, log{log} {}

  // Never throws, internal failures come back as Action::Error
  TradingSignal evaluate(const StockSnapshot& s,
                         const EngineConfig& cfg) noexcept;
};
