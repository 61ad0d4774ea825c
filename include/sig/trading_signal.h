#pragma once

#include "risk/risk.h"
#include "risk/sizing.h"
#include "sig/verdict.h"
#include "util/times.h"

#include <string>
#include <vector>

// No cut point produces StrongSell, it is only part of the output vocabulary
enum class Action { StrongBuy, Buy, Watch, Hold, Sell, StrongSell, Error };

inline bool is_buy(Action a) {
  return a == Action::StrongBuy || a == Action::Buy;
}

struct ComponentScores {
  double logic = 0.0;
  double technical = 0.0;
  double timeframe = 0.0;
  double volume = 0.0;

  // technical breakdown
  double momentum = 0.0;
  double trend = 0.0;
  double support_resistance = 0.0;
  double volatility = 0.0;
};

struct TradingSignal {
  std::string symbol;
  std::string name;
  double price = 0.0;
  LocalTimePoint timestamp;

  Action action = Action::Hold;
  double strength = 0.0;
  double confidence = 0.0;

  double entry_price = 0.0;
  double profit_target = 0.0;
  double stop_loss = 0.0;
  double risk_reward = 0.0;

  PositionSize position;
  RiskAssessment risk;
  ComponentScores scores;
  std::vector<DetectionVerdict> detections = {};

  bool executable = false;
  std::vector<std::string> notes = {};
  std::string error = "";

  const DetectionVerdict* detection(Pattern p) const {
    for (auto& d : detections)
      if (d.pattern == p)
        return &d;
    return nullptr;
  }

  bool detected(Pattern p) const {
    auto d = detection(p);
    return d && d->detected();
  }

  bool any_detected() const {
    for (auto& d : detections)
      if (d.detected())
        return true;
    return false;
  }
};
