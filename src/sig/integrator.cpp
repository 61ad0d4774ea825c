#include "sig/integrator.h"
#include "sig/legacy.h"
#include "sig/stop_high.h"
#include "sig/turnaround.h"
#include "util/format.h"
#include "util/math.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <thread>

double momentum_score(const IndicatorSet& ind) {
  auto rsi = ind.rsi > 70 ? 0.9 : ind.rsi >= 30 ? 0.7 : 0.3;
  auto macd = ind.macd > 0 ? 0.8 : 0.4;
  auto roc = ind.roc > 5 ? 0.9 : ind.roc > 0 ? 0.7 : 0.3;
  return (rsi + macd + roc) / 3 * 100;
}

double trend_score(const IndicatorSet& ind) {
  double score = ind.trend == Trend::Up     ? 80
                 : ind.trend == Trend::Down ? 20
                                            : 50;

  if (ind.sma20 && ind.sma50)
    score += *ind.sma20 > *ind.sma50 ? 10 : -10;

  if (ind.bollinger_position > 0.5)
    score += 5;
  else if (ind.bollinger_position < -0.5)
    score -= 5;

  return clamp_score(score);
}

double volume_score(double volume_ratio) {
  if (volume_ratio >= 3.0)
    return 95;
  if (volume_ratio >= 2.0)
    return 85;
  if (volume_ratio >= 1.5)
    return 75;
  if (volume_ratio >= 1.0)
    return 60;
  if (volume_ratio >= 0.5)
    return 40;
  return 20;
}

double support_resistance_score(double change_rate) {
  if (std::abs(change_rate) < 1)
    return 45;
  if (change_rate > 5)
    return 70;
  if (change_rate < -5)
    return 30;
  return 50;
}

double volatility_score(double change_rate) {
  auto move = std::abs(change_rate);
  if (move >= 20)
    return 95;
  if (move >= 10)
    return 80;
  if (move >= 5)
    return 65;
  if (move >= 2)
    return 50;
  if (move >= 1)
    return 35;
  return 20;
}

inline double direction_score(Trend t) {
  return t == Trend::Up ? 100 : t == Trend::Down ? 0 : 50;
}

double timeframe_score(const StockSnapshot& s,
                       const IndicatorSet& ind,
                       const IndicatorsConfig& cfg) {
  auto closes = s.closes();
  if (closes.empty())
    return direction_score(ind.trend);

  auto daily = ind.trend;
  auto weekly = trend_direction(resample_last(closes, cfg.weekly_bars), cfg);

  auto short_cfg = cfg;
  short_cfg.trend_window = 2 * cfg.trend_recent;
  auto short_term = trend_direction(closes, short_cfg);

  return (direction_score(daily) + direction_score(weekly) +
          direction_score(short_term)) /
         3;
}

double logic_score(const std::vector<DetectionVerdict>& detections,
                   const SignalConfig& cfg) {
  double score = 0.0;
  for (auto& d : detections) {
    if (!d.detected())
      continue;
    switch (d.pattern) {
      case Pattern::A:
        score += d.confidence * cfg.pattern_a_weight;
        break;
      case Pattern::ALegacy:
        score += d.confidence * cfg.legacy_a_weight;
        break;
      case Pattern::B:
        score += d.confidence * cfg.pattern_b_weight;
        break;
      case Pattern::BLegacy:
        score += d.confidence * cfg.legacy_b_weight;
        break;
    }
  }
  return clamp_score(score * 100);
}

double composite_strength(const ComponentScores& scores,
                          const SignalConfig& cfg) {
  return clamp_score(scores.logic * cfg.logic_weight +
                     scores.technical * cfg.technical_weight +
                     scores.timeframe * cfg.timeframe_weight +
                     scores.volume * cfg.volume_weight);
}

Action action_for(double strength,
                  double technical,
                  bool pattern_a,
                  const SignalConfig& cfg) {
  Action action = strength >= cfg.strong_buy_threshold ? Action::StrongBuy
                  : strength >= cfg.buy_threshold      ? Action::Buy
                  : strength <= cfg.sell_threshold     ? Action::Sell
                  : strength <= cfg.watch_threshold    ? Action::Watch
                                                       : Action::Hold;

  if (action == Action::Buy && pattern_a)
    action = Action::StrongBuy;

  if (technical < cfg.weak_technical) {
    if (action == Action::StrongBuy)
      action = Action::Buy;
    else if (action == Action::Buy)
      action = Action::Watch;
  }

  return action;
}

inline std::vector<std::string> execution_notes(const TradingSignal& sig,
                                                double change_rate,
                                                const RiskConfig& risk) {
  std::vector<std::string> notes;

  switch (sig.action) {
    case Action::StrongBuy:
      notes.push_back("strong entry, take the planned size");
      break;
    case Action::Buy:
      notes.push_back("enter on confirmation");
      break;
    case Action::Watch:
      notes.push_back("watchlist, wait for a trigger");
      break;
    case Action::Hold:
      notes.push_back("no action");
      break;
    case Action::Sell:
      notes.push_back("reduce or exit");
      break;
    case Action::StrongSell:
      notes.push_back("exit the position");
      break;
    case Action::Error:
      break;
  }

  if (sig.strength < 70)
    notes.push_back("moderate strength, scale in");
  if (sig.risk_reward < risk.good_rr_ratio)
    notes.push_back(std::format("risk/reward {:.2f} below {:.1f}",
                                sig.risk_reward, risk.good_rr_ratio));
  if (std::abs(change_rate) > 15)
    notes.push_back("large daily move, expect a pullback");
  if (is_buy(sig.action) && sig.position.shares == 0)
    notes.push_back(sig.position.rationale);

  return notes;
}

TradingSignal SignalIntegrator::integrate(const StockSnapshot& s,
                                          const EngineConfig& cfg) {
  if (auto why = s.invalid_reason())
    throw std::invalid_argument(*why);

  auto& sig_cfg = cfg.sig_config;
  auto& risk_cfg = cfg.risk_config;

  auto ind = s.indicators(cfg.ind_config);

  TradingSignal sig;
  sig.symbol = s.symbol;
  sig.name = s.name;
  sig.price = s.price;
  sig.timestamp = s.as_of;

  DetectionVerdict a, b;
  {
    std::jthread td{[&] {
      a = detect_stop_high(s, ind, history, cfg.stop_high_config);
    }};
    b = detect_turnaround(s, ind, history, cfg.turnaround_config);
  }

  sig.detections = {
      std::move(a),
      detect_legacy_a(s, ind, cfg.legacy_config),
      std::move(b),
      detect_legacy_b(s, ind, cfg.legacy_config),
  };

  auto& sc = sig.scores;
  sc.momentum = momentum_score(ind);
  sc.trend = trend_score(ind);
  sc.volume = volume_score(ind.volume_ratio);
  sc.support_resistance = support_resistance_score(s.change_rate);
  sc.volatility = volatility_score(s.change_rate);
  sc.technical = (sc.momentum + sc.trend + sc.volume + sc.support_resistance +
                  sc.volatility) /
                 5;
  sc.timeframe = timeframe_score(s, ind, cfg.ind_config);
  sc.logic = logic_score(sig.detections, sig_cfg);

  sig.strength = composite_strength(sc, sig_cfg);
  sig.action = action_for(sig.strength, sc.technical,
                          sig.detected(Pattern::A), sig_cfg);

  auto bonus = sig.any_detected() ? sig_cfg.detection_confidence_bonus : 0.0;
  sig.confidence = std::min(1.0, sig.strength / 100 + bonus);

  sig.entry_price = s.price * (1.0 + risk_cfg.entry_slippage);
  sig.profit_target = sig.entry_price * (1.0 + risk_cfg.profit_target);
  sig.stop_loss = sig.entry_price * (1.0 - risk_cfg.stop_loss);
  sig.risk_reward = (sig.profit_target - sig.entry_price) /
                    (sig.entry_price - sig.stop_loss);

  sig.position = PositionSize{sig.entry_price, sig.stop_loss, risk_cfg};
  sig.risk = assess_signal_risk(sig.strength, s, ind);

  sig.executable = is_buy(sig.action) &&
                   sig.risk_reward >= risk_cfg.min_rr_ratio &&
                   sig.position.shares > 0 &&
                   sig.position.exposure <= risk_cfg.max_portfolio_exposure;

  sig.notes = execution_notes(sig, s.change_rate, risk_cfg);
  return sig;
}

TradingSignal SignalIntegrator::evaluate(const StockSnapshot& s,
                                         const EngineConfig& cfg) noexcept {
  TradingSignal sig;
  try {
    sig = integrate(s, cfg);
    spdlog::debug("[signal] ({}) {} strength {:.1f} trend {}", s.symbol,
                  to_str(sig.action), sig.strength,
                  to_str(s.indicators(cfg.ind_config).trend));
  } catch (const std::exception& ex) {
    spdlog::error("[signal] ({}) {}", s.symbol, ex.what());
    sig = TradingSignal{};
    sig.symbol = s.symbol;
    sig.name = s.name;
    sig.price = s.price;
    sig.timestamp = s.as_of;
    sig.action = Action::Error;
    sig.error = ex.what();
  }

  try {
    log.add(sig);
  } catch (const std::exception& ex) {
    spdlog::error("[signal] ({}) log error {}", s.symbol, ex.what());
  }

  return sig;
}
