#include "sig/turnaround.h"
#include "util/format.h"
#include "util/math.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>

TurnaroundCheck check_turnaround(const StockSnapshot& s,
                                 const TurnaroundConfig& cfg) {
  TurnaroundCheck tc;
  auto& q = s.quarters;

  if (!q.empty()) {
    if (q.size() < 2) {
      tc.reason = "insufficient earnings history";
      return tc;
    }
    if (!q.front().profitable()) {
      tc.reason = std::format("latest quarter {} not profitable", q.front().period);
      return tc;
    }

    std::vector<double> losses;
    for (auto it = q.begin() + 1; it != q.end() && !it->profitable(); it++)
      losses.push_back(it->net_income);

    tc.loss_quarters = static_cast<int>(losses.size());
    if (losses.empty()) {
      tc.improvement = 1.0;
    } else {
      auto avg_loss = mean(losses);
      tc.improvement = avg_loss == 0.0
                           ? cfg.max_improvement
                           : (q.front().net_income - avg_loss) / std::abs(avg_loss);
    }
  } else if (s.latest_quarter_profit && s.consecutive_loss_quarters) {
    if (!*s.latest_quarter_profit) {
      tc.reason = "latest quarter not profitable";
      return tc;
    }
    tc.loss_quarters = *s.consecutive_loss_quarters;
    tc.improvement = 1.0;
  } else {
    tc.reason = "insufficient earnings history";
    return tc;
  }

  tc.improvement = std::clamp(tc.improvement, 0.0, cfg.max_improvement);

  if (tc.loss_quarters < static_cast<int>(cfg.min_loss_quarters)) {
    tc.reason = std::format("only {} loss quarters before profit, need {}",
                            tc.loss_quarters, cfg.min_loss_quarters);
    return tc;
  }

  tc.passed = true;
  tc.confidence =
      std::min(0.95, 0.6 + tc.loss_quarters * 0.1 + tc.improvement * 0.25);
  tc.reason = std::format("profit after {} loss quarters, improvement {:.0f}%",
                          tc.loss_quarters, tc.improvement * 100);
  return tc;
}

CrossoverCheck check_ma5_crossover(const StockSnapshot& s,
                                   const IndicatorSet& ind,
                                   const TurnaroundConfig& cfg) {
  CrossoverCheck cc;
  bool rising = false;

  if (s.ma5_crossover) {
    cc.crossover = *s.ma5_crossover;
    cc.ma5 = s.price / (1.0 + *s.ma5_crossover);
    // provider confirmed the cross, the slope is only checked when known
    rising = !ind.sma5 || !ind.sma5_prev || *ind.sma5 > *ind.sma5_prev;
  } else if (ind.sma5 && *ind.sma5 > 0.0) {
    cc.ma5 = *ind.sma5;
    cc.crossover = (s.price - *ind.sma5) / *ind.sma5;
    rising = ind.sma5_prev && *ind.sma5 > *ind.sma5_prev;
  } else {
    cc.failed.push_back("MA5 unavailable");
    return cc;
  }

  if (s.price <= *cc.ma5)
    cc.failed.push_back(std::format("price {:.1f} not above MA5 {:.1f}",
                                    s.price, *cc.ma5));
  if (!rising)
    cc.failed.push_back("MA5 not rising");
  if (*cc.crossover < cfg.ma5_threshold)
    cc.failed.push_back(std::format("crossover {:.2f}% below {:.2f}%",
                                    *cc.crossover * 100,
                                    cfg.ma5_threshold * 100));
  return cc;
}

std::vector<std::string> failed_entry_conditions(const StockSnapshot& s,
                                                 const IndicatorSet& ind,
                                                 const TurnaroundConfig& cfg) {
  std::vector<std::string> failed;

  if (s.change_rate < cfg.min_change_rate || s.change_rate > cfg.max_change_rate)
    failed.push_back(std::format("change rate {:.1f}% outside [{}, {}]",
                                 s.change_rate, cfg.min_change_rate,
                                 cfg.max_change_rate));
  if (ind.rsi < cfg.min_rsi || ind.rsi > cfg.max_rsi)
    failed.push_back(std::format("RSI {:.1f} outside [{}, {}]", ind.rsi,
                                 cfg.min_rsi, cfg.max_rsi));
  if (ind.volume_ratio < cfg.min_volume_ratio ||
      ind.volume_ratio > cfg.max_volume_ratio)
    failed.push_back(std::format("volume ratio {:.2f} outside [{}, {}]",
                                 ind.volume_ratio, cfg.min_volume_ratio,
                                 cfg.max_volume_ratio));
  return failed;
}

inline std::optional<std::string> carryforward_loss(const StockSnapshot& s,
                                                    const TurnaroundConfig& cfg) {
  if (s.quarters.empty())
    return std::nullopt;

  double total_loss = 0.0;
  size_t n_loss = 0;
  for (auto& q : s.quarters) {
    if (q.profitable())
      continue;
    total_loss += -q.net_income;
    n_loss++;
  }

  auto latest = s.quarters.front().net_income;
  if (n_loss >= cfg.carryforward_loss_quarters &&
      total_loss > cfg.carryforward_loss_multiple * latest)
    return std::format("tax loss carryforward ({} loss quarters, {:.0f} total)",
                       n_loss, total_loss);
  return std::nullopt;
}

inline DetectionVerdict evaluate_turnaround(const StockSnapshot& s,
                                            const IndicatorSet& ind,
                                            HistoryStore& history,
                                            const TurnaroundConfig& cfg) {
  constexpr auto P = Pattern::B;
  Evidence ev;

  // loss to profit
  auto tc = check_turnaround(s, cfg);
  ev.loss_quarters = tc.loss_quarters;
  ev.improvement_rate = tc.improvement;
  if (!tc.passed)
    return DetectionVerdict::rejected(P, tc.reason, std::move(ev));

  // MA5 crossover
  auto cc = check_ma5_crossover(s, ind, cfg);
  ev.ma5 = cc.ma5;
  ev.ma5_crossover = cc.crossover;
  if (!cc.failed.empty()) {
    auto reason = "no MA5 crossover: " + join(cc.failed);
    ev.failed_conditions = std::move(cc.failed);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  // entry conditions
  ev.failed_conditions = failed_entry_conditions(s, ind, cfg);
  if (!ev.failed_conditions.empty()) {
    auto reason = "entry conditions not met: " + join(ev.failed_conditions);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  // exclusions
  if (auto tax = carryforward_loss(s, cfg))
    return DetectionVerdict::rejected(P, *tax, std::move(ev));

  if (std::abs(s.change_rate) > cfg.max_abs_change_rate) {
    auto reason = std::format("too volatile ({:.1f}%)", s.change_rate);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  if (s.volume < cfg.liquidity_floor) {
    auto reason = std::format("illiquid (volume {})", group_thousands(s.volume));
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  auto dedup_since = s.as_of - months{cfg.dedup_months};
  auto recent = history.query(
      s.symbol, {.since = dedup_since, .type = DetectionType::PatternB});
  if (!recent.empty()) {
    auto reason = std::format("pattern B already detected on {} (within {} months)",
                              date_to_string(recent.back().timestamp),
                              cfg.dedup_months);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  // signal
  TradePlan plan;
  plan.entry = s.price;
  plan.target = plan.entry * (1.0 + cfg.profit_target);
  plan.stop = plan.entry * (1.0 - cfg.stop_loss);
  plan.max_holding_days = cfg.max_holding_days;

  auto strength = std::clamp(50 + s.change_rate * 8, 50.0, 90.0);

  DetectionVerdict v;
  v.pattern = P;
  v.outcome = Outcome::Detected;
  v.reason = std::format("{}, price {:.2f}% above MA5", tc.reason,
                         *cc.crossover * 100);
  v.strength = strength;
  v.confidence = tc.confidence;
  v.evidence = std::move(ev);
  v.plan = plan;
  v.risk = assess_turnaround_risk(s, ind);

  HistoryRecord rec{s.symbol,      DetectionType::PatternB, s.as_of, s.price,
                    s.change_rate, s.volume, v.reason, strength};
  if (!history.record_unless_since(rec, dedup_since))
    return DetectionVerdict::rejected(
        P, std::format("pattern B already detected (within {} months)",
                       cfg.dedup_months),
        std::move(v.evidence));
  return v;
}

DetectionVerdict detect_turnaround(const StockSnapshot& s,
                                   const IndicatorSet& ind,
                                   HistoryStore& history,
                                   const TurnaroundConfig& cfg) noexcept {
  try {
    auto v = evaluate_turnaround(s, ind, history, cfg);
    if (v.detected())
      spdlog::info("[pattern_b] ({}) {}", s.symbol, v.reason);
    else
      spdlog::debug("[pattern_b] ({}) {}", s.symbol, v.reason);
    return v;
  } catch (const std::exception& ex) {
    spdlog::warn("[pattern_b] ({}) {}", s.symbol, ex.what());
    return DetectionVerdict::error(Pattern::B, ex.what());
  }
}
