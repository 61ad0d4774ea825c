#include "sig/stop_high.h"
#include "core/price_limit.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>

EarningsWindow earnings_window(const StockSnapshot& s, int post_earnings_days) {
  EarningsWindow w;

  if (s.last_earnings_date) {
    auto d = days_between(*s.last_earnings_date, s.as_of);
    w.days_since = d;
    w.inside = d >= 0 && d <= post_earnings_days;
  }

  if (s.within_earnings_window)
    w.inside = *s.within_earnings_window;

  return w;
}

inline const Candle* todays_candle(const StockSnapshot& s) {
  if (s.candles.empty() || !same_day(s.candles.back().time(), s.as_of))
    return nullptr;
  return &s.candles.back();
}

double estimate_lower_shadow(const StockSnapshot& s) {
  if (s.lower_shadow_ratio)
    return *s.lower_shadow_ratio;

  if (auto c = todays_candle(s))
    return c->lower_shadow_ratio();

  return s.change_rate >= 10.0 ? s.change_rate * 0.05 / 100.0 : 0.03;
}

double implied_stop_high(const StockSnapshot& s) {
  if (s.stop_high_price && *s.stop_high_price > 0.0)
    return *s.stop_high_price;

  auto implied = s.prev_close() * (1.0 + s.change_rate / 100.0);
  if (auto c = todays_candle(s))
    implied = std::max(implied, c->high);
  return implied;
}

inline HistoryRecord make_record(const StockSnapshot& s,
                                 DetectionType type,
                                 std::string reason,
                                 double strength) {
  return {s.symbol, type,          s.as_of,           s.price,
          s.change_rate, s.volume, std::move(reason), strength};
}

inline bool listing_eligible(const StockSnapshot& s,
                             const StopHighConfig& cfg) {
  if (s.listing_eligible)
    return *s.listing_eligible;
  if (s.years_listed)
    return *s.years_listed >= 0.0 && *s.years_listed <= cfg.max_listing_years;
  return false;
}

inline DetectionVerdict evaluate_stop_high(const StockSnapshot& s,
                                           const IndicatorSet& ind,
                                           HistoryStore& history,
                                           const StopHighConfig& cfg) {
  constexpr auto P = Pattern::A;
  Evidence ev;

  // listing age
  if (!listing_eligible(s, cfg)) {
    auto detail = s.years_listed
                      ? std::format(" (listed {:.1f} years)", *s.years_listed)
                      : std::string{};
    return DetectionVerdict::rejected(P, "listing condition not met" + detail);
  }

  // stop-high proximity
  auto prev_close = s.prev_close();
  auto stop_high = implied_stop_high(s);
  auto limit = limit_up_price(prev_close, cfg.limit_stage);
  auto reach = stop_high > 0.0 ? s.price / stop_high : 0.0;

  ev.stop_high_price = stop_high;
  ev.limit_price = limit;
  ev.reach_ratio = reach;
  ev.at_regulatory_limit = s.price >= limit * (1.0 - 1e-9);

  auto& failed = ev.failed_conditions;
  if (s.change_rate < cfg.min_change_rate)
    failed.push_back(std::format("change rate {:.1f}% below {:.1f}%",
                                 s.change_rate, cfg.min_change_rate));
  if (reach < cfg.min_reach_ratio)
    failed.push_back(std::format("price at {:.1f}% of stop-high {:.1f}",
                                 reach * 100, stop_high));
  if (s.volume < cfg.min_volume)
    failed.push_back(std::format("volume {} below {}",
                                 group_thousands(s.volume),
                                 group_thousands(cfg.min_volume)));

  if (!failed.empty()) {
    auto reason = "stop-high condition not met: " + join(failed);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  // lower shadow
  auto shadow = estimate_lower_shadow(s);
  ev.lower_shadow_ratio = shadow;
  if (shadow > cfg.max_lower_shadow) {
    auto reason = std::format("lower shadow {:.1f}% above {:.1f}%",
                              shadow * 100, cfg.max_lower_shadow * 100);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  auto today = std::chrono::floor<days>(s.as_of);
  auto stop_high_rec =
      make_record(s, DetectionType::StopHigh, "price stuck at stop-high", 0.0);
  if (history.record_unless_since(stop_high_rec, LocalTimePoint{today}))
    spdlog::debug("[pattern_a] ({}) stop-high observed", s.symbol);

  // earnings timing
  auto window = earnings_window(s, cfg.post_earnings_days);
  ev.days_since_earnings = window.days_since;
  if (cfg.require_earnings_window && !window.inside)
    return DetectionVerdict::rejected(
        P, "not the day after an earnings release", std::move(ev));

  // exclusions
  auto n_recent = history.count(
      s.symbol, {.since = s.as_of - days{cfg.consecutive_window_days},
                 .type = DetectionType::StopHigh});
  if (n_recent >= cfg.consecutive_max) {
    auto reason = std::format("consecutive stop-high ({} in last {} days)",
                              n_recent, cfg.consecutive_window_days);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  if (!window.inside && s.change_rate >= cfg.unexplained_spike_rate) {
    auto reason = std::format("unexplained spike {:.1f}% outside earnings",
                              s.change_rate);
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  // first occurrence
  auto prior = history.query(s.symbol, {.type = DetectionType::PatternA});
  if (!prior.empty()) {
    auto reason = std::format("pattern A already detected on {}",
                              date_to_string(prior.front().timestamp));
    return DetectionVerdict::rejected(P, std::move(reason), std::move(ev));
  }

  // signal
  TradePlan plan;
  plan.entry = s.price * (1.0 + cfg.entry_trigger_rate / 100.0);
  plan.target = plan.entry * (1.0 + cfg.profit_target);
  plan.stop = plan.entry * (1.0 - cfg.stop_loss);
  plan.max_holding_days = cfg.max_holding_days;

  auto strength =
      std::clamp(s.change_rate / cfg.entry_trigger_rate * 60 + 40, 40.0, 100.0);

  DetectionVerdict v;
  v.pattern = P;
  v.outcome = Outcome::Detected;
  v.reason = std::format(
      "stop-high sticking at {:.1f} (+{:.1f}%), volume {}, shadow {:.1f}%",
      stop_high, s.change_rate, group_thousands(s.volume), shadow * 100);
  v.strength = strength;
  v.confidence = strength / 100.0;
  v.evidence = std::move(ev);
  v.plan = plan;
  v.risk = assess_stop_high_risk(s, ind);

  // a concurrent evaluation of the same symbol may have fired in between
  auto rec = make_record(s, DetectionType::PatternA, v.reason, strength);
  if (!history.record_unless_since(rec, LocalTimePoint::min()))
    return DetectionVerdict::rejected(P, "pattern A already detected",
                                      std::move(v.evidence));
  return v;
}

DetectionVerdict detect_stop_high(const StockSnapshot& s,
                                  const IndicatorSet& ind,
                                  HistoryStore& history,
                                  const StopHighConfig& cfg) noexcept {
  try {
    auto v = evaluate_stop_high(s, ind, history, cfg);
    if (v.detected())
      spdlog::info("[pattern_a] ({}) {}", s.symbol, v.reason);
    else
      spdlog::debug("[pattern_a] ({}) {}", s.symbol, v.reason);
    return v;
  } catch (const std::exception& ex) {
    spdlog::warn("[pattern_a] ({}) {}", s.symbol, ex.what());
    return DetectionVerdict::error(Pattern::A, ex.what());
  }
}
