#include "sig/legacy.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <format>

inline DetectionVerdict matched(Pattern p,
                                double confidence,
                                std::vector<std::string> conditions) {
  DetectionVerdict v;
  v.pattern = p;
  v.outcome = Outcome::Detected;
  v.reason = "matched " + join(conditions);
  v.confidence = confidence;
  v.strength = confidence * 100;
  v.evidence.matched_conditions = std::move(conditions);
  return v;
}

DetectionVerdict detect_legacy_a(const StockSnapshot& s,
                                 const IndicatorSet& ind,
                                 const LegacyConfig& cfg) noexcept {
  constexpr auto P = Pattern::ALegacy;
  try {
    if (s.change_rate < cfg.a_min_change_rate || s.volume <= cfg.a_min_volume)
      return DetectionVerdict::rejected(
          P, std::format("change rate {:.1f}% / volume {} below basic rule",
                         s.change_rate, group_thousands(s.volume)));

    std::vector<std::string> cond;
    if (ind.rsi >= cfg.a_min_rsi)
      cond.push_back(std::format("RSI {:.1f}", ind.rsi));
    if (ind.trend == Trend::Up)
      cond.push_back("uptrend");
    if (ind.volume_ratio > cfg.a_min_volume_ratio)
      cond.push_back(std::format("volume ratio {:.2f}", ind.volume_ratio));

    if (cond.empty())
      return DetectionVerdict::rejected(P, "no confirming momentum");

    return matched(P, cfg.a_confidence, std::move(cond));
  } catch (const std::exception& ex) {
    spdlog::warn("[legacy_a] ({}) {}", s.symbol, ex.what());
    return DetectionVerdict::error(P, ex.what());
  }
}

DetectionVerdict detect_legacy_b(const StockSnapshot& s,
                                 const IndicatorSet& ind,
                                 const LegacyConfig& cfg) noexcept {
  constexpr auto P = Pattern::BLegacy;
  try {
    std::vector<std::string> failed;
    if (ind.rsi < cfg.b_min_rsi)
      failed.push_back(std::format("RSI {:.1f}", ind.rsi));
    if (s.change_rate <= cfg.b_min_change_rate)
      failed.push_back(std::format("change rate {:.1f}%", s.change_rate));
    if (s.volume <= cfg.b_min_volume)
      failed.push_back(std::format("volume {}", group_thousands(s.volume)));

    if (!failed.empty())
      return DetectionVerdict::rejected(P, "recovery rule not met: " + join(failed));

    std::vector<std::string> cond;
    if (ind.trend != Trend::Down)
      cond.push_back(ind.trend == Trend::Up ? "uptrend" : "sideways");
    if (ind.macd > 0)
      cond.push_back("MACD positive");
    if (ind.bollinger_position > cfg.b_min_bollinger)
      cond.push_back("off the lower band");

    if (cond.empty())
      return DetectionVerdict::rejected(P, "no reversal confirmation");

    return matched(P, cfg.b_confidence, std::move(cond));
  } catch (const std::exception& ex) {
    spdlog::warn("[legacy_b] ({}) {}", s.symbol, ex.what());
    return DetectionVerdict::error(P, ex.what());
  }
}
