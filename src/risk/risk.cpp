#include "risk/risk.h"
#include "core/snapshot.h"
#include "ind/indicators.h"
#include "util/math.h"

#include <cmath>
#include <format>

RiskAssessment assess_stop_high_risk(const StockSnapshot& s,
                                     const IndicatorSet& ind) {
  RiskAssessment ra;
  double score = 0.0;

  if (ind.rsi > 80) {
    score += 20;
    ra.factors.push_back(std::format("overheated RSI {:.1f}", ind.rsi));
  } else if (ind.rsi > 70) {
    score += 40;
    ra.factors.push_back(std::format("elevated RSI {:.1f}", ind.rsi));
  } else {
    score += 70;
  }

  if (ind.volume_ratio > 3) {
    score += 10;
    ra.factors.push_back(
        std::format("abnormal volume {:.1f}x", ind.volume_ratio));
  } else if (ind.volume_ratio > 2) {
    score += 20;
    ra.factors.push_back(std::format("high volume {:.1f}x", ind.volume_ratio));
  } else {
    score += 30;
  }

  auto move = std::abs(s.change_rate);
  if (move > 25) {
    ra.factors.push_back(std::format("extreme move {:.1f}%", s.change_rate));
  } else if (move > 15) {
    score += 10;
    ra.factors.push_back(std::format("large move {:.1f}%", s.change_rate));
  } else {
    score += 20;
  }

  ra.score = std::min(score, 100.0);

  if (ra.score >= 80) {
    ra.level = RiskLevel::Low;
    ra.recommendation = "normal position size";
  } else if (ra.score >= 60) {
    ra.level = RiskLevel::Medium;
    ra.recommendation = "reduced position size";
  } else if (ra.score >= 40) {
    ra.level = RiskLevel::High;
    ra.recommendation = "small position, tight stop";
  } else {
    ra.level = RiskLevel::VeryHigh;
    ra.recommendation = "avoid or observe only";
  }

  return ra;
}

RiskAssessment assess_turnaround_risk(const StockSnapshot& s,
                                      const IndicatorSet& ind) {
  RiskAssessment ra;
  double score = 70;

  if (std::abs(s.change_rate) < 2) {
    score -= 10;
    ra.factors.push_back(std::format("weak move {:.1f}%", s.change_rate));
  }

  if (s.volume < 10'000'000) {
    score -= 15;
    ra.factors.push_back("thin volume");
  }

  if (ind.rsi > 75 || ind.rsi < 40) {
    score -= 10;
    ra.factors.push_back(std::format("RSI out of range {:.1f}", ind.rsi));
  }

  ra.score = clamp_score(score);

  if (ra.score >= 85) {
    ra.level = RiskLevel::Low;
    ra.recommendation = "normal position size";
  } else if (ra.score >= 70) {
    ra.level = RiskLevel::Medium;
    ra.recommendation = "standard position, watch earnings follow-through";
  } else if (ra.score >= 55) {
    ra.level = RiskLevel::MediumHigh;
    ra.recommendation = "reduced position size";
  } else {
    ra.level = RiskLevel::High;
    ra.recommendation = "small position or wait for confirmation";
  }

  return ra;
}

RiskAssessment assess_signal_risk(double strength,
                                  const StockSnapshot& s,
                                  const IndicatorSet& ind) {
  RiskAssessment ra;
  double score = 100;

  if (strength < 60) {
    score -= 30;
    ra.factors.push_back("weak signal strength");
  }

  auto move = std::abs(s.change_rate);
  if (move > 20) {
    score -= 25;
    ra.factors.push_back(std::format("extreme move {:.1f}%", s.change_rate));
  } else if (move > 10) {
    score -= 15;
    ra.factors.push_back(std::format("large move {:.1f}%", s.change_rate));
  }

  if (ind.volume_ratio < 0.5) {
    score -= 20;
    ra.factors.push_back("low volume");
  }

  if (ind.rsi > 80) {
    score -= 15;
    ra.factors.push_back("overbought");
  } else if (ind.rsi < 20) {
    score -= 10;
    ra.factors.push_back("oversold");
  }

  ra.score = clamp_score(score);

  if (ra.score >= 90) {
    ra.level = RiskLevel::VeryLow;
    ra.recommendation = "full position";
  } else if (ra.score >= 75) {
    ra.level = RiskLevel::Low;
    ra.recommendation = "normal position size";
  } else if (ra.score >= 60) {
    ra.level = RiskLevel::Medium;
    ra.recommendation = "reduced position size";
  } else if (ra.score >= 40) {
    ra.level = RiskLevel::High;
    ra.recommendation = "small position, tight stop";
  } else {
    ra.level = RiskLevel::VeryHigh;
    ra.recommendation = "avoid";
  }

  return ra;
}
