#pragma once

#include <string>
#include <vector>

struct StockSnapshot;
struct IndicatorSet;

enum class RiskLevel { VeryLow, Low, Medium, MediumHigh, High, VeryHigh };

struct RiskAssessment {
  RiskLevel level = RiskLevel::Medium;
  double score = 0.0;  // 0..100, higher is safer
  std::vector<std::string> factors = {};
  std::string recommendation = "";
};

// Additive scoring for the stop-high breakout
RiskAssessment assess_stop_high_risk(const StockSnapshot& s,
                                     const IndicatorSet& ind);

// Deductive scoring from 70 for the earnings turnaround
RiskAssessment assess_turnaround_risk(const StockSnapshot& s,
                                      const IndicatorSet& ind);

// Deductive scoring from 100 for the integrated signal
RiskAssessment assess_signal_risk(double strength,
                                  const StockSnapshot& s,
                                  const IndicatorSet& ind);
