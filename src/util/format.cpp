#include "util/format.h"
#include "core/history.h"
#include "ind/indicators.h"
#include "risk/risk.h"
#include "sig/trading_signal.h"
#include "sig/verdict.h"

#include <string>

template <>
std::string to_str(const Trend& t) {
  switch (t) {
    case Trend::Up:
      return "up";
    case Trend::Down:
      return "down";
    default:
      return "sideways";
  }
}

template <>
std::string to_str(const Pattern& p) {
  switch (p) {
    case Pattern::A:
      return "A";
    case Pattern::ALegacy:
      return "A_legacy";
    case Pattern::B:
      return "B";
    case Pattern::BLegacy:
      return "B_legacy";
  }
  return "";
}

template <>
std::string to_str(const Action& a) {
  switch (a) {
    case Action::StrongBuy:
      return "STRONG_BUY";
    case Action::Buy:
      return "BUY";
    case Action::Watch:
      return "WATCH";
    case Action::Hold:
      return "HOLD";
    case Action::Sell:
      return "SELL";
    case Action::StrongSell:
      return "STRONG_SELL";
    case Action::Error:
      return "ERROR";
  }
  return "";
}

template <>
std::string to_str(const RiskLevel& r) {
  switch (r) {
    case RiskLevel::VeryLow:
      return "VERY_LOW";
    case RiskLevel::Low:
      return "LOW";
    case RiskLevel::Medium:
      return "MEDIUM";
    case RiskLevel::MediumHigh:
      return "MEDIUM_HIGH";
    case RiskLevel::High:
      return "HIGH";
    case RiskLevel::VeryHigh:
      return "VERY_HIGH";
  }
  return "";
}

template <>
std::string to_str(const DetectionType& t) {
  switch (t) {
    case DetectionType::StopHigh:
      return "stop_high";
    case DetectionType::PatternA:
      return "pattern_a";
    case DetectionType::PatternB:
      return "pattern_b";
  }
  return "";
}

std::string group_thousands(long long n) {
  auto digits = std::to_string(n < 0 ? -n : n);
  std::string res;
  int count = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); it++) {
    if (count && count % 3 == 0)
      res += ',';
    res += *it;
    count++;
  }
  if (n < 0)
    res += '-';
  return std::string(res.rbegin(), res.rend());
}
