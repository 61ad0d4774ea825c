#pragma once

#include "util/times.h"

#include <cstdint>
#include <string>
#include <vector>

struct IndicatorsConfig {
  static constexpr const char* name = "ind_config";
  static constexpr bool debug = true;

  double eps = 1e-9;

  int rsi_period = 14;
  int macd_fast = 12;
  int macd_slow = 26;
  int macd_signal = 9;

  size_t bollinger_period = 20;
  double bollinger_k = 2.0;

  size_t volume_period = 20;
  size_t roc_period = 10;

  size_t trend_recent = 3;
  size_t trend_window = 20;
  double trend_deadband = 0.02;

  // Bars per "week" when resampling a daily series
  size_t weekly_bars = 5;
};

struct StopHighConfig {
  static constexpr const char* name = "stop_high_config";
  static constexpr bool debug = true;

  double max_listing_years = 2.5;

  double min_change_rate = 15.0;
  double min_reach_ratio = 0.98;
  int64_t min_volume = 20'000'000;
  int limit_stage = 1;

  double max_lower_shadow = 0.15;

  bool require_earnings_window = true;
  int post_earnings_days = 1;

  int consecutive_window_days = 3;
  size_t consecutive_max = 2;
  double unexplained_spike_rate = 20.0;

  // Trade plan
  double entry_trigger_rate = 5.0;
  double profit_target = 0.24;
  double stop_loss = 0.10;
  int max_holding_days = 30;
};

struct TurnaroundConfig {
  static constexpr const char* name = "turnaround_config";
  static constexpr bool debug = true;

  size_t min_loss_quarters = 2;
  double max_improvement = 2.0;

  double ma5_threshold = 0.02;

  double min_change_rate = 1.0;
  double max_change_rate = 8.0;
  double min_rsi = 40.0;
  double max_rsi = 75.0;
  double min_volume_ratio = 1.2;
  double max_volume_ratio = 3.0;

  double carryforward_loss_multiple = 4.0;
  size_t carryforward_loss_quarters = 4;
  double max_abs_change_rate = 15.0;
  int64_t liquidity_floor = 5'000'000;
  int dedup_months = 6;

  // Trade plan
  double profit_target = 0.25;
  double stop_loss = 0.10;
  int max_holding_days = 45;
};

struct LegacyConfig {
  static constexpr const char* name = "legacy_config";
  static constexpr bool debug = true;

  double a_min_change_rate = 5.0;
  int64_t a_min_volume = 10'000'000;
  double a_min_rsi = 70.0;
  double a_min_volume_ratio = 1.5;
  double a_confidence = 0.7;

  double b_min_rsi = 60.0;
  double b_min_change_rate = 2.0;
  int64_t b_min_volume = 5'000'000;
  double b_min_bollinger = -0.5;
  double b_confidence = 0.6;
};

struct SignalConfig {
  static constexpr const char* name = "sig_config";
  static constexpr bool debug = true;

  double logic_weight = 0.4;
  double technical_weight = 0.3;
  double timeframe_weight = 0.2;
  double volume_weight = 0.1;

  double pattern_a_weight = 0.3;
  double legacy_a_weight = 0.2;
  double pattern_b_weight = 0.3;
  double legacy_b_weight = 0.2;

  double strong_buy_threshold = 80.0;
  double buy_threshold = 60.0;
  double watch_threshold = 40.0;
  double sell_threshold = 20.0;
  double weak_technical = 30.0;

  double detection_confidence_bonus = 0.2;

  size_t log_capacity = 1000;
  int active_hours = 24;
};

struct RiskConfig {
  static constexpr const char* name = "risk_config";
  static constexpr bool debug = true;

  double portfolio_size = 10'000'000.0;
  double max_risk_per_trade = 0.02;
  double max_portfolio_exposure = 0.10;
  double min_rr_ratio = 1.5;
  double good_rr_ratio = 2.0;
  int64_t lot_size = 100;

  double entry_slippage = 0.001;
  double profit_target = 0.24;
  double stop_loss = 0.10;

  double max_risk_amount() const { return portfolio_size * max_risk_per_trade; }
  double max_position_amount() const {
    return portfolio_size * max_portfolio_exposure;
  }
};

// Everything an evaluation reads. Passed by const reference, never mutated
// while a scan is running.
struct EngineConfig {
  IndicatorsConfig ind_config;
  StopHighConfig stop_high_config;
  TurnaroundConfig turnaround_config;
  LegacyConfig legacy_config;
  SignalConfig sig_config;
  RiskConfig risk_config;
};

struct HistoryConfig {
  static constexpr const char* name = "history_config";
  static constexpr bool debug = true;

  size_t capacity = 50;
  std::string path = "data/history.bin";
};

struct ScanConfig {
  static constexpr const char* name = "scan_config";
  static constexpr bool debug = true;

  size_t concurrency = 5;

  double early_progress = 0.10;
  double mid_progress = 0.50;
  int early_delay_ms = 2000;
  int mid_delay_ms = 1000;
  int late_delay_ms = 500;

  int quote_ttl_minutes = 60;
  int earnings_ttl_hours = 24 * 7;

  milliseconds delay(size_t done, size_t total) const {
    auto progress = total ? static_cast<double>(done) / total : 1.0;
    if (progress < early_progress)
      return milliseconds{early_delay_ms};
    if (progress < mid_progress)
      return milliseconds{mid_delay_ms};
    return milliseconds{late_delay_ms};
  }
};

struct APIConfig {
  static constexpr const char* name = "api_config";
  static constexpr bool debug = false;

  std::string base_url = "";
  std::vector<std::string> api_keys = {};
  int max_calls_min = 8;
  int daily_calls = 800;
};

struct Config {
  bool debug_en = false;
  bool delay_en = true;

  std::string config_dir = "config";
  std::string input_path = "";
  std::string output_path = "data/signals.json";
  std::vector<std::string> symbols = {};

  APIConfig api_config;
  ScanConfig scan_config;
  HistoryConfig history_config;
  EngineConfig engine;

  void read_args(int argc, char* argv[]);
  void update();
};

inline Config config;
