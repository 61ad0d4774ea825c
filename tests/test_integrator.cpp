#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fixtures.h"
#include "sig/integrator.h"

#include <format>

using namespace Catch;

struct Engine {
  MemoryHistoryStore history{50};
  SignalLog log{1000, hours{24}};
  SignalIntegrator integrator{history, log};
  EngineConfig cfg;

  TradingSignal operator()(const StockSnapshot& s) {
    return integrator.evaluate(s, cfg);
  }
};

inline StockSnapshot strong_snapshot() {
  auto s = stop_high_snapshot();
  s.signals.rsi = 72;
  s.signals.volume_ratio = 2.0;
  s.signals.trend = "up";
  s.signals.macd = 1.0;
  s.signals.bollinger_position = 0.6;
  return s;
}

TEST_CASE("Action thresholds", "[integrator]") {
  SignalConfig cfg;

  REQUIRE(action_for(85, 50, false, cfg) == Action::StrongBuy);
  REQUIRE(action_for(65, 50, false, cfg) == Action::Buy);
  REQUIRE(action_for(50, 50, false, cfg) == Action::Hold);
  REQUIRE(action_for(35, 50, false, cfg) == Action::Watch);
  REQUIRE(action_for(15, 50, false, cfg) == Action::Sell);

  SECTION("stop-high breakout upgrades a buy") {
    REQUIRE(action_for(65, 50, true, cfg) == Action::StrongBuy);
    REQUIRE(action_for(50, 50, true, cfg) == Action::Hold);
  }

  SECTION("weak technicals downgrade one step") {
    REQUIRE(action_for(85, 20, false, cfg) == Action::Buy);
    REQUIRE(action_for(65, 20, false, cfg) == Action::Watch);
    REQUIRE(action_for(65, 20, true, cfg) == Action::Buy);
    REQUIRE(action_for(15, 20, false, cfg) == Action::Sell);
  }
}

TEST_CASE("Composite strength grows with each component", "[integrator]") {
  SignalConfig cfg;
  ComponentScores sc{.logic = 30, .technical = 40, .timeframe = 50, .volume = 60};

  double prev = composite_strength(sc, cfg);
  for (double t : {50.0, 70.0, 90.0, 100.0}) {
    sc.technical = t;
    auto cur = composite_strength(sc, cfg);
    REQUIRE(cur > prev);
    prev = cur;
  }

  ComponentScores maxed{.logic = 100, .technical = 100, .timeframe = 100,
                        .volume = 100};
  REQUIRE(composite_strength(maxed, cfg) == Approx(100));
}

TEST_CASE("Sub-scores", "[integrator]") {
  REQUIRE(volume_score(3.2) == 95);
  REQUIRE(volume_score(1.0) == 60);
  REQUIRE(volume_score(0.2) == 20);
  REQUIRE(support_resistance_score(0.5) == 45);
  REQUIRE(support_resistance_score(-8) == 30);
  REQUIRE(volatility_score(-12) == 80);
  REQUIRE(volatility_score(0.5) == 20);

  IndicatorSet ind;
  ind.trend = Trend::Down;
  ind.sma20 = 90;
  ind.sma50 = 100;
  ind.bollinger_position = -0.8;
  REQUIRE(trend_score(ind) == 5);
}

TEST_CASE("Stop-high breakout with neutral technicals", "[integrator]") {
  Engine engine;
  auto s = stop_high_snapshot();

  auto sig = engine(s);

  REQUIRE(sig.action == Action::Hold);
  REQUIRE(sig.detected(Pattern::A));
  REQUIRE_FALSE(sig.detected(Pattern::B));
  REQUIRE(sig.detections.size() == 4);
  REQUIRE(sig.scores.momentum == Approx(46.667).epsilon(1e-4));
  REQUIRE(sig.scores.technical == Approx(64.333).epsilon(1e-4));
  REQUIRE(sig.scores.timeframe == Approx(50));
  REQUIRE(sig.scores.logic == Approx(30));
  REQUIRE(sig.strength == Approx(47.3));
  REQUIRE(sig.confidence == Approx(0.673));
  REQUIRE_FALSE(sig.executable);

  REQUIRE(sig.entry_price == Approx(1501.5));
  REQUIRE(sig.profit_target == Approx(1501.5 * 1.24));
  REQUIRE(sig.stop_loss == Approx(1501.5 * 0.9));
  REQUIRE(sig.risk_reward == Approx(2.4));

  REQUIRE(engine.log.size() == 1);
  REQUIRE(engine.log.count(Action::Hold) == 1);
}

TEST_CASE("Strong confirmation produces an executable buy", "[integrator]") {
  Engine engine;
  auto sig = engine(strong_snapshot());

  REQUIRE(sig.scores.logic == Approx(56));
  REQUIRE(sig.scores.technical == Approx(80.333).epsilon(1e-4));
  REQUIRE(sig.scores.timeframe == Approx(100));
  REQUIRE(sig.strength == Approx(75));
  REQUIRE(sig.action == Action::StrongBuy);
  REQUIRE(sig.detected(Pattern::ALegacy));
  REQUIRE(sig.detected(Pattern::BLegacy));

  REQUIRE(sig.executable);
  REQUIRE(sig.position.shares == 600);
  REQUIRE(sig.position.capped_by_exposure);
  REQUIRE(sig.position.exposure == Approx(0.09009));
  REQUIRE(sig.risk.level == RiskLevel::Low);
  REQUIRE_FALSE(sig.notes.empty());

  SECTION("second scan only sees the breakout once") {
    auto again = engine(strong_snapshot());
    REQUIRE_FALSE(again.detected(Pattern::A));
    REQUIRE(again.detection(Pattern::A)->reason.find("already detected") !=
            std::string::npos);
    REQUIRE(again.strength < sig.strength);
    REQUIRE(engine.log.total_signals() == 2);
  }
}

TEST_CASE("Invalid snapshots become error signals", "[integrator]") {
  Engine engine;
  auto s = stop_high_snapshot();
  s.price = 0;

  auto sig = engine(s);
  REQUIRE(sig.action == Action::Error);
  REQUIRE(sig.symbol == s.symbol);
  REQUIRE_FALSE(sig.error.empty());
  REQUIRE_FALSE(sig.executable);
  REQUIRE(sig.detections.empty());

  REQUIRE(engine.log.count(Action::Error) == 1);
  REQUIRE(engine.log.active_signals(s.as_of).empty());
  REQUIRE(engine.history.query(s.symbol).empty());
}

TEST_CASE("Signal log keeps a bounded history", "[integrator]") {
  SignalLog log{3, hours{24}};
  auto now = at("2024-05-15 15:00:00");

  for (int i = 0; i < 5; i++) {
    TradingSignal sig;
    sig.symbol = std::format("{}", 1000 + i);
    sig.strength = i * 10;
    sig.action = Action::Watch;
    sig.timestamp = now - hours{10 * i};
    log.add(sig);
  }

  REQUIRE(log.size() == 3);
  REQUIRE(log.total_signals() == 5);
  REQUIRE(log.count(Action::Watch) == 5);
  REQUIRE(log.recent(2).back().symbol == "1004");

  auto active = log.active_signals(now);
  REQUIRE(active.size() == 3);
  REQUIRE(active.front().symbol == "1002");
  REQUIRE(active.back().symbol == "1000");
}
