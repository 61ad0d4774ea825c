#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/history.h"
#include "fixtures.h"
#include "sig/stop_high.h"

#include <filesystem>
#include <fstream>

using namespace Catch;
namespace fs = std::filesystem;

TEST_CASE("History ring keeps the newest records", "[history]") {
  MemoryHistoryStore store{3};
  auto t0 = at("2024-05-01 15:00:00");

  for (int i = 0; i < 5; i++)
    store.record(history_record("5032", DetectionType::StopHigh,
                                t0 + days{i}, i * 10.0));

  auto recs = store.query("5032");
  REQUIRE(recs.size() == 3);
  REQUIRE(recs.front().strength == Approx(20));
  REQUIRE(recs.back().strength == Approx(40));
  REQUIRE(recs.front().timestamp < recs.back().timestamp);
}

TEST_CASE("History queries filter by type and time", "[history]") {
  MemoryHistoryStore store;
  auto t0 = at("2024-05-01 15:00:00");

  store.record(history_record("5032", DetectionType::StopHigh, t0));
  store.record(history_record("5032", DetectionType::PatternA, t0 + days{1}));
  store.record(history_record("5032", DetectionType::StopHigh, t0 + days{5}));
  store.record(history_record("4385", DetectionType::PatternB, t0));

  REQUIRE(store.count("5032") == 3);
  REQUIRE(store.count("5032", {.type = DetectionType::StopHigh}) == 2);
  REQUIRE(store.count("5032", {.since = t0 + days{1}}) == 2);
  REQUIRE(store.count("5032", {.since = t0 + days{2},
                               .type = DetectionType::StopHigh}) == 1);
  REQUIRE(store.count("5032", {.type = DetectionType::PatternB}) == 0);
  REQUIRE(store.count("4385") == 1);
  REQUIRE(store.count("0000") == 0);
  REQUIRE(store.n_symbols() == 2);
}

TEST_CASE("Conditional append", "[history]") {
  MemoryHistoryStore store;
  auto t0 = at("2024-05-01 15:00:00");
  auto rec = history_record("5032", DetectionType::StopHigh, t0);

  REQUIRE(store.record_unless_since(rec, t0 - hours{15}));
  REQUIRE_FALSE(store.record_unless_since(rec, t0 - hours{15}));

  SECTION("other types do not block") {
    auto other = history_record("5032", DetectionType::PatternA, t0);
    REQUIRE(store.record_unless_since(other, t0 - hours{15}));
  }

  SECTION("older records do not block") {
    rec.timestamp = t0 + days{1};
    REQUIRE(store.record_unless_since(rec, t0 + hours{9}));
    REQUIRE(store.count("5032") == 2);
  }
}

TEST_CASE("File history survives a restart", "[history]") {
  auto dir = fs::temp_directory_path() / "harvest_history_test";
  fs::remove_all(dir);
  auto path = (dir / "history.bin").string();
  auto t0 = at("2024-05-01 15:00:00");

  {
    FileHistoryStore store{path, 2};
    store.record(history_record("5032", DetectionType::StopHigh, t0));
    store.record(history_record("5032", DetectionType::PatternA, t0, 88.5));
    REQUIRE(store.record_unless_since(
        history_record("4385", DetectionType::PatternB, t0 + days{2}), t0));
  }

  REQUIRE(fs::exists(path));

  SECTION("reload") {
    FileHistoryStore store{path, 2};
    REQUIRE(store.n_symbols() == 2);

    auto a = store.query("5032", {.type = DetectionType::PatternA});
    REQUIRE(a.size() == 1);
    REQUIRE(a.front().timestamp == t0);
    REQUIRE(a.front().strength == Approx(88.5));
    REQUIRE(a.front().reason == "fixture");
    REQUIRE(store.count("4385") == 1);
  }

  SECTION("smaller capacity trims on load") {
    FileHistoryStore store{path, 1};
    auto recs = store.query("5032");
    REQUIRE(recs.size() == 1);
    REQUIRE(recs.front().type == DetectionType::PatternA);
  }

  fs::remove_all(dir);
}

TEST_CASE("Corrupt history file starts empty", "[history]") {
  auto dir = fs::temp_directory_path() / "harvest_history_corrupt";
  fs::create_directories(dir);
  auto path = (dir / "history.bin").string();
  {
    std::ofstream ofs{path, std::ios::binary | std::ios::trunc};
    ofs << "abc";
  }

  FileHistoryStore store{path};
  REQUIRE(store.n_symbols() == 0);

  store.record(history_record("5032", DetectionType::StopHigh,
                              at("2024-05-01 15:00:00")));
  REQUIRE(store.count("5032") == 1);

  fs::remove_all(dir);
}

TEST_CASE("Unwritable history file keeps records in memory", "[history]") {
  auto dir = fs::temp_directory_path() / "harvest_history_unwritable";
  fs::remove_all(dir);
  fs::create_directories(dir);
  {
    std::ofstream ofs{dir / "blocker"};
    ofs << "not a directory";
  }
  // the parent is a regular file, so the save cannot create it
  auto path = (dir / "blocker" / "history.bin").string();

  FileHistoryStore store{path};
  auto t0 = at("2024-05-01 15:00:00");

  REQUIRE_NOTHROW(
      store.record(history_record("4385", DetectionType::StopHigh, t0)));
  REQUIRE(store.count("4385") == 1);
  REQUIRE(store.record_unless_since(
      history_record("4385", DetectionType::PatternB, t0), t0));
  REQUIRE_FALSE(store.record_unless_since(
      history_record("4385", DetectionType::PatternB, t0), t0));

  SECTION("detection still succeeds") {
    auto s = stop_high_snapshot();
    auto v = detect_stop_high(s, s.indicators({}), store, {});
    REQUIRE(v.detected());
    REQUIRE(store.count(s.symbol, {.type = DetectionType::PatternA}) == 1);
  }

  fs::remove_all(dir);
}
