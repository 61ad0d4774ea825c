#include "core/serialization.h"
#include "core/history.h"
#include "util/format.h"
#include "util/math.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <glaze/glaze.hpp>
#include <map>

#include <cereal/archives/binary.hpp>
#include <cereal/types/common.hpp>
#include <cereal/types/deque.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/unordered_map.hpp>

namespace fs = std::filesystem;

namespace cereal {
template <class Archive>
void save(Archive& ar, const HistoryRecord& r) {
  auto secs = r.timestamp.time_since_epoch().count();
  ar(r.symbol, r.type, secs, r.price, r.change_rate, r.volume, r.reason,
     r.strength);
}

template <class Archive>
void load(Archive& ar, HistoryRecord& r) {
  std::int64_t secs;
  ar(r.symbol, r.type, secs, r.price, r.change_rate, r.volume, r.reason,
     r.strength);
  r.timestamp = LocalTimePoint{std::chrono::seconds{secs}};
}
}  // namespace cereal

FileHistoryStore::FileHistoryStore(std::string path, size_t capacity)
    : MemoryHistoryStore{capacity}, path{std::move(path)} {
  load();
}

void FileHistoryStore::load() {
  std::lock_guard lk{mtx};
  if (!fs::exists(path))
    return;

  try {
    std::ifstream ifs(path, std::ios::binary);
    cereal::BinaryInputArchive iarchive(ifs);
    iarchive(records);
  } catch (const std::exception& ex) {
    spdlog::error("[history] {} unreadable, starting empty: {}", path,
                  ex.what());
    records.clear();
    return;
  }

  for (auto& [_, ring] : records)
    while (ring.size() > capacity)
      ring.pop_front();

  spdlog::info("[history] loaded {} symbols from {}", records.size(), path);
}

// Expects the store lock to be held. The in-memory records stay
// authoritative when the file cannot be written.
void FileHistoryStore::save() const {
  try {
    auto parent = fs::path{path}.parent_path();
    if (!parent.empty())
      fs::create_directories(parent);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      spdlog::error("[history] cannot open {} for writing", path);
      return;
    }

    cereal::BinaryOutputArchive oarchive(ofs);
    oarchive(records);
  } catch (const std::exception& ex) {
    spdlog::error("[history] saving {} failed: {}", path, ex.what());
  }
}

void FileHistoryStore::record(const HistoryRecord& rec) {
  std::lock_guard lk{mtx};
  append(rec);
  save();
  spdlog::debug("[history] ({}) {} recorded", rec.symbol, to_str(rec.type));
}

bool FileHistoryStore::record_unless_since(const HistoryRecord& rec,
                                           LocalTimePoint since) {
  std::lock_guard lk{mtx};
  if (contains(rec.symbol, rec.type, since))
    return false;
  append(rec);
  save();
  return true;
}

template <>
struct glz::meta<LocalTimePoint> {
  using T = LocalTimePoint;

  static constexpr auto write = [](const T& time_point) {
    return std::format("{:%F %T}", time_point);
  };

  static constexpr auto read = [](T& t, const std::string& str) {
    if (str.empty())
      t = T{};
    else if (str.size() > 10)
      t = datetime_to_local(str);
    else
      t = date_to_local(str);
  };

  static constexpr auto value = custom<read, write>;
};

constexpr auto read_opts = glz::opts{
    .error_on_unknown_keys = false,
};

inline void stamp(StockSnapshot& s, LocalTimePoint now) {
  if (s.as_of == LocalTimePoint{})
    s.as_of = now;
}

std::vector<StockSnapshot> read_snapshots_json(const std::string& str) {
  std::vector<StockSnapshot> arr;
  try {
    auto ec = glz::read<read_opts>(arr, str);
    if (ec) {
      spdlog::error("[snapshots] json error: {}", glz::format_error(ec, str));
      return {};
    }
  } catch (const std::exception& ex) {
    spdlog::error("[snapshots] json error: {}", ex.what());
    return {};
  }

  auto now = now_jp_time();
  for (auto& s : arr)
    stamp(s, now);
  return arr;
}

std::vector<StockSnapshot> read_snapshots_file(const std::string& path) {
  std::ifstream ifs{path};
  if (!ifs) {
    spdlog::error("[snapshots] cannot open {}", path);
    return {};
  }
  std::string str{std::istreambuf_iterator<char>{ifs}, {}};
  return read_snapshots_json(str);
}

std::optional<StockSnapshot> read_quote_json(const std::string& str) {
  StockSnapshot s;
  try {
    auto ec = glz::read<read_opts>(s, str);
    if (ec) {
      spdlog::error("[api] quote json error: {}", glz::format_error(ec, str));
      return std::nullopt;
    }
  } catch (const std::exception& ex) {
    spdlog::error("[api] quote json error: {}", ex.what());
    return std::nullopt;
  }

  stamp(s, now_jp_time());
  return s;
}

struct earnings_res_t {
  std::vector<Quarter> quarters;
};

std::vector<Quarter> read_earnings_json(const std::string& str) {
  earnings_res_t res;
  auto ec = glz::read<read_opts>(res, str);
  if (ec) {
    spdlog::error("[api] earnings json error: {}", glz::format_error(ec, str));
    return {};
  }
  return res.quarters;
}

struct SignalRow {
  std::string symbol;
  std::string name;
  std::string timestamp;
  std::string action;

  double price = 0.0;
  double strength = 0.0;
  double confidence = 0.0;

  double entry_price = 0.0;
  double profit_target = 0.0;
  double stop_loss = 0.0;
  double risk_reward = 0.0;

  int64_t shares = 0;
  double position_value = 0.0;
  double exposure = 0.0;

  std::string risk_level;
  double risk_score = 0.0;
  std::vector<std::string> risk_factors;

  std::map<std::string, double> scores;
  std::map<std::string, std::string> detections;

  bool executable = false;
  std::vector<std::string> notes;
  std::string error;
};

inline SignalRow to_row(const TradingSignal& sig) {
  SignalRow row;
  row.symbol = sig.symbol;
  row.name = sig.name;
  row.timestamp = datetime_to_string(sig.timestamp);
  row.action = to_str(sig.action);
  row.error = sig.error;

  if (sig.action == Action::Error)
    return row;

  row.price = sig.price;
  row.strength = round(sig.strength, 2);
  row.confidence = round(sig.confidence, 3);
  row.entry_price = round(sig.entry_price, 2);
  row.profit_target = round(sig.profit_target, 2);
  row.stop_loss = round(sig.stop_loss, 2);
  row.risk_reward = round(sig.risk_reward, 2);

  row.shares = sig.position.shares;
  row.position_value = round(sig.position.value, 0);
  row.exposure = round(sig.position.exposure, 4);

  row.risk_level = to_str(sig.risk.level);
  row.risk_score = sig.risk.score;
  row.risk_factors = sig.risk.factors;

  auto& sc = sig.scores;
  row.scores = {
      {"logic", round(sc.logic, 2)},
      {"technical", round(sc.technical, 2)},
      {"timeframe", round(sc.timeframe, 2)},
      {"volume", round(sc.volume, 2)},
      {"momentum", round(sc.momentum, 2)},
      {"trend", round(sc.trend, 2)},
      {"support_resistance", round(sc.support_resistance, 2)},
      {"volatility", round(sc.volatility, 2)},
  };

  for (auto& d : sig.detections)
    if (d.detected())
      row.detections.emplace(to_str(d.pattern), d.reason);

  row.executable = sig.executable;
  row.notes = sig.notes;
  return row;
}

std::string signals_to_json(const std::vector<TradingSignal>& signals) {
  std::vector<SignalRow> rows;
  rows.reserve(signals.size());
  for (auto& sig : signals)
    rows.push_back(to_row(sig));

  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(rows, buffer);
  if (ec)
    spdlog::error("[signals] json write error");
  return buffer;
}

bool write_signals_json(const std::string& path,
                        const std::vector<TradingSignal>& signals) {
  auto parent = fs::path{path}.parent_path();
  if (!parent.empty())
    fs::create_directories(parent);

  std::ofstream ofs{path, std::ios::trunc};
  if (!ofs) {
    spdlog::error("[signals] cannot open {}", path);
    return false;
  }

  ofs << signals_to_json(signals);
  return static_cast<bool>(ofs);
}
