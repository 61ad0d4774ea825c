#pragma once

#include "util/times.h"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class DetectionType { StopHigh, PatternA, PatternB };

struct HistoryRecord {
  std::string symbol;
  DetectionType type = DetectionType::StopHigh;
  LocalTimePoint timestamp;

  // snapshot reference
  double price = 0.0;
  double change_rate = 0.0;
  int64_t volume = 0;

  // verdict summary
  std::string reason;
  double strength = 0.0;
};

struct HistoryQuery {
  std::optional<LocalTimePoint> since = std::nullopt;
  std::optional<DetectionType> type = std::nullopt;
};

class HistoryStore {
 public:
  virtual ~HistoryStore() = default;

  virtual void record(const HistoryRecord& rec) = 0;

  // Records only when no record of the same type exists at or after `since`.
  // Returns whether the record was appended.
  virtual bool record_unless_since(const HistoryRecord& rec,
                                   LocalTimePoint since) = 0;

  // Oldest first
  virtual std::vector<HistoryRecord> query(const std::string& symbol,
                                           HistoryQuery q = {}) const = 0;

  size_t count(const std::string& symbol, HistoryQuery q = {}) const {
    return query(symbol, q).size();
  }
};

// Per-symbol bounded ring of records under one coarse lock
class MemoryHistoryStore : public HistoryStore {
 protected:
  const size_t capacity;

  mutable std::mutex mtx;
  std::unordered_map<std::string, std::deque<HistoryRecord>> records;

  void append(const HistoryRecord& rec);
  bool contains(const std::string& symbol,
                DetectionType type,
                LocalTimePoint since) const;

 public:
  explicit MemoryHistoryStore(size_t capacity = 50) noexcept
      : capacity{capacity ? capacity : 1} {}

  void record(const HistoryRecord& rec) override;
  bool record_unless_since(const HistoryRecord& rec,
                           LocalTimePoint since) override;
  std::vector<HistoryRecord> query(const std::string& symbol,
                                   HistoryQuery q = {}) const override;

  size_t n_symbols() const;
};

// Memory store mirrored to a binary file after every append
class FileHistoryStore : public MemoryHistoryStore {
  const std::string path;

  void save() const;
  void load();

 public:
  FileHistoryStore(std::string path, size_t capacity = 50);

  void record(const HistoryRecord& rec) override;
  bool record_unless_since(const HistoryRecord& rec,
                           LocalTimePoint since) override;
};
