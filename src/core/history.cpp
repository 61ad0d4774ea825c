#include "core/history.h"

#include <algorithm>

void MemoryHistoryStore::append(const HistoryRecord& rec) {
  auto& ring = records[rec.symbol];
  ring.push_back(rec);
  while (ring.size() > capacity)
    ring.pop_front();
}

bool MemoryHistoryStore::contains(const std::string& symbol,
                                  DetectionType type,
                                  LocalTimePoint since) const {
  auto it = records.find(symbol);
  if (it == records.end())
    return false;

  return std::any_of(it->second.begin(), it->second.end(), [&](auto& r) {
    return r.type == type && r.timestamp >= since;
  });
}

void MemoryHistoryStore::record(const HistoryRecord& rec) {
  std::lock_guard lk{mtx};
  append(rec);
}

bool MemoryHistoryStore::record_unless_since(const HistoryRecord& rec,
                                             LocalTimePoint since) {
  std::lock_guard lk{mtx};
  if (contains(rec.symbol, rec.type, since))
    return false;
  append(rec);
  return true;
}

std::vector<HistoryRecord> MemoryHistoryStore::query(const std::string& symbol,
                                                     HistoryQuery q) const {
  std::lock_guard lk{mtx};

  std::vector<HistoryRecord> res;
  auto it = records.find(symbol);
  if (it == records.end())
    return res;

  for (auto& r : it->second) {
    if (q.type && r.type != *q.type)
      continue;
    if (q.since && r.timestamp < *q.since)
      continue;
    res.push_back(r);
  }

  return res;
}

size_t MemoryHistoryStore::n_symbols() const {
  std::lock_guard lk{mtx};
  return records.size();
}
