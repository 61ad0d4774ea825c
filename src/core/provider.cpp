#include "core/provider.h"
#include "core/serialization.h"

#include <spdlog/spdlog.h>

SnapshotFileProvider::SnapshotFileProvider(const std::string& path)
    : SnapshotFileProvider{read_snapshots_file(path)} {}

SnapshotFileProvider::SnapshotFileProvider(std::vector<StockSnapshot> arr) {
  for (auto& s : arr) {
    if (s.symbol.empty()) {
      spdlog::warn("[snapshots] skipping entry without a symbol");
      continue;
    }
    if (!snapshots.contains(s.symbol))
      order.push_back(s.symbol);
    auto symbol = s.symbol;
    snapshots.insert_or_assign(symbol, std::move(s));
  }
  spdlog::info("[snapshots] loaded {} symbols", order.size());
}

std::optional<StockSnapshot> SnapshotFileProvider::snapshot(
    const std::string& symbol) {
  auto it = snapshots.find(symbol);
  if (it == snapshots.end()) {
    spdlog::warn("[snapshots] ({}) not found", symbol);
    return std::nullopt;
  }
  return it->second;
}

std::vector<Quarter> SnapshotFileProvider::earnings(const std::string& symbol) {
  auto it = snapshots.find(symbol);
  if (it == snapshots.end())
    return {};
  return it->second.quarters;
}

std::optional<StockSnapshot> CachedProvider::snapshot(
    const std::string& symbol) {
  return quotes.get_or_load(symbol, [&] { return inner.snapshot(symbol); });
}

std::vector<Quarter> CachedProvider::earnings(const std::string& symbol) {
  auto res = results.get_or_load(
      symbol, [&]() -> std::optional<std::vector<Quarter>> {
        auto q = inner.earnings(symbol);
        if (q.empty())
          return std::nullopt;
        return q;
      });
  return res.value_or(std::vector<Quarter>{});
}

void CachedProvider::invalidate(const std::string& symbol) {
  quotes.invalidate(symbol);
  results.invalidate(symbol);
}
