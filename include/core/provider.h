#pragma once

#include "core/snapshot.h"
#include "mt/ttl_cache.h"
#include "util/config.h"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class MarketDataProvider {
 public:
  virtual ~MarketDataProvider() = default;

  // Empty on any failure, the reason is logged by the provider
  virtual std::optional<StockSnapshot> snapshot(const std::string& symbol) = 0;

  // Quarterly results newest first
  virtual std::vector<Quarter> earnings(const std::string& symbol) = 0;
};

// Snapshots loaded once from a json file
class SnapshotFileProvider : public MarketDataProvider {
  std::unordered_map<std::string, StockSnapshot> snapshots;
  std::vector<std::string> order;

 public:
  explicit SnapshotFileProvider(const std::string& path);
  explicit SnapshotFileProvider(std::vector<StockSnapshot> arr);

  std::optional<StockSnapshot> snapshot(const std::string& symbol) override;
  std::vector<Quarter> earnings(const std::string& symbol) override;

  const std::vector<std::string>& symbols() const { return order; }
};

struct APIKey {
  const std::string key;
  int daily_calls = 0;
  std::deque<TimePoint> call_timestamps = {};
};

// HTTP quote endpoint with api key rotation under per key rate limits
class QuoteApi : public MarketDataProvider {
  const APIConfig cfg;

  std::vector<APIKey> keys;
  size_t idx = 0;
  std::mutex mtx;

  int try_get_key();
  std::optional<std::string> get_key();
  std::optional<std::string> get(const std::string& endpoint,
                                 const std::string& symbol);

 public:
  explicit QuoteApi(const APIConfig& cfg);

  std::optional<StockSnapshot> snapshot(const std::string& symbol) override;
  std::vector<Quarter> earnings(const std::string& symbol) override;
};

// Quotes and earnings kept for independent time-to-live windows
class CachedProvider : public MarketDataProvider {
  MarketDataProvider& inner;
  TtlCache<std::string, StockSnapshot> quotes;
  TtlCache<std::string, std::vector<Quarter>> results;

 public:
  CachedProvider(MarketDataProvider& inner, const ScanConfig& cfg) noexcept
      : inner{inner},
        quotes{minutes{cfg.quote_ttl_minutes}},
        results{hours{cfg.earnings_ttl_hours}}  //
  {}

  std::optional<StockSnapshot> snapshot(const std::string& symbol) override;
  std::vector<Quarter> earnings(const std::string& symbol) override;

  void invalidate(const std::string& symbol);
};
