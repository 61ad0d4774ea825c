#include "core/provider.h"
#include "core/serialization.h"
#include "mt/sleeper.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

QuoteApi::QuoteApi(const APIConfig& cfg) : cfg{cfg} {
  for (auto& key : cfg.api_keys)
    keys.emplace_back(key);
  spdlog::info("[api] initiated with {} api keys", keys.size());
}

int QuoteApi::try_get_key() {
  TimePoint now = Clock::now();

  for (size_t i = 0; i < keys.size(); i++) {
    auto k = idx;
    idx = (idx + 1) % keys.size();

    auto& api_key = keys[k];
    if (api_key.daily_calls >= cfg.daily_calls)
      continue;

    auto& timestamps = api_key.call_timestamps;
    while (!timestamps.empty()) {
      auto duration = now - timestamps.front();
      if (duration < minutes(1))
        break;

      timestamps.pop_front();
    }

    if (timestamps.size() < static_cast<size_t>(cfg.max_calls_min))
      return static_cast<int>(k);
  }

  return -1;
}

std::optional<std::string> QuoteApi::get_key() {
  std::unique_lock lk{mtx};
  if (keys.empty())
    return std::nullopt;

  int k = -1;
  while ((k = try_get_key()) == -1) {
    lk.unlock();
    if (!sleeper.sleep_for(seconds(30)))
      return std::nullopt;
    lk.lock();
  }

  spdlog::trace("[api_key] {}", k);
  auto& api_key = keys[k];
  api_key.daily_calls++;
  api_key.call_timestamps.push_back(Clock::now());

  return api_key.key;
}

std::optional<std::string> QuoteApi::get(const std::string& endpoint,
                                         const std::string& symbol) {
  auto api_key = get_key();
  if (!api_key) {
    spdlog::error("[api] ({}) no api key available", symbol);
    return std::nullopt;
  }

  cpr::Parameters params{{"symbol", symbol}, {"apikey", *api_key}};
  auto res = cpr::Get(cpr::Url{cfg.base_url + "/" + endpoint}, params,
                      cpr::Timeout{10'000});

  if (res.error) {
    spdlog::error("[api] ({}) {} request error: {}", symbol, endpoint,
                  res.error.message);
    return std::nullopt;
  }

  if (res.status_code != 200) {
    spdlog::error("[api] ({}) {} http error {}", symbol, endpoint,
                  res.status_code);
    return std::nullopt;
  }

  return res.text;
}

std::optional<StockSnapshot> QuoteApi::snapshot(const std::string& symbol) {
  auto body = get("quote", symbol);
  if (!body)
    return std::nullopt;

  auto snap = read_quote_json(*body);
  if (snap && snap->symbol.empty())
    snap->symbol = symbol;
  return snap;
}

std::vector<Quarter> QuoteApi::earnings(const std::string& symbol) {
  auto body = get("earnings", symbol);
  if (!body)
    return {};
  return read_earnings_json(*body);
}
