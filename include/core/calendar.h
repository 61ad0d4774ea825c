#pragma once

#include "core/snapshot.h"
#include "util/times.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct Event {
  char type = '\0';
  LocalTimePoint date;

  bool is_earnings() const { return type == 'E'; }
  bool is_listing() const { return type == 'L'; }
};

// Earnings and listing dates per symbol from a "type,symbol,date" csv
struct Calendar {
  std::unordered_map<std::string, std::vector<Event>> events;

  Calendar() = default;
  explicit Calendar(const std::string& path);

  void add(const std::string& symbol, Event ev);

  std::optional<LocalTimePoint> last_earnings(const std::string& symbol,
                                              LocalTimePoint as_of) const;
  std::optional<LocalTimePoint> listing_date(const std::string& symbol) const;

  // Fills listing age and earnings date where the provider left them out
  void enrich(StockSnapshot& s) const;
};
