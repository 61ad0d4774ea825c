#include "core/calendar.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>

Calendar::Calendar(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    spdlog::warn("[calendar] {} not found", path);
    return;
  }

  std::string line;
  std::getline(file, line);

  size_t n_line = 1;
  while (std::getline(file, line)) {
    n_line++;
    std::istringstream ss(line);
    std::string ev_type, symbol, date;

    if (!(std::getline(ss, ev_type, ',') && std::getline(ss, symbol, ',') &&
          std::getline(ss, date)))
      continue;

    char type;
    if (ev_type == "Earnings")
      type = 'E';
    else if (ev_type == "Listing")
      type = 'L';
    else
      continue;

    try {
      add(symbol, Event{type, date_to_local(date)});
    } catch (const std::runtime_error& ex) {
      spdlog::warn("[calendar] {}:{} {}", path, n_line, ex.what());
    }
  }

  spdlog::info("[calendar] {} symbols", events.size());
}

void Calendar::add(const std::string& symbol, Event ev) {
  auto& arr = events[symbol];
  auto it = std::upper_bound(
      arr.begin(), arr.end(), ev,
      [](auto& l, auto& r) { return l.date < r.date; });
  arr.insert(it, ev);
}

std::optional<LocalTimePoint> Calendar::last_earnings(
    const std::string& symbol,
    LocalTimePoint as_of) const {
  auto it = events.find(symbol);
  if (it == events.end())
    return std::nullopt;

  std::optional<LocalTimePoint> last;
  for (auto& ev : it->second)
    if (ev.is_earnings() && days_between(ev.date, as_of) >= 0)
      last = ev.date;
  return last;
}

std::optional<LocalTimePoint> Calendar::listing_date(
    const std::string& symbol) const {
  auto it = events.find(symbol);
  if (it == events.end())
    return std::nullopt;

  for (auto& ev : it->second)
    if (ev.is_listing())
      return ev.date;
  return std::nullopt;
}

void Calendar::enrich(StockSnapshot& s) const {
  if (!s.listing_eligible && !s.years_listed)
    if (auto listed = listing_date(s.symbol))
      s.years_listed = years_between(*listed, s.as_of);

  if (!s.within_earnings_window && !s.last_earnings_date)
    s.last_earnings_date = last_earnings(s.symbol, s.as_of);
}
