#include "util/times.h"

#include <format>
#include <sstream>
#include <stdexcept>

using namespace std::chrono;

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt,
                                 std::string_view timezone) {
  if (datetime.empty())
    throw std::runtime_error("empty datetime string");

  std::istringstream in{std::string(datetime)};

  local_time<seconds> local;
  in >> parse(std::string(fmt), local);
  if (in.fail())
    throw std::runtime_error(std::format("bad datetime '{}'", datetime));

  if (timezone == jp_tz)
    return local;

  // interpret as time in the given zone, then convert to tokyo local time
  auto& db = get_tzdb();
  zoned_time from_zt{db.locate_zone(std::string(timezone)), local};
  zoned_time jp_zt{db.locate_zone(std::string(jp_tz)), from_zt.get_sys_time()};

  return floor<seconds>(jp_zt.get_local_time());
}

std::string datetime_to_string(LocalTimePoint tp) {
  return std::format("{:%F %T}", tp);
}

std::string date_to_string(LocalTimePoint tp) {
  return std::format("{:%F}", floor<days>(tp));
}

LocalTimePoint now_jp_time() {
  zoned_time now_zt{jp_tz, system_clock::now()};
  return floor<seconds>(now_zt.get_local_time());
}

int days_between(LocalTimePoint from, LocalTimePoint to) {
  return static_cast<int>((floor<days>(to) - floor<days>(from)).count());
}

double years_between(LocalTimePoint from, LocalTimePoint to) {
  return duration<double, years::period>(to - from).count();
}
