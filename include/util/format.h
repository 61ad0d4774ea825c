#pragma once

#include <concepts>
#include <format>
#include <string>
#include <type_traits>

template <typename T>
std::string to_str(const T& t);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}

inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    result += to_str(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}

inline std::string join(const auto& c, std::string sep = ", ") {
  return join(std::begin(c), std::end(c), std::move(sep));
}

// "1,234,567" style grouping for share counts and volumes
std::string group_thousands(long long n);
