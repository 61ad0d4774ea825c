#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

constexpr auto round(auto x, int n) {
  auto mult = std::pow(10, n);
  return std::round(x * mult) / mult;
}

template <typename It>
double mean(It first, It last) {
  auto n = std::distance(first, last);
  if (n <= 0)
    return 0.0;
  return std::accumulate(first, last, 0.0) / n;
}

inline double mean(const auto& c) {
  return mean(std::begin(c), std::end(c));
}

template <typename It>
double stddev(It first, It last) {
  auto n = std::distance(first, last);
  if (n <= 0)
    return 0.0;
  auto mu = mean(first, last);
  double acc = 0.0;
  for (auto it = first; it != last; it++)
    acc += (*it - mu) * (*it - mu);
  return std::sqrt(acc / n);
}

constexpr double clamp_score(double x) {
  return std::clamp(x, 0.0, 100.0);
}
