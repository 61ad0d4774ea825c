#include "core/price_limit.h"

#include <algorithm>
#include <iterator>
#include <utility>

// {upper bound of base price (exclusive), limit width}
inline constexpr std::pair<double, double> limit_table[] = {
    {100, 30},
    {200, 50},
    {500, 80},
    {700, 100},
    {1'000, 150},
    {1'500, 300},
    {2'000, 400},
    {3'000, 500},
    {5'000, 700},
    {7'000, 1'000},
    {10'000, 1'500},
    {15'000, 3'000},
    {20'000, 4'000},
    {30'000, 5'000},
    {50'000, 7'000},
    {70'000, 10'000},
    {100'000, 15'000},
    {150'000, 30'000},
    {200'000, 40'000},
    {300'000, 50'000},
    {500'000, 70'000},
    {700'000, 100'000},
    {1'000'000, 150'000},
    {1'500'000, 300'000},
    {2'000'000, 400'000},
    {3'000'000, 500'000},
    {5'000'000, 700'000},
    {7'000'000, 1'000'000},
    {10'000'000, 1'500'000},
    {15'000'000, 3'000'000},
};

double limit_width(double base_price, int stage) {
  stage = std::clamp(stage, 1, 3);

  for (auto& [upper, width] : limit_table)
    if (base_price < upper)
      return width * stage;

  return std::end(limit_table)[-1].second * stage;
}
