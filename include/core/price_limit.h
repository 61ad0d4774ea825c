#pragma once

// Daily price limit width for a base (previous close) price under the
// exchange table. `stage` widens the band 1x, 2x or 3x on consecutive
// limit days.
double limit_width(double base_price, int stage = 1);

inline double limit_up_price(double base_price, int stage = 1) {
  return base_price + limit_width(base_price, stage);
}

inline double limit_down_price(double base_price, int stage = 1) {
  auto p = base_price - limit_width(base_price, stage);
  return p > 1.0 ? p : 1.0;
}
