#include "risk/sizing.h"
#include "util/format.h"

#include <algorithm>
#include <cmath>
#include <format>

PositionSize::PositionSize(double entry, double stop, const RiskConfig& cfg) {
  auto risk_per_share = entry - stop;
  if (entry <= 0.0 || risk_per_share <= 0.0) {
    rationale = "no valid stop below entry";
    return;
  }

  auto by_risk = cfg.max_risk_amount() / risk_per_share;
  auto by_exposure = cfg.max_position_amount() / entry;
  capped_by_exposure = by_exposure < by_risk;

  auto lot = std::max<int64_t>(cfg.lot_size, 1);
  auto raw = static_cast<int64_t>(std::floor(std::min(by_risk, by_exposure)));
  shares = raw / lot * lot;

  value = shares * entry;
  exposure = value / cfg.portfolio_size;
  risk_amount = shares * risk_per_share;

  if (shares == 0) {
    rationale = std::format("one lot of {} exceeds limits", lot);
    return;
  }

  rationale = std::format(
      "{} shares, risk {} ({:.2f}%), exposure {:.1f}%{}",
      group_thousands(shares), group_thousands(std::llround(risk_amount)),
      risk_amount / cfg.portfolio_size * 100, exposure * 100,
      capped_by_exposure ? ", capped by exposure" : "");
}
