#pragma once

#include "core/snapshot.h"
#include "ind/indicators.h"
#include "sig/verdict.h"
#include "util/config.h"

// Looser first-generation rules, stateless. They only feed the integrator's
// logic score.
DetectionVerdict detect_legacy_a(const StockSnapshot& s,
                                 const IndicatorSet& ind,
                                 const LegacyConfig& cfg) noexcept;

DetectionVerdict detect_legacy_b(const StockSnapshot& s,
                                 const IndicatorSet& ind,
                                 const LegacyConfig& cfg) noexcept;
