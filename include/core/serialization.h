#pragma once

#include "core/snapshot.h"
#include "sig/trading_signal.h"

#include <optional>
#include <string>
#include <vector>

// Array of snapshots, entries without `as_of` are stamped with the load time
std::vector<StockSnapshot> read_snapshots_json(const std::string& str);
std::vector<StockSnapshot> read_snapshots_file(const std::string& path);

std::optional<StockSnapshot> read_quote_json(const std::string& str);
std::vector<Quarter> read_earnings_json(const std::string& str);

std::string signals_to_json(const std::vector<TradingSignal>& signals);
bool write_signals_json(const std::string& path,
                        const std::vector<TradingSignal>& signals);
