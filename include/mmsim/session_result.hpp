#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mmsim/types.hpp"

namespace mmsim {

struct EventCounters {
    std::size_t bid_updates = 0;
    std::size_t ask_updates = 0;
    std::size_t trades      = 0;
    std::size_t gated       = 0;   // dropped by the session clock
    std::size_t ignored     = 0;   // unknown type or non-positive price
};

/// Final state of one security after a replay.
struct SessionResult {
    std::string security;

    Quantity position     = 0;
    double   realized_pnl = 0.0;
    double   total_pnl    = 0.0;       // realized + position marked at last_price
    std::optional<Price> last_price;   // last processed trade

    std::vector<FillRecord> fills;
    EventCounters           counters;

    std::set<TradingDate> market_dates;   // dates with at least one trade
    std::set<TradingDate> fill_dates;     // dates with at least one fill

    std::size_t stop_loss_triggers = 0;
    std::size_t dropped_flattens   = 0;   // pending flattens lost to a day change
    bool        unresolved_flatten = false;
};

} // namespace mmsim
