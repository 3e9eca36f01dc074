#pragma once

#include "mmsim/types.hpp"

#include <cstdint>

namespace mmsim {

enum class EventType : std::uint8_t {
    Bid,
    Ask,
    Trade,
    Unknown    // anything the feed could not classify; ignored by the book
};

// One market data record for a single security, consumed in ts order.
struct MarketEvent {
    Timestamp ts    = 0;
    EventType type  = EventType::Unknown;
    Price     price = 0.0;
    Quantity  qty   = 0;
};

} // namespace mmsim
