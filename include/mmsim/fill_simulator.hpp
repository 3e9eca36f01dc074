#pragma once

#include "mmsim/order_book.hpp"
#include "mmsim/refill_policy.hpp"
#include "mmsim/types.hpp"

namespace mmsim {

/// What one trade did to one of our quotes.
struct QueueConsumption {
    bool     hit{false};
    Price    quote_price{0.0};
    Quantity ahead_consumed{0};
    Quantity own_filled{0};      // executed against our quote
};

struct TradeOutcome {
    QueueConsumption bid;        // own_filled is a buy
    QueueConsumption ask;        // own_filled is a sell
};

/**
 * FIFO queue model for our passive quotes.
 *
 * A trade at or above our ask (at or below our bid) hits that quote. Its
 * volume drains the visible quantity ahead of us first and only the rest
 * reaches our order. The executed total is removed from the book level.
 * A quote whose remaining size reaches zero stops being displayed.
 * When both quotes are hit by one print (bid >= ask) the ask is served
 * first and the bid gets the leftover volume, so the total never exceeds
 * the print.
 */
class FillSimulator
{
public:
    static TradeOutcome on_trade(QuoteSideState& bid, QuoteSideState& ask,
                                 Price trade_price, Quantity trade_qty, OrderBook& book);

    /// Single-side form of on_trade; the side must already be known to be hit.
    static QueueConsumption consume(QuoteSideState& q, BookSide side, Quantity trade_qty,
                                    OrderBook& book);
};

} // namespace mmsim
