#include "mmsim/fill_simulator.hpp"

#include <algorithm>

namespace mmsim {

QueueConsumption FillSimulator::consume(QuoteSideState& q, BookSide side, Quantity trade_qty,
                                        OrderBook& book)
{
    QueueConsumption c;
    c.hit         = true;
    c.quote_price = *q.price;

    Quantity volume = std::max<Quantity>(0, trade_qty);

    c.ahead_consumed = std::min(volume, q.ahead_qty);
    q.ahead_qty -= c.ahead_consumed;
    volume      -= c.ahead_consumed;

    c.own_filled = std::min(volume, q.remaining);
    q.remaining -= c.own_filled;

    book.remove(side, c.quote_price, c.ahead_consumed + c.own_filled);

    if (q.remaining == 0)
        q.displayed = false;
    return c;
}

TradeOutcome FillSimulator::on_trade(QuoteSideState& bid, QuoteSideState& ask,
                                     Price trade_price, Quantity trade_qty, OrderBook& book)
{
    TradeOutcome out;
    if (trade_qty <= 0)
        return out;

    Quantity volume = trade_qty;

    if (ask.displayed && ask.price && trade_price >= *ask.price)
    {
        out.ask = consume(ask, BookSide::Ask, volume, book);
        volume -= out.ask.ahead_consumed + out.ask.own_filled;
    }

    // Locked quotes: the bid only sees what the ask left of the print.
    if (volume > 0 && bid.displayed && bid.price && trade_price <= *bid.price)
        out.bid = consume(bid, BookSide::Bid, volume, book);

    return out;
}

} // namespace mmsim
