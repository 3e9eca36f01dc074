#include "mmsim/liquidity_gate.hpp"

namespace mmsim {

GateDecision LiquidityGate::check(const OrderBook& book, BookSide side, Price price,
                                  Quantity size) const noexcept
{
    GateDecision d;
    d.ahead_qty = book.quantity_at(side, price);
    d.notional  = price * static_cast<double>(d.ahead_qty);
    d.active    = size > 0 && d.notional >= min_notional_;
    return d;
}

} // namespace mmsim
