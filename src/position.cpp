#include "mmsim/position.hpp"

#include <algorithm> // std::min

namespace mmsim {

namespace {

Quantity abs_qty(Quantity q) noexcept
{
    return q < 0 ? -q : q;
}

} // namespace

std::string_view to_string(FillReason r) noexcept
{
    switch (r)
    {
    case FillReason::Quote:        return "quote";
    case FillReason::EodFlatten:   return "eod_flatten";
    case FillReason::StopLoss:     return "stop_loss";
    case FillReason::AuctionEntry: return "auction_entry";
    case FillReason::VwapExit:     return "vwap_exit";
    }
    return "unknown";
}

PositionAccountant::PositionAccountant(Quantity initial_position, Price initial_avg_price)
    : initial_position_(initial_position),
      position_(initial_position),
      avg_price_(initial_position != 0 ? initial_avg_price : 0.0)
{
    fills_.reserve(256);
}

std::optional<FillRecord> PositionAccountant::apply_fill(Side side, Price price, Quantity qty,
                                                         Timestamp ts, FillReason reason)
{
    if (qty <= 0)
        return std::nullopt;

    const Quantity sign = (side == Side::Buy) ? 1 : -1;
    Quantity remaining  = qty;
    double   realized   = 0.0;

    // Сначала закрываем противоположную позицию.
    if (position_ != 0 && (position_ > 0) != (sign > 0))
    {
        const Quantity close_qty = std::min(remaining, abs_qty(position_));
        if (position_ > 0)
            realized += (price - avg_price_) * static_cast<double>(close_qty);
        else
            realized += (avg_price_ - price) * static_cast<double>(close_qty);

        position_ += sign * close_qty;
        remaining -= close_qty;
        if (position_ == 0)
            avg_price_ = 0.0;
    }

    // Остаток открывает или наращивает позицию по средневзвешенной цене.
    if (remaining > 0)
    {
        const Quantity old_abs = abs_qty(position_);
        const Quantity new_abs = old_abs + remaining;
        if (old_abs == 0)
        {
            avg_price_ = price;
        }
        else
        {
            avg_price_ = (avg_price_ * static_cast<double>(old_abs)
                          + price * static_cast<double>(remaining))
                       / static_cast<double>(new_abs);
        }
        position_ += sign * remaining;
    }

    realized_pnl_ += realized;
    net_filled_   += sign * qty;

    FillRecord rec;
    rec.ts             = ts;
    rec.side           = side;
    rec.price          = price;
    rec.qty            = qty;
    rec.realized_pnl   = realized;
    rec.position       = position_;
    rec.cumulative_pnl = realized_pnl_;
    rec.reason         = reason;

    fills_.push_back(rec);
    return rec;
}

std::optional<FillRecord> PositionAccountant::flatten(Price price, Timestamp ts, FillReason reason)
{
    if (position_ == 0)
        return std::nullopt;

    if (position_ > 0)
        return apply_fill(Side::Sell, price, position_, ts, reason);
    return apply_fill(Side::Buy, price, -position_, ts, reason);
}

double PositionAccountant::unrealized_pnl(Price mark) const noexcept
{
    if (position_ == 0)
        return 0.0;
    return (mark - avg_price_) * static_cast<double>(position_);
}

} // namespace mmsim
