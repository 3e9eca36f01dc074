#include "mmsim/stop_loss.hpp"

#include <algorithm>
#include <cmath>

namespace mmsim {

namespace {

Quantity abs_qty(Quantity q) noexcept
{
    return q < 0 ? -q : q;
}

int sign_of(Quantity q) noexcept
{
    return (q > 0) - (q < 0);
}

} // namespace

void StopLossMonitor::on_position_change(Quantity old_position, Quantity new_position,
                                         Price fill_price) noexcept
{
    const Quantity old_abs = abs_qty(old_position);
    const Quantity new_abs = abs_qty(new_position);

    if (new_position == 0)
    {
        cost_basis_ = 0.0;
        basis_qty_  = 0;
        return;
    }

    if (old_position == 0 || sign_of(old_position) != sign_of(new_position))
    {
        // fresh position or flip
        cost_basis_ = fill_price * static_cast<double>(new_abs);
    }
    else if (new_abs > old_abs)
    {
        cost_basis_ += fill_price * static_cast<double>(new_abs - old_abs);
    }
    else if (new_abs < old_abs)
    {
        cost_basis_ *= static_cast<double>(new_abs) / static_cast<double>(old_abs);
    }
    basis_qty_ = new_abs;
}

double StopLossMonitor::unrealized_pnl(Quantity position, Price mark) const noexcept
{
    if (position == 0 || basis_qty_ == 0)
        return 0.0;
    const double avg_entry = std::fabs(cost_basis_) / static_cast<double>(basis_qty_);
    return (mark - avg_entry) * static_cast<double>(position);
}

double StopLossMonitor::unrealized_pnl_pct(Quantity position, Price mark) const noexcept
{
    if (position == 0 || std::fabs(cost_basis_) < 1e-6)
        return 0.0;
    return unrealized_pnl(position, mark) / std::fabs(cost_basis_) * 100.0;
}

bool StopLossMonitor::should_trigger(Quantity position, Price mark) const noexcept
{
    if (position == 0 || pending_)
        return false;
    return unrealized_pnl_pct(position, mark) < -threshold_pct_;
}

bool StopLossMonitor::trigger(Quantity position, Timestamp ts)
{
    if (position == 0 || pending_)
        return false;

    PendingLiquidation p;
    p.side         = position > 0 ? Side::Sell : Side::Buy;
    p.quantity     = abs_qty(position);
    p.remaining    = p.quantity;
    p.triggered_at = ts;
    pending_ = p;
    ++triggers_;
    return true;
}

std::optional<LiquidationSlice> StopLossMonitor::next_slice(const LevelInfo& best_bid,
                                                            const LevelInfo& best_ask,
                                                            Quantity position) const noexcept
{
    if (!pending_ || position == 0)
        return std::nullopt;

    const LevelInfo& touch = pending_->side == Side::Sell ? best_bid : best_ask;
    if (!touch.valid || touch.qty <= 0)
        return std::nullopt;

    LiquidationSlice s;
    s.side  = pending_->side;
    s.price = touch.price;
    s.qty   = std::min({pending_->remaining, touch.qty, abs_qty(position)});
    if (s.qty <= 0)
        return std::nullopt;
    return s;
}

void StopLossMonitor::on_liquidated(Quantity qty) noexcept
{
    if (!pending_)
        return;
    pending_->remaining -= qty;
    if (pending_->remaining <= 0)
        pending_.reset();
}

} // namespace mmsim
