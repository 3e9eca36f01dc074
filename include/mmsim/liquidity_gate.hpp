#pragma once

#include "mmsim/order_book.hpp"
#include "mmsim/types.hpp"

namespace mmsim {

struct GateDecision {
    bool     active{false};
    Quantity ahead_qty{0};      // visible level quantity at the quote price
    double   notional{0.0};     // price * ahead_qty
};

/**
 * Minimum-depth gate: a quote may be displayed only when the visible
 * notional already resting at its price reaches the threshold.
 *
 *   OnPlacement - ahead quantity is sampled when the queue position is
 *                 (re)established and kept while the price is unchanged.
 *   Continuous  - ahead quantity is re-sampled on every evaluation, and a
 *                 suppressed side forgets it.
 */
class LiquidityGate
{
public:
    enum class Mode {
        OnPlacement,
        Continuous
    };

    explicit LiquidityGate(double min_notional, Mode mode = Mode::OnPlacement)
        : min_notional_(min_notional), mode_(mode)
    {
    }

    GateDecision check(const OrderBook& book, BookSide side, Price price, Quantity size) const noexcept;

    bool resamples_ahead() const noexcept { return mode_ == Mode::Continuous; }

    double min_notional() const noexcept { return min_notional_; }
    Mode   mode() const noexcept { return mode_; }

private:
    double min_notional_;
    Mode   mode_;
};

} // namespace mmsim
