#pragma once

#include <cstddef>
#include <optional>

#include "mmsim/types.hpp"

namespace mmsim {

struct PendingLiquidation {
    Side      side{Side::Sell};   // opposite of the position when triggered
    Quantity  quantity{0};        // full position at trigger time
    Quantity  remaining{0};
    Timestamp triggered_at{0};
};

struct LiquidationSlice {
    Side     side{Side::Sell};
    Price    price{0.0};
    Quantity qty{0};
};

/**
 * Stop-loss state machine:  Armed -> Pending -> (partial fills) -> Armed.
 *
 * Keeps its own quantity-weighted cost basis (|entry notional| of the open
 * position) so the loss percentage is unaffected by how the accountant
 * averages partial reductions:
 *   - open from flat / flip : basis = price * |new|
 *   - add same direction    : basis += price * added
 *   - reduce                : basis *= |new| / |old|
 *   - close                 : basis = 0
 */
class StopLossMonitor
{
public:
    explicit StopLossMonitor(double threshold_pct) : threshold_pct_(threshold_pct) {}

    /// Must see every fill that changed the position, whatever caused it.
    void on_position_change(Quantity old_position, Quantity new_position, Price fill_price) noexcept;

    double   cost_basis() const noexcept { return cost_basis_; }
    Quantity basis_qty() const noexcept { return basis_qty_; }

    double unrealized_pnl(Quantity position, Price mark) const noexcept;

    /// Negative means loss. 0 when flat or the basis is empty.
    double unrealized_pnl_pct(Quantity position, Price mark) const noexcept;

    /// Loss strictly beyond the threshold with nothing already pending.
    bool should_trigger(Quantity position, Price mark) const noexcept;

    /// Arm a liquidation of the whole position. False if flat or already pending.
    bool trigger(Quantity position, Timestamp ts);

    /// Next execution against the opposite touch: a long sells into the bid,
    /// a short buys from the ask. Capped by the remaining pending quantity,
    /// the visible depth and |position|. nullopt if nothing can execute now.
    std::optional<LiquidationSlice> next_slice(const LevelInfo& best_bid,
                                               const LevelInfo& best_ask,
                                               Quantity position) const noexcept;

    /// Reduce the pending quantity; clears the pending state when done.
    void on_liquidated(Quantity qty) noexcept;

    /// Drop a pending liquidation without executing it.
    void cancel() noexcept { pending_.reset(); }

    const std::optional<PendingLiquidation>& pending() const noexcept { return pending_; }
    bool        is_pending() const noexcept { return pending_.has_value(); }
    std::size_t trigger_count() const noexcept { return triggers_; }
    double      threshold_pct() const noexcept { return threshold_pct_; }

private:
    double threshold_pct_;

    double   cost_basis_{0.0};
    Quantity basis_qty_{0};

    std::optional<PendingLiquidation> pending_;
    std::size_t triggers_{0};
};

} // namespace mmsim
