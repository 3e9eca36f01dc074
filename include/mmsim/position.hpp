#pragma once

#include <optional>
#include <vector>

#include "mmsim/types.hpp"

namespace mmsim {

/**
 * Signed position, blended average entry price and realized PnL of one
 * security, plus the append-only list of fills that produced them.
 *
 * A fill first closes any opposite position (that part realizes PnL against
 * the average entry), the remainder opens or extends at weighted-average cost.
 * Opening or extending never changes realized PnL.
 */
class PositionAccountant
{
public:
    explicit PositionAccountant(Quantity initial_position = 0, Price initial_avg_price = 0.0);

    /// Book one execution. qty <= 0 records nothing and returns nullopt.
    std::optional<FillRecord> apply_fill(Side side, Price price, Quantity qty, Timestamp ts,
                                         FillReason reason = FillReason::Quote);

    /// Close the whole position with a synthetic opposite fill at price.
    /// Returns nullopt when already flat.
    std::optional<FillRecord> flatten(Price price, Timestamp ts,
                                      FillReason reason = FillReason::EodFlatten);

    Quantity position() const noexcept { return position_; }
    bool     flat() const noexcept { return position_ == 0; }

    /// Meaningful only while position() != 0.
    Price average_entry() const noexcept { return avg_price_; }

    double realized_pnl() const noexcept { return realized_pnl_; }

    /// (mark - avg) * position, 0 when flat.
    double unrealized_pnl(Price mark) const noexcept;

    /// Signed sum of all booked fill quantities (buys positive).
    Quantity net_filled() const noexcept { return net_filled_; }

    Quantity initial_position() const noexcept { return initial_position_; }

    const std::vector<FillRecord>& fills() const noexcept { return fills_; }

private:
    Quantity initial_position_{0};
    Quantity position_{0};
    Price    avg_price_{0.0};
    double   realized_pnl_{0.0};
    Quantity net_filled_{0};

    std::vector<FillRecord> fills_;
};

} // namespace mmsim
