#pragma once

#include <cstddef>
#include <functional>
#include <map>

#include "mmsim/event.hpp"
#include "mmsim/types.hpp"

namespace mmsim {

/**
 * Aggregated price -> quantity book for a single security.
 *
 * Design
 *  - Two price books:
 *      * bids_ : Price -> Quantity, ordered by std::greater (best bid at begin()).
 *      * asks_ : Price -> Quantity, ordered by std::less   (best ask at begin()).
 *  - Feed updates overwrite the quantity of a level; they never add to it.
 *  - A level with quantity <= 0 does not exist.
 *  - Trades do not touch levels, they only update last_trade().
 *
 * All methods are NOT thread-safe; each security owns its book.
 */
class OrderBook
{
public:
    OrderBook() = default;

    /// True if there are no bid and ask levels.
    bool empty() const noexcept;

    /// Remove all levels and forget the last trade.
    void clear() noexcept;

    /// Apply one feed record. Bid/ask set the level quantity (<= 0 deletes),
    /// trade records last price/quantity. Non-positive price or unknown type
    /// is a silent no-op.
    void apply_update(const MarketEvent& ev);

    /// Highest bid level, invalid if the bid side is empty.
    LevelInfo best_bid() const noexcept;

    /// Lowest ask level, invalid if the ask side is empty.
    LevelInfo best_ask() const noexcept;

    /// Resting quantity at an exact price, 0 if the level does not exist.
    Quantity quantity_at(BookSide side, Price price) const noexcept;

    /// Consume liquidity at a level: decrement, or delete once exhausted.
    /// Returns the quantity actually removed.
    Quantity remove(BookSide side, Price price, Quantity qty);

    /// Last trade seen by apply_update (invalid before the first trade).
    LevelInfo last_trade() const noexcept { return last_trade_; }

    std::size_t bid_levels() const noexcept { return bids_.size(); }
    std::size_t ask_levels() const noexcept { return asks_.size(); }

private:
    using BidBook = std::map<Price, Quantity, std::greater<Price>>;
    using AskBook = std::map<Price, Quantity, std::less<Price>>;

    template <typename Book>
    static void set_level(Book& book, Price price, Quantity qty);

    template <typename Book>
    static Quantity remove_from(Book& book, Price price, Quantity qty);

    BidBook bids_;
    AskBook asks_;

    LevelInfo last_trade_;
};

} // namespace mmsim
