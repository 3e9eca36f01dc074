#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "mmsim/config.hpp"
#include "mmsim/event.hpp"
#include "mmsim/order_book.hpp"
#include "mmsim/position.hpp"
#include "mmsim/session_clock.hpp"
#include "mmsim/session_result.hpp"
#include "mmsim/stop_loss.hpp"

namespace mmsim {

/// Limit order resting in the closing auction.
struct AuctionOrder {
    Side      side{Side::Buy};
    Price     price{0.0};
    Quantity  qty{0};
    Price     vwap{0.0};        // reference the price was derived from
    Timestamp placed_at{0};
};

/// Carried order that unwinds an auction entry on a later day.
struct ExitOrder {
    Side        side{Side::Sell};
    Price       price{0.0};      // entry VWAP, on the tick grid
    Quantity    qty{0};
    Quantity    remaining{0};
    Price       entry_price{0.0};
    Timestamp   entry_ts{0};
    TradingDate entry_date{0};
};

struct ClosingAuctionSummary {
    std::size_t buy_entries   = 0;
    std::size_t sell_entries  = 0;
    std::size_t vwap_exits    = 0;
    std::size_t stop_losses   = 0;
    std::size_t eod_flattens  = 0;
    std::size_t filtered_buy  = 0;
    std::size_t filtered_sell = 0;
};

/**
 * Closing-auction strategy for one security.
 *
 * Per day:
 *   VWAP window -> orders around VWAP at the auction start -> closing print
 *   fills crossed orders -> exit order at the entry VWAP, live from the next
 *   trading date during regular hours.
 *
 * An exit still open at a later closing print is flattened at that print.
 * Regular hours are [silent_start, closing_auction_start); the closing print
 * is the first trade at or after eod_cutoff.
 */
class ClosingAuctionSession
{
public:
    ClosingAuctionSession(std::string security, ClosingAuctionConfig cfg,
                          SessionSchedule schedule = {});

    static ClosingAuctionSession create(const std::string& security, const BacktestConfig& cfg);

    void on_event(const MarketEvent& ev);
    void process(const std::vector<MarketEvent>& batch);

    SessionResult result() const;

    const ClosingAuctionSummary& summary() const noexcept { return summary_; }
    const ClosingAuctionConfig&  config() const noexcept { return cfg_; }
    const PositionAccountant&    account() const noexcept { return account_; }
    const StopLossMonitor&       stop_loss() const noexcept { return stop_loss_; }

    /// VWAP of the current day's window, nullopt before any volume.
    std::optional<Price> vwap() const noexcept;

    const std::optional<AuctionOrder>& buy_order() const noexcept { return buy_order_; }
    const std::optional<AuctionOrder>& sell_order() const noexcept { return sell_order_; }
    const std::optional<ExitOrder>&    exit_order() const noexcept { return exit_order_; }

    /// Linear-regression slope of today's regular-hours trades, in bps of
    /// the mean price per hour. 0 with fewer than 10 points.
    double trend_slope_bps_per_hour() const noexcept;

    Price tick_size(Price price) const noexcept;

    /// Exchange tick table.
    static Price tick_size_for(Exchange exchange, Price price) noexcept;
    static Price round_to_tick(Price price, Price tick) noexcept;

private:
    void start_new_day();
    bool in_regular_hours(std::int64_t tod) const noexcept;
    bool in_vwap_window(std::int64_t tod) const noexcept;

    void place_orders(Timestamp ts);
    void process_closing_print(const MarketEvent& ev, TradingDate date);
    void process_exit(const MarketEvent& ev, TradingDate date);
    void run_stop_loss(Timestamp ts);

    void book_fill(Side side, Price price, Quantity qty, Timestamp ts, FillReason reason);
    /// false when already flat.
    bool flatten_at(Price price, Timestamp ts);
    void on_booked(Quantity before, const FillRecord& rec);

    std::string          security_;
    ClosingAuctionConfig cfg_;
    SessionSchedule      schedule_;

    OrderBook          book_;
    PositionAccountant account_;
    StopLossMonitor    stop_loss_;

    std::optional<TradingDate> current_date_;

    double   vwap_notional_{0.0};
    Quantity vwap_volume_{0};
    std::vector<std::pair<double, Price>> trend_points_;   // (hours since open, price)

    bool orders_placed_{false};
    bool closing_processed_{false};

    std::optional<AuctionOrder> buy_order_;
    std::optional<AuctionOrder> sell_order_;
    std::optional<ExitOrder>    exit_order_;

    ClosingAuctionSummary summary_;

    std::optional<Price>  last_price_;
    EventCounters         counters_;
    std::set<TradingDate> market_dates_;
    std::set<TradingDate> fill_dates_;
};

} // namespace mmsim
