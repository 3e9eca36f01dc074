#pragma once

#include <array>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mmsim/config.hpp"
#include "mmsim/event.hpp"
#include "mmsim/liquidity_gate.hpp"
#include "mmsim/order_book.hpp"
#include "mmsim/position.hpp"
#include "mmsim/refill_policy.hpp"
#include "mmsim/session_clock.hpp"
#include "mmsim/session_result.hpp"
#include "mmsim/stop_loss.hpp"

namespace mmsim {

/// The pluggable parts of a market-making variant.
struct StrategyPolicies {
    std::unique_ptr<RefillPolicy>  refill;
    LiquidityGate                  gate{0.0};
    std::optional<StopLossMonitor> stop_loss;

    static StrategyPolicies for_variant(StrategyVariant variant, const SecurityConfig& cfg);
};

/**
 * Passive market maker for one security, driven one event at a time.
 *
 * Design
 *  - Owns the book, both quote sides, the accountant and the policies.
 *  - Per event: day rollover -> EOD flatten -> phase gate -> book update ->
 *    stop-loss -> quote refresh -> fill simulation.
 *  - Position, fills and PnL persist across days; the book, quotes, timers
 *    and pending flags are reset at every new trading date.
 *  - Nothing is reset between process() calls, so a stream can be fed in
 *    arbitrary batches.
 *
 * Never throws on market data.
 */
class MarketMakerSession
{
public:
    MarketMakerSession(std::string security, SecurityConfig cfg, StrategyPolicies policies,
                       SessionSchedule schedule = {});

    /// Session for `security` with its resolved config and the configured variant.
    static MarketMakerSession create(const std::string& security, const BacktestConfig& cfg);

    void on_event(const MarketEvent& ev);
    void process(const std::vector<MarketEvent>& batch);

    /// Snapshot; may be taken at any point of the stream.
    SessionResult result() const;

    const std::string&        security() const noexcept { return security_; }
    const SecurityConfig&     config() const noexcept { return cfg_; }
    const OrderBook&          book() const noexcept { return book_; }
    const PositionAccountant& account() const noexcept { return account_; }
    const QuoteSideState&     quote(BookSide side) const noexcept { return quotes_[index(side)]; }
    const StopLossMonitor*    stop_loss() const noexcept;

    bool pending_flatten() const noexcept { return pending_flatten_; }
    bool closed_for_day() const noexcept { return closed_at_eod_; }

private:
    static std::size_t index(BookSide side) noexcept { return side == BookSide::Bid ? 0 : 1; }

    void start_new_day();
    bool handle_end_of_day(const MarketEvent& ev);
    bool run_stop_loss(SessionPhase phase, Timestamp ts);
    void refresh_quotes(Timestamp ts);
    void refresh_side(BookSide side, Price price, Quantity candidate, Timestamp ts);
    void simulate_fills(const MarketEvent& ev);

    void book_fill(Side side, Price price, Quantity qty, Timestamp ts, FillReason reason);
    void flatten_at(Price price, Timestamp ts);
    void on_booked(Quantity before, const FillRecord& rec);
    void count(const MarketEvent& ev) noexcept;

    std::string      security_;
    SecurityConfig   cfg_;
    StrategyPolicies policies_;
    SessionSchedule  schedule_;

    OrderBook                     book_;
    PositionAccountant            account_;
    std::array<QuoteSideState, 2> quotes_{};

    std::optional<TradingDate> current_date_;
    bool pending_flatten_{false};
    bool closed_at_eod_{false};

    std::optional<Price>  last_price_;
    EventCounters         counters_;
    std::set<TradingDate> market_dates_;
    std::set<TradingDate> fill_dates_;
    std::size_t           dropped_flattens_{0};
};

} // namespace mmsim
