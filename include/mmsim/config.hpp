#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "mmsim/session_clock.hpp"
#include "mmsim/types.hpp"

namespace mmsim {

enum class StrategyVariant : std::uint8_t {
    Baseline,             // timed refill, gate on placement
    PriceFollow,          // price follows the touch, quantity cooldown after fills
    PriceFollowStopLoss,  // PriceFollow + stop-loss liquidation
    LiquidityMonitor      // PriceFollow + continuously re-sampled depth gate
};

std::string_view to_string(StrategyVariant v) noexcept;
std::optional<StrategyVariant> parse_strategy_variant(std::string_view name) noexcept;

/// Resolved market-making parameters of one security.
struct SecurityConfig {
    Quantity     quote_size_bid   = 50'000;
    Quantity     quote_size_ask   = 50'000;
    std::int64_t refill_interval  = seconds(60);   // ns
    Quantity     max_position     = 2'000'000;
    std::optional<double> max_notional;            // caps position via mid price
    double       min_liquidity_notional = 25'000.0;
    double       stop_loss_threshold_pct = 2.0;

    Quantity quote_size(BookSide side) const noexcept
    {
        return side == BookSide::Bid ? quote_size_bid : quote_size_ask;
    }
};

enum class Exchange : std::uint8_t {
    ADX,
    DFM
};

std::optional<Exchange> parse_exchange(std::string_view name) noexcept;

/// Parameters of the closing-auction strategy for one security.
struct ClosingAuctionConfig {
    int          vwap_window_min  = 15;     // accumulation before the closing auction
    double       spread_vwap_pct  = 0.5;
    double       order_notional   = 250'000.0;
    std::optional<Quantity> order_quantity; // overrides order_notional
    std::optional<Price>    tick_size;      // overrides the exchange tick table
    Exchange     exchange         = Exchange::ADX;
    double       auction_fill_pct = 10.0;   // share of the closing print we may take

    bool         stop_loss_enabled       = true;
    double       stop_loss_threshold_pct = 2.0;
    std::int64_t stop_loss_start         = hms(10, 10, 0);
    std::int64_t stop_loss_end           = hms(14, 44, 0);

    bool   trend_filter_sell_enabled           = true;
    double trend_filter_sell_threshold_bps_hr  = 10.0;
    bool   trend_filter_buy_enabled            = false;
    double trend_filter_buy_threshold_bps_hr   = 10.0;
};

/**
 * Whole backtest configuration, resolved once at load time.
 *
 * Lookups never fail: a security without its own entry gets the defaults.
 * Malformed documents throw std::runtime_error naming the offending key.
 */
class BacktestConfig
{
public:
    StrategyVariant      variant = StrategyVariant::Baseline;
    SessionSchedule      schedule;
    SecurityConfig       defaults;
    ClosingAuctionConfig closing_defaults;

    std::map<std::string, SecurityConfig>       securities;
    std::map<std::string, ClosingAuctionConfig> closing;

    const SecurityConfig& security(const std::string& name) const;
    const ClosingAuctionConfig& closing_auction(const std::string& name) const;

    static BacktestConfig from_json(const nlohmann::json& j);
    static BacktestConfig from_string(const std::string& text);
    static BacktestConfig load(const std::string& path);
};

} // namespace mmsim
