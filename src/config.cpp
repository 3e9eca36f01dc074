#include "mmsim/config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

namespace {

using mmsim::Quantity;

[[noreturn]] void fail(const std::string& ctx, const std::string& key, const std::string& what)
{
    throw std::runtime_error("config: '" + ctx + "." + key + "' " + what);
}

double read_number(const json& j, const std::string& ctx, const char* key, double fallback)
{
    if (!j.contains(key))
        return fallback;
    const auto& v = j.at(key);
    if (!v.is_number())
        fail(ctx, key, "must be a number");
    const double d = v.get<double>();
    if (!std::isfinite(d))
        fail(ctx, key, "must be finite");
    return d;
}

double read_non_negative(const json& j, const std::string& ctx, const char* key, double fallback)
{
    const double d = read_number(j, ctx, key, fallback);
    if (d < 0.0)
        fail(ctx, key, "must be >= 0");
    return d;
}

double read_positive(const json& j, const std::string& ctx, const char* key, double fallback)
{
    const double d = read_number(j, ctx, key, fallback);
    if (d <= 0.0)
        fail(ctx, key, "must be > 0");
    return d;
}

Quantity read_quantity(const json& j, const std::string& ctx, const char* key, Quantity fallback)
{
    return static_cast<Quantity>(
        std::llround(read_non_negative(j, ctx, key, static_cast<double>(fallback))));
}

bool read_bool(const json& j, const std::string& ctx, const char* key, bool fallback)
{
    if (!j.contains(key))
        return fallback;
    const auto& v = j.at(key);
    if (!v.is_boolean())
        fail(ctx, key, "must be true or false");
    return v.get<bool>();
}

std::int64_t read_clock(const json& j, const std::string& ctx, const char* key, std::int64_t fallback)
{
    if (!j.contains(key))
        return fallback;
    const auto& v = j.at(key);
    if (!v.is_string())
        fail(ctx, key, "must be a \"HH:MM[:SS]\" string");
    auto t = mmsim::parse_time_of_day(v.get<std::string>());
    if (!t)
        fail(ctx, key, "is not a valid time of day: " + v.get<std::string>());
    return *t;
}

void require_object(const json& j, const std::string& ctx)
{
    if (!j.is_object())
        throw std::runtime_error("config: '" + ctx + "' must be an object");
}

bool is_one_of(const std::string& key, std::initializer_list<const char*> names)
{
    for (const char* n : names)
        if (key == n)
            return true;
    return false;
}

mmsim::Exchange read_exchange(const json& v, const std::string& ctx, const std::string& key)
{
    auto exchange = v.is_string() ? mmsim::parse_exchange(v.get<std::string>()) : std::nullopt;
    if (!exchange)
        fail(ctx, key, "must be \"ADX\" or \"DFM\"");
    return *exchange;
}

mmsim::SecurityConfig parse_security(const json& j, const mmsim::SecurityConfig& base,
                                     const std::string& ctx)
{
    require_object(j, ctx);

    mmsim::SecurityConfig cfg = base;

    // quote_size задаёт обе стороны, quote_size_bid/ask переопределяют их.
    if (j.contains("quote_size"))
    {
        const Quantity size = read_quantity(j, ctx, "quote_size", 0);
        cfg.quote_size_bid = size;
        cfg.quote_size_ask = size;
    }
    cfg.quote_size_bid = read_quantity(j, ctx, "quote_size_bid", cfg.quote_size_bid);
    cfg.quote_size_ask = read_quantity(j, ctx, "quote_size_ask", cfg.quote_size_ask);

    const double refill_sec = read_non_negative(
        j, ctx, "refill_interval_sec",
        static_cast<double>(cfg.refill_interval) / static_cast<double>(mmsim::kNanosPerSecond));
    cfg.refill_interval = static_cast<std::int64_t>(
        std::llround(refill_sec * static_cast<double>(mmsim::kNanosPerSecond)));

    cfg.max_position = read_quantity(j, ctx, "max_position", cfg.max_position);

    if (j.contains("max_notional") && !j.at("max_notional").is_null())
        cfg.max_notional = read_positive(j, ctx, "max_notional", 0.0);

    cfg.min_liquidity_notional = read_non_negative(
        j, ctx, "min_local_currency_before_quote", cfg.min_liquidity_notional);
    cfg.stop_loss_threshold_pct = read_positive(
        j, ctx, "stop_loss_threshold_pct", cfg.stop_loss_threshold_pct);

    return cfg;
}

mmsim::ClosingAuctionConfig parse_closing(const json& j, const mmsim::ClosingAuctionConfig& base,
                                          const std::string& ctx)
{
    require_object(j, ctx);

    for (const auto& item : j.items())
    {
        if (!is_one_of(item.key(), {"vwap_preclose_period_min", "spread_vwap_pct",
                                    "order_notional", "order_quantity", "tick_size", "exchange",
                                    "stop_loss_enabled", "stop_loss_threshold_pct",
                                    "stop_loss_start", "stop_loss_end",
                                    "trend_filter_sell_enabled",
                                    "trend_filter_sell_threshold_bps_hr",
                                    "trend_filter_buy_enabled",
                                    "trend_filter_buy_threshold_bps_hr"}))
            fail(ctx, item.key(), "is not a closing-auction setting");
    }

    mmsim::ClosingAuctionConfig cfg = base;

    const double window = read_positive(j, ctx, "vwap_preclose_period_min", cfg.vwap_window_min);
    cfg.vwap_window_min = static_cast<int>(std::lround(window));
    cfg.spread_vwap_pct = read_non_negative(j, ctx, "spread_vwap_pct", cfg.spread_vwap_pct);
    cfg.order_notional  = read_positive(j, ctx, "order_notional", cfg.order_notional);

    if (j.contains("order_quantity") && !j.at("order_quantity").is_null())
        cfg.order_quantity = read_quantity(j, ctx, "order_quantity", 0);
    if (j.contains("tick_size") && !j.at("tick_size").is_null())
        cfg.tick_size = read_positive(j, ctx, "tick_size", 0.0);
    if (j.contains("exchange"))
        cfg.exchange = read_exchange(j.at("exchange"), ctx, "exchange");

    cfg.stop_loss_enabled       = read_bool(j, ctx, "stop_loss_enabled", cfg.stop_loss_enabled);
    cfg.stop_loss_threshold_pct = read_positive(j, ctx, "stop_loss_threshold_pct",
                                                cfg.stop_loss_threshold_pct);
    cfg.stop_loss_start = read_clock(j, ctx, "stop_loss_start", cfg.stop_loss_start);
    cfg.stop_loss_end   = read_clock(j, ctx, "stop_loss_end", cfg.stop_loss_end);

    cfg.trend_filter_sell_enabled = read_bool(j, ctx, "trend_filter_sell_enabled",
                                              cfg.trend_filter_sell_enabled);
    cfg.trend_filter_sell_threshold_bps_hr = read_non_negative(
        j, ctx, "trend_filter_sell_threshold_bps_hr", cfg.trend_filter_sell_threshold_bps_hr);
    cfg.trend_filter_buy_enabled = read_bool(j, ctx, "trend_filter_buy_enabled",
                                             cfg.trend_filter_buy_enabled);
    cfg.trend_filter_buy_threshold_bps_hr = read_non_negative(
        j, ctx, "trend_filter_buy_threshold_bps_hr", cfg.trend_filter_buy_threshold_bps_hr);

    return cfg;
}

mmsim::SessionSchedule parse_schedule(const json& j)
{
    const std::string ctx = "schedule";
    require_object(j, ctx);

    mmsim::SessionSchedule s;
    s.opening_auction_start = read_clock(j, ctx, "opening_auction_start", s.opening_auction_start);
    s.silent_start          = read_clock(j, ctx, "silent_start", s.silent_start);
    s.continuous_start      = read_clock(j, ctx, "continuous_start", s.continuous_start);
    s.closing_auction_start = read_clock(j, ctx, "closing_auction_start", s.closing_auction_start);
    s.eod_cutoff            = read_clock(j, ctx, "eod_cutoff", s.eod_cutoff);
    s.close_end             = read_clock(j, ctx, "close_end", s.close_end);
    s.strict_window         = read_bool(j, ctx, "strict_window", s.strict_window);
    s.validate();
    return s;
}

} // namespace

namespace mmsim {

std::string_view to_string(StrategyVariant v) noexcept
{
    switch (v)
    {
    case StrategyVariant::Baseline:            return "baseline";
    case StrategyVariant::PriceFollow:         return "price_follow";
    case StrategyVariant::PriceFollowStopLoss: return "price_follow_stop_loss";
    case StrategyVariant::LiquidityMonitor:    return "liquidity_monitor";
    }
    return "unknown";
}

std::optional<StrategyVariant> parse_strategy_variant(std::string_view name) noexcept
{
    if (name == "baseline" || name == "v1_baseline")
        return StrategyVariant::Baseline;
    if (name == "price_follow" || name == "v2_price_follow_qty_cooldown")
        return StrategyVariant::PriceFollow;
    if (name == "price_follow_stop_loss" || name == "v2_1_stop_loss")
        return StrategyVariant::PriceFollowStopLoss;
    if (name == "liquidity_monitor" || name == "v3_liquidity_monitor")
        return StrategyVariant::LiquidityMonitor;
    return std::nullopt;
}

std::optional<Exchange> parse_exchange(std::string_view name) noexcept
{
    if (name == "ADX")
        return Exchange::ADX;
    if (name == "DFM")
        return Exchange::DFM;
    return std::nullopt;
}

const SecurityConfig& BacktestConfig::security(const std::string& name) const
{
    auto it = securities.find(name);
    return it == securities.end() ? defaults : it->second;
}

const ClosingAuctionConfig& BacktestConfig::closing_auction(const std::string& name) const
{
    auto it = closing.find(name);
    return it == closing.end() ? closing_defaults : it->second;
}

BacktestConfig BacktestConfig::from_json(const json& j)
{
    require_object(j, "<root>");

    BacktestConfig cfg;

    if (j.contains("strategy"))
    {
        const auto& v = j.at("strategy");
        if (!v.is_string())
            throw std::runtime_error("config: 'strategy' must be a string");
        auto variant = parse_strategy_variant(v.get<std::string>());
        if (!variant)
            throw std::runtime_error("config: unknown strategy '" + v.get<std::string>() + "'");
        cfg.variant = *variant;
    }

    if (j.contains("schedule"))
        cfg.schedule = parse_schedule(j.at("schedule"));

    if (j.contains("defaults"))
        cfg.defaults = parse_security(j.at("defaults"), SecurityConfig{}, "defaults");

    if (j.contains("securities"))
    {
        const auto& secs = j.at("securities");
        require_object(secs, "securities");
        for (const auto& item : secs.items())
            cfg.securities[item.key()] =
                parse_security(item.value(), cfg.defaults, "securities." + item.key());
    }

    if (j.contains("closing_auction"))
    {
        const auto& ca = j.at("closing_auction");
        require_object(ca, "closing_auction");

        ClosingAuctionConfig base;
        base.auction_fill_pct = read_positive(ca, "closing_auction", "auction_fill_pct",
                                              base.auction_fill_pct);
        if (base.auction_fill_pct > 100.0)
            fail("closing_auction", "auction_fill_pct", "must be <= 100");

        if (ca.contains("defaults"))
            base = parse_closing(ca.at("defaults"), base, "closing_auction.defaults");
        cfg.closing_defaults = base;

        // Security entries sit either directly under "closing_auction" or
        // inside its "securities" object.
        auto add_security = [&](const std::string& name, const json& value, const std::string& ctx) {
            if (cfg.closing.count(name))
                throw std::runtime_error("config: '" + ctx + "' configures " + name + " twice");
            cfg.closing[name] = parse_closing(value, base, ctx);
        };

        for (const auto& item : ca.items())
        {
            const std::string& key = item.key();
            if (is_one_of(key, {"auction_fill_pct", "defaults", "exchanges"}))
                continue;
            if (key == "securities")
            {
                require_object(item.value(), "closing_auction.securities");
                for (const auto& sec : item.value().items())
                    add_security(sec.key(), sec.value(), "closing_auction.securities." + sec.key());
                continue;
            }
            add_security(key, item.value(), "closing_auction." + key);
        }

        if (ca.contains("exchanges"))
        {
            const auto& ex = ca.at("exchanges");
            require_object(ex, "closing_auction.exchanges");
            for (const auto& item : ex.items())
            {
                const std::string& name     = item.key();
                const Exchange     exchange = read_exchange(item.value(), "closing_auction.exchanges", name);

                auto it = cfg.closing.find(name);
                if (it == cfg.closing.end())
                    it = cfg.closing.emplace(name, base).first;
                it->second.exchange = exchange;
            }
        }
    }

    return cfg;
}

BacktestConfig BacktestConfig::from_string(const std::string& text)
{
    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error(std::string("config: parse error: ") + e.what());
    }
    return from_json(j);
}

BacktestConfig BacktestConfig::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("config: failed to open " + path);

    std::stringstream ss;
    ss << in.rdbuf();
    return from_string(ss.str());
}

} // namespace mmsim
