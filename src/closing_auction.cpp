#include "mmsim/closing_auction.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace mmsim {

namespace {

constexpr std::size_t kMinTrendPoints = 10;
constexpr double      kNanosPerHour   = 3600.0 * static_cast<double>(kNanosPerSecond);

} // namespace

ClosingAuctionSession::ClosingAuctionSession(std::string security, ClosingAuctionConfig cfg,
                                             SessionSchedule schedule)
    : security_(std::move(security)),
      cfg_(cfg),
      schedule_(schedule),
      stop_loss_(cfg.stop_loss_threshold_pct)
{
    trend_points_.reserve(1024);
}

ClosingAuctionSession ClosingAuctionSession::create(const std::string& security,
                                                    const BacktestConfig& cfg)
{
    return ClosingAuctionSession(security, cfg.closing_auction(security), cfg.schedule);
}

Price ClosingAuctionSession::tick_size_for(Exchange exchange, Price price) noexcept
{
    if (exchange == Exchange::DFM)
    {
        if (price < 1.0)  return 0.001;
        if (price < 10.0) return 0.01;
        return 0.05;
    }
    // ADX
    if (price < 1.0)   return 0.001;
    if (price < 10.0)  return 0.01;
    if (price < 50.0)  return 0.02;
    if (price < 100.0) return 0.05;
    return 0.1;
}

Price ClosingAuctionSession::round_to_tick(Price price, Price tick) noexcept
{
    if (!(tick > 0.0))
        return price;
    return std::round(price / tick) * tick;
}

Price ClosingAuctionSession::tick_size(Price price) const noexcept
{
    return cfg_.tick_size ? *cfg_.tick_size : tick_size_for(cfg_.exchange, price);
}

std::optional<Price> ClosingAuctionSession::vwap() const noexcept
{
    if (vwap_volume_ <= 0)
        return std::nullopt;
    return vwap_notional_ / static_cast<double>(vwap_volume_);
}

double ClosingAuctionSession::trend_slope_bps_per_hour() const noexcept
{
    const std::size_t n = trend_points_.size();
    if (n < kMinTrendPoints)
        return 0.0;

    double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0;
    for (const auto& p : trend_points_)
    {
        sum_x  += p.first;
        sum_y  += p.second;
        sum_xy += p.first * p.second;
        sum_x2 += p.first * p.first;
    }

    const double dn          = static_cast<double>(n);
    const double denominator = dn * sum_x2 - sum_x * sum_x;
    if (denominator == 0.0)
        return 0.0;

    const double slope      = (dn * sum_xy - sum_x * sum_y) / denominator;
    const double mean_price = sum_y / dn;
    if (mean_price == 0.0)
        return 0.0;
    return slope / mean_price * 10'000.0;
}

bool ClosingAuctionSession::in_regular_hours(std::int64_t tod) const noexcept
{
    return tod >= schedule_.silent_start && tod < schedule_.closing_auction_start;
}

bool ClosingAuctionSession::in_vwap_window(std::int64_t tod) const noexcept
{
    const std::int64_t start = schedule_.closing_auction_start
                             - static_cast<std::int64_t>(cfg_.vwap_window_min) * 60 * kNanosPerSecond;
    return tod >= start && tod < schedule_.closing_auction_start;
}

void ClosingAuctionSession::process(const std::vector<MarketEvent>& batch)
{
    for (const auto& ev : batch)
        on_event(ev);
}

void ClosingAuctionSession::on_event(const MarketEvent& ev)
{
    if (ev.type == EventType::Unknown || !(ev.price > 0.0))
    {
        ++counters_.ignored;
        return;
    }

    const TradingDate date = trading_date(ev.ts);
    if (current_date_ && *current_date_ != date)
        start_new_day();
    current_date_ = date;

    const std::int64_t tod      = time_of_day(ev.ts);
    const bool         is_trade = ev.type == EventType::Trade;

    book_.apply_update(ev);
    switch (ev.type)
    {
    case EventType::Bid:   ++counters_.bid_updates; break;
    case EventType::Ask:   ++counters_.ask_updates; break;
    default:               ++counters_.trades;      break;
    }

    if (is_trade)
    {
        market_dates_.insert(date);
        last_price_ = ev.price;

        if (in_regular_hours(tod))
        {
            const double hours = static_cast<double>(tod - schedule_.silent_start) / kNanosPerHour;
            trend_points_.emplace_back(hours, ev.price);

            if (exit_order_)
                process_exit(ev, date);
        }
    }

    if (cfg_.stop_loss_enabled && tod >= cfg_.stop_loss_start && tod < cfg_.stop_loss_end)
        run_stop_loss(ev.ts);

    if (is_trade && !orders_placed_ && in_vwap_window(tod) && ev.qty > 0)
    {
        vwap_notional_ += ev.price * static_cast<double>(ev.qty);
        vwap_volume_   += ev.qty;
    }

    if (!orders_placed_ && tod >= schedule_.closing_auction_start)
        place_orders(ev.ts);

    if (is_trade && !closing_processed_ && tod >= schedule_.eod_cutoff)
        process_closing_print(ev, date);
}

void ClosingAuctionSession::start_new_day()
{
    book_.clear();
    vwap_notional_ = 0.0;
    vwap_volume_   = 0;
    trend_points_.clear();

    orders_placed_     = false;
    closing_processed_ = false;
    buy_order_.reset();
    sell_order_.reset();
    stop_loss_.cancel();
}

void ClosingAuctionSession::place_orders(Timestamp ts)
{
    const auto ref = vwap();
    if (!ref)
        return; // retried on the next event

    const double spread = cfg_.spread_vwap_pct / 100.0;
    const Quantity qty  = cfg_.order_quantity ? *cfg_.order_quantity
                                              : static_cast<Quantity>(std::llround(cfg_.order_notional / *ref));

    const Price buy_raw  = *ref * (1.0 - spread);
    const Price sell_raw = *ref * (1.0 + spread);

    const double slope      = trend_slope_bps_per_hour();
    const bool   skip_sell  = cfg_.trend_filter_sell_enabled
                           && slope > cfg_.trend_filter_sell_threshold_bps_hr;
    const bool   skip_buy   = cfg_.trend_filter_buy_enabled
                           && slope < -cfg_.trend_filter_buy_threshold_bps_hr;

    if (qty > 0)
    {
        if (skip_buy)
        {
            ++summary_.filtered_buy;
        }
        else
        {
            buy_order_ = AuctionOrder{Side::Buy, round_to_tick(buy_raw, tick_size(buy_raw)),
                                      qty, *ref, ts};
        }

        if (skip_sell)
        {
            ++summary_.filtered_sell;
        }
        else
        {
            sell_order_ = AuctionOrder{Side::Sell, round_to_tick(sell_raw, tick_size(sell_raw)),
                                       qty, *ref, ts};
        }
    }
    orders_placed_ = true;
}

void ClosingAuctionSession::process_closing_print(const MarketEvent& ev, TradingDate date)
{
    closing_processed_ = true;

    // Anything still open from an earlier day goes at this print.
    if (flatten_at(ev.price, ev.ts))
        ++summary_.eod_flattens;
    exit_order_.reset();
    stop_loss_.cancel();

    const auto cap = static_cast<Quantity>(
        std::floor(static_cast<double>(ev.qty) * cfg_.auction_fill_pct / 100.0));

    std::optional<Price> entry_vwap;
    for (auto* order : {&buy_order_, &sell_order_})
    {
        if (!*order)
            continue;
        const AuctionOrder& o = **order;
        const bool crossed = o.side == Side::Buy ? ev.price <= o.price : ev.price >= o.price;
        if (!crossed)
            continue;

        const Quantity fill = std::min(o.qty, cap);
        if (fill <= 0)
            continue;

        book_fill(o.side, ev.price, fill, ev.ts, FillReason::AuctionEntry);
        if (o.side == Side::Buy)
            ++summary_.buy_entries;
        else
            ++summary_.sell_entries;
        entry_vwap = o.vwap;
    }
    buy_order_.reset();
    sell_order_.reset();

    if (account_.flat() || !entry_vwap)
        return;

    const Quantity pos = account_.position();
    ExitOrder x;
    x.side        = pos > 0 ? Side::Sell : Side::Buy;
    x.price       = round_to_tick(*entry_vwap, tick_size(*entry_vwap));
    x.qty         = pos > 0 ? pos : -pos;
    x.remaining   = x.qty;
    x.entry_price = ev.price;
    x.entry_ts    = ev.ts;
    x.entry_date  = date;
    exit_order_   = x;
}

void ClosingAuctionSession::process_exit(const MarketEvent& ev, TradingDate date)
{
    ExitOrder& x = *exit_order_;
    if (date <= x.entry_date || x.remaining <= 0)
        return;

    const bool crossed = x.side == Side::Sell ? ev.price >= x.price : ev.price <= x.price;
    if (!crossed)
        return;

    const Quantity fill = std::min(x.remaining, ev.qty);
    if (fill <= 0)
        return;

    book_fill(x.side, ev.price, fill, ev.ts, FillReason::VwapExit);
    ++summary_.vwap_exits;

    x.remaining -= fill;
    if (x.remaining <= 0)
        exit_order_.reset();
}

void ClosingAuctionSession::run_stop_loss(Timestamp ts)
{
    if (account_.flat())
    {
        stop_loss_.cancel();
        return;
    }

    const LevelInfo bb = book_.best_bid();
    const LevelInfo ba = book_.best_ask();

    if (bb.valid && ba.valid)
    {
        const Price mid = (bb.price + ba.price) / 2.0;
        if (stop_loss_.should_trigger(account_.position(), mid)
            && stop_loss_.trigger(account_.position(), ts))
        {
            exit_order_.reset();
            ++summary_.stop_losses;
        }
    }

    if (const auto slice = stop_loss_.next_slice(bb, ba, account_.position()))
    {
        book_.remove(slice->side == Side::Sell ? BookSide::Bid : BookSide::Ask,
                     slice->price, slice->qty);
        book_fill(slice->side, slice->price, slice->qty, ts, FillReason::StopLoss);
        stop_loss_.on_liquidated(slice->qty);
    }
}

void ClosingAuctionSession::book_fill(Side side, Price price, Quantity qty, Timestamp ts,
                                      FillReason reason)
{
    const Quantity before = account_.position();
    if (const auto rec = account_.apply_fill(side, price, qty, ts, reason))
        on_booked(before, *rec);
}

bool ClosingAuctionSession::flatten_at(Price price, Timestamp ts)
{
    const Quantity before = account_.position();
    const auto     rec    = account_.flatten(price, ts, FillReason::EodFlatten);
    if (!rec)
        return false;
    on_booked(before, *rec);
    return true;
}

void ClosingAuctionSession::on_booked(Quantity before, const FillRecord& rec)
{
    stop_loss_.on_position_change(before, rec.position, rec.price);
    fill_dates_.insert(trading_date(rec.ts));
}

SessionResult ClosingAuctionSession::result() const
{
    SessionResult r;
    r.security     = security_;
    r.position     = account_.position();
    r.realized_pnl = account_.realized_pnl();
    r.total_pnl    = r.realized_pnl;
    r.last_price   = last_price_;
    if (last_price_)
        r.total_pnl += account_.unrealized_pnl(*last_price_);

    r.fills              = account_.fills();
    r.counters           = counters_;
    r.market_dates       = market_dates_;
    r.fill_dates         = fill_dates_;
    r.stop_loss_triggers = stop_loss_.trigger_count();
    r.unresolved_flatten = exit_order_.has_value() && exit_order_->remaining > 0
                        && current_date_ && *current_date_ > exit_order_->entry_date;
    return r;
}

} // namespace mmsim
