#include "mmsim/market_maker_session.hpp"

#include <utility>

#include "mmsim/fill_simulator.hpp"
#include "mmsim/quote_generator.hpp"

namespace mmsim {

StrategyPolicies StrategyPolicies::for_variant(StrategyVariant variant, const SecurityConfig& cfg)
{
    StrategyPolicies p;
    switch (variant)
    {
    case StrategyVariant::Baseline:
        p.refill = std::make_unique<TimedRefillPolicy>(cfg.refill_interval);
        p.gate   = LiquidityGate(cfg.min_liquidity_notional, LiquidityGate::Mode::OnPlacement);
        break;
    case StrategyVariant::PriceFollow:
        p.refill = std::make_unique<CooldownRefillPolicy>(cfg.refill_interval);
        p.gate   = LiquidityGate(cfg.min_liquidity_notional, LiquidityGate::Mode::OnPlacement);
        break;
    case StrategyVariant::PriceFollowStopLoss:
        p.refill = std::make_unique<CooldownRefillPolicy>(cfg.refill_interval);
        p.gate   = LiquidityGate(cfg.min_liquidity_notional, LiquidityGate::Mode::OnPlacement);
        p.stop_loss.emplace(cfg.stop_loss_threshold_pct);
        break;
    case StrategyVariant::LiquidityMonitor:
        p.refill = std::make_unique<CooldownRefillPolicy>(cfg.refill_interval);
        p.gate   = LiquidityGate(cfg.min_liquidity_notional, LiquidityGate::Mode::Continuous);
        break;
    }
    return p;
}

MarketMakerSession::MarketMakerSession(std::string security, SecurityConfig cfg,
                                       StrategyPolicies policies, SessionSchedule schedule)
    : security_(std::move(security)),
      cfg_(cfg),
      policies_(std::move(policies)),
      schedule_(schedule)
{
    if (!policies_.refill)
        policies_.refill = std::make_unique<TimedRefillPolicy>(cfg_.refill_interval);
}

MarketMakerSession MarketMakerSession::create(const std::string& security, const BacktestConfig& cfg)
{
    const SecurityConfig& sc = cfg.security(security);
    return MarketMakerSession(security, sc, StrategyPolicies::for_variant(cfg.variant, sc),
                              cfg.schedule);
}

const StopLossMonitor* MarketMakerSession::stop_loss() const noexcept
{
    return policies_.stop_loss ? &*policies_.stop_loss : nullptr;
}

void MarketMakerSession::process(const std::vector<MarketEvent>& batch)
{
    for (const auto& ev : batch)
        on_event(ev);
}

void MarketMakerSession::on_event(const MarketEvent& ev)
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

    if (ev.type == EventType::Trade)
        market_dates_.insert(date);

    if (handle_end_of_day(ev))
        return;

    const SessionPhase phase = schedule_.classify(ev.ts);
    if (!schedule_.allows_book_updates(phase))
    {
        ++counters_.gated;
        return;
    }

    book_.apply_update(ev);
    count(ev);
    if (ev.type == EventType::Trade)
        last_price_ = ev.price;

    if (!run_stop_loss(phase, ev.ts))
        return; // liquidation still pending, no quoting

    if (schedule_.allows_quoting(phase))
        refresh_quotes(ev.ts);

    if (ev.type == EventType::Trade && schedule_.allows_fills(phase))
        simulate_fills(ev);
}

void MarketMakerSession::start_new_day()
{
    if (pending_flatten_)
        ++dropped_flattens_;

    book_.clear();
    quotes_          = {};
    pending_flatten_ = false;
    closed_at_eod_   = false;
    if (policies_.stop_loss)
        policies_.stop_loss->cancel();
}

// Returns true when the event has been fully consumed by end-of-day handling.
bool MarketMakerSession::handle_end_of_day(const MarketEvent& ev)
{
    if (pending_flatten_)
    {
        // waiting for a trade price
        if (ev.type == EventType::Trade)
        {
            flatten_at(ev.price, ev.ts);
            pending_flatten_ = false;
        }
        return true;
    }

    if (closed_at_eod_ || !schedule_.is_eod_cutoff(ev.ts))
        return false;

    closed_at_eod_ = true;
    for (auto& q : quotes_)
    {
        q.displayed = false;
        q.remaining = 0;
    }
    if (policies_.stop_loss)
        policies_.stop_loss->cancel();

    if (account_.flat())
        return false;

    if (ev.type == EventType::Trade)
        flatten_at(ev.price, ev.ts);
    else
        pending_flatten_ = true;
    return true;
}

// false while a liquidation is pending.
bool MarketMakerSession::run_stop_loss(SessionPhase phase, Timestamp ts)
{
    if (!policies_.stop_loss)
        return true;

    StopLossMonitor& sl = *policies_.stop_loss;
    if (account_.flat())
        sl.cancel();

    if (!schedule_.allows_fills(phase))
        return !sl.is_pending();

    const LevelInfo bb = book_.best_bid();
    const LevelInfo ba = book_.best_ask();

    if (bb.valid && ba.valid)
    {
        const Price mid = (bb.price + ba.price) / 2.0;
        if (sl.should_trigger(account_.position(), mid))
            sl.trigger(account_.position(), ts);
    }

    if (!sl.is_pending())
        return true;

    if (const auto slice = sl.next_slice(bb, ba, account_.position()))
    {
        const BookSide hit = slice->side == Side::Sell ? BookSide::Bid : BookSide::Ask;
        book_.remove(hit, slice->price, slice->qty);
        book_fill(slice->side, slice->price, slice->qty, ts, FillReason::StopLoss);
        sl.on_liquidated(slice->qty);
    }
    return !sl.is_pending();
}

void MarketMakerSession::refresh_quotes(Timestamp ts)
{
    const LevelInfo bb = book_.best_bid();
    const LevelInfo ba = book_.best_ask();

    const auto quotes = QuoteGenerator::generate(bb, ba, account_.position(), cfg_);
    if (!quotes)
        return;

    if (quotes->bid.valid)
        refresh_side(BookSide::Bid, quotes->bid.price, quotes->bid.size, ts);
    if (quotes->ask.valid)
        refresh_side(BookSide::Ask, quotes->ask.price, quotes->ask.size, ts);
}

void MarketMakerSession::refresh_side(BookSide side, Price price, Quantity candidate, Timestamp ts)
{
    QuoteSideState&     q      = quotes_[index(side)];
    const RefillPolicy& refill = *policies_.refill;
    const LiquidityGate& gate  = policies_.gate;

    if (!refill.may_requote(q, ts))
        return;

    const Quantity     size     = refill.offer_size(q, candidate, ts);
    const GateDecision decision = gate.check(book_, side, price, size);

    if (!decision.active)
    {
        // Suppressed: nothing displayed, but the price is remembered.
        q.price     = price;
        q.displayed = false;
        q.remaining = 0;
        q.ahead_qty = gate.resamples_ahead() ? 0 : decision.ahead_qty;
        return;
    }

    const bool same_price = q.price && *q.price == price;
    if (refill.keeps_queue_on_same_price() && same_price)
    {
        q.remaining = size;
        if (gate.resamples_ahead())
            q.ahead_qty = decision.ahead_qty;
    }
    else
    {
        q.price     = price;
        q.ahead_qty = decision.ahead_qty;
        q.remaining = size;
    }
    q.displayed = true;
    refill.on_placed(q, ts);
}

void MarketMakerSession::simulate_fills(const MarketEvent& ev)
{
    const TradeOutcome out = FillSimulator::on_trade(quotes_[index(BookSide::Bid)],
                                                     quotes_[index(BookSide::Ask)],
                                                     ev.price, ev.qty, book_);

    if (out.ask.own_filled > 0)
        book_fill(Side::Sell, ev.price, out.ask.own_filled, ev.ts, FillReason::Quote);
    if (out.bid.own_filled > 0)
        book_fill(Side::Buy, ev.price, out.bid.own_filled, ev.ts, FillReason::Quote);
}

void MarketMakerSession::book_fill(Side side, Price price, Quantity qty, Timestamp ts,
                                   FillReason reason)
{
    const Quantity before = account_.position();
    if (const auto rec = account_.apply_fill(side, price, qty, ts, reason))
        on_booked(before, *rec);
}

void MarketMakerSession::flatten_at(Price price, Timestamp ts)
{
    const Quantity before = account_.position();
    if (const auto rec = account_.flatten(price, ts, FillReason::EodFlatten))
        on_booked(before, *rec);
}

void MarketMakerSession::on_booked(Quantity before, const FillRecord& rec)
{
    policies_.refill->on_fill(quotes_[index(quote_side_of(rec.side))], rec.ts);
    if (policies_.stop_loss)
        policies_.stop_loss->on_position_change(before, rec.position, rec.price);
    fill_dates_.insert(trading_date(rec.ts));
}

void MarketMakerSession::count(const MarketEvent& ev) noexcept
{
    switch (ev.type)
    {
    case EventType::Bid:   ++counters_.bid_updates; break;
    case EventType::Ask:   ++counters_.ask_updates; break;
    case EventType::Trade: ++counters_.trades;      break;
    default:               ++counters_.ignored;     break;
    }
}

SessionResult MarketMakerSession::result() const
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
    r.stop_loss_triggers = policies_.stop_loss ? policies_.stop_loss->trigger_count() : 0;
    r.dropped_flattens   = dropped_flattens_;
    r.unresolved_flatten = pending_flatten_;
    return r;
}

} // namespace mmsim
