#include <gtest/gtest.h>

#include "mmsim/closing_auction.hpp"
#include "mmsim/session_clock.hpp"

using namespace mmsim;

namespace {

Timestamp at(int h, int m, int s, unsigned day = 6) {
    return make_timestamp(2025, 5, day, h, m, s);
}

MarketEvent make(Timestamp ts, EventType type, Price price, Quantity qty) {
    MarketEvent e;
    e.ts    = ts;
    e.type  = type;
    e.price = price;
    e.qty   = qty;
    return e;
}

MarketEvent bid(Timestamp ts, Price p, Quantity q)   { return make(ts, EventType::Bid, p, q); }
MarketEvent ask(Timestamp ts, Price p, Quantity q)   { return make(ts, EventType::Ask, p, q); }
MarketEvent trade(Timestamp ts, Price p, Quantity q) { return make(ts, EventType::Trade, p, q); }

// VWAP 10.00 -> buy 9.95 / sell 10.05 x 25000, print at 9.90 fills 10% of 100000.
void run_entry_day(ClosingAuctionSession& s) {
    s.on_event(trade(at(14, 35, 0), 10.00, 1000));
    s.on_event(trade(at(14, 40, 0), 10.00, 1000));
    s.on_event(bid(at(14, 45, 0), 9.90, 100));
    s.on_event(trade(at(14, 55, 0), 9.90, 100'000));
}

} // namespace

TEST(ClosingAuction, TickTables) {
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::ADX, 0.5), 0.001);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::ADX, 5.0), 0.01);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::ADX, 20.0), 0.02);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::ADX, 60.0), 0.05);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::ADX, 150.0), 0.1);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::DFM, 20.0), 0.05);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::tick_size_for(Exchange::DFM, 5.0), 0.01);

    EXPECT_NEAR(ClosingAuctionSession::round_to_tick(10.037, 0.02), 10.04, 1e-9);
    EXPECT_NEAR(ClosingAuctionSession::round_to_tick(10.037, 0.01), 10.04, 1e-9);
    EXPECT_DOUBLE_EQ(ClosingAuctionSession::round_to_tick(10.037, 0.0), 10.037);
}

TEST(ClosingAuction, OrdersArePlacedAroundVwap) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});

    s.on_event(trade(at(14, 35, 0), 10.00, 1000));
    s.on_event(trade(at(14, 40, 0), 10.20, 1000));
    ASSERT_TRUE(s.vwap().has_value());
    EXPECT_NEAR(*s.vwap(), 10.10, 1e-9);

    s.on_event(bid(at(14, 45, 0), 10.00, 100));

    ASSERT_TRUE(s.buy_order().has_value());
    ASSERT_TRUE(s.sell_order().has_value());
    EXPECT_NEAR(s.buy_order()->price, 10.04, 1e-9);    // 10.0495 on the 0.02 grid
    EXPECT_NEAR(s.sell_order()->price, 10.16, 1e-9);   // 10.1505
    EXPECT_EQ(s.buy_order()->qty, 24'752);             // round(250000 / 10.10)
}

TEST(ClosingAuction, TradesOutsideWindowDoNotCountTowardsVwap) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});

    s.on_event(trade(at(14, 29, 59), 50.00, 1000));
    EXPECT_FALSE(s.vwap().has_value());

    s.on_event(trade(at(14, 30, 0), 10.00, 10));
    EXPECT_NEAR(*s.vwap(), 10.00, 1e-9);
}

TEST(ClosingAuction, ClosingPrintFillsCrossedOrderAndCreatesExit) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});
    run_entry_day(s);

    EXPECT_EQ(s.account().position(), 10'000);
    EXPECT_EQ(s.summary().buy_entries, 1u);
    EXPECT_EQ(s.summary().sell_entries, 0u);
    EXPECT_EQ(s.account().fills().back().reason, FillReason::AuctionEntry);

    ASSERT_TRUE(s.exit_order().has_value());
    EXPECT_EQ(s.exit_order()->side, Side::Sell);
    EXPECT_NEAR(s.exit_order()->price, 10.00, 1e-9);
    EXPECT_EQ(s.exit_order()->remaining, 10'000);

    // same day: the exit is not live yet
    s.on_event(trade(at(14, 56, 0), 10.50, 50'000));
    EXPECT_EQ(s.account().position(), 10'000);
}

TEST(ClosingAuction, ExitExecutesNextDayByTradeVolume) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});
    run_entry_day(s);

    s.on_event(trade(at(10, 30, 0, 7), 9.98, 5000));
    EXPECT_EQ(s.account().position(), 10'000);

    s.on_event(trade(at(10, 31, 0, 7), 10.01, 4000));
    EXPECT_EQ(s.account().position(), 6000);
    ASSERT_TRUE(s.exit_order().has_value());
    EXPECT_EQ(s.exit_order()->remaining, 6000);

    s.on_event(trade(at(10, 32, 0, 7), 10.00, 10'000));
    EXPECT_TRUE(s.account().flat());
    EXPECT_FALSE(s.exit_order().has_value());
    EXPECT_EQ(s.summary().vwap_exits, 2u);
    EXPECT_NEAR(s.account().realized_pnl(), 1040.0, 1e-6);
}

TEST(ClosingAuction, UnresolvedExitIsFlattenedAtNextClose) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});
    run_entry_day(s);

    s.on_event(trade(at(11, 0, 0, 7), 9.95, 5000));
    EXPECT_TRUE(s.result().unresolved_flatten);

    s.on_event(trade(at(14, 55, 0, 7), 9.97, 1000));
    EXPECT_TRUE(s.account().flat());
    EXPECT_FALSE(s.exit_order().has_value());
    EXPECT_EQ(s.summary().eod_flattens, 1u);
    EXPECT_EQ(s.account().fills().back().reason, FillReason::EodFlatten);
    EXPECT_NEAR(s.account().realized_pnl(), 700.0, 1e-6);
    EXPECT_FALSE(s.result().unresolved_flatten);
}

TEST(ClosingAuction, FillIsCappedByPrintVolume) {
    ClosingAuctionConfig cfg;
    cfg.order_quantity = 3000;
    ClosingAuctionSession s("ALDAR", cfg);

    s.on_event(trade(at(14, 35, 0), 10.00, 1000));
    // no event inside the auction window: orders go in at the print
    s.on_event(trade(at(14, 55, 0), 10.10, 5000));

    EXPECT_EQ(s.account().position(), -500);
    EXPECT_EQ(s.summary().sell_entries, 1u);
    ASSERT_TRUE(s.exit_order().has_value());
    EXPECT_EQ(s.exit_order()->side, Side::Buy);
}

TEST(ClosingAuction, UptrendFiltersSellEntry) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});

    // 10.00 -> 11.40 over the session
    for (int i = 0; i < 15; ++i) {
        s.on_event(trade(at(10, 0, 0) + i * seconds(1200), 10.00 + 0.1 * i, 100));
    }
    EXPECT_GT(s.trend_slope_bps_per_hour(), 10.0);

    s.on_event(bid(at(14, 45, 0), 11.0, 100));
    EXPECT_TRUE(s.buy_order().has_value());
    EXPECT_FALSE(s.sell_order().has_value());
    EXPECT_EQ(s.summary().filtered_sell, 1u);
    EXPECT_EQ(s.summary().filtered_buy, 0u);
}

TEST(ClosingAuction, TrendNeedsTenPoints) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});
    for (int i = 0; i < 9; ++i) {
        s.on_event(trade(at(10, 0, 0) + i * seconds(600), 10.00 + 0.5 * i, 100));
    }
    EXPECT_DOUBLE_EQ(s.trend_slope_bps_per_hour(), 0.0);
}

TEST(ClosingAuction, StopLossCancelsExitAndLiquidates) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});
    run_entry_day(s);
    ASSERT_TRUE(s.exit_order().has_value());

    s.on_event(bid(at(10, 15, 0, 7), 9.60, 3000));
    s.on_event(ask(at(10, 15, 1, 7), 9.65, 3000));

    EXPECT_EQ(s.summary().stop_losses, 1u);
    EXPECT_FALSE(s.exit_order().has_value());
    EXPECT_EQ(s.account().position(), 7000);
    EXPECT_TRUE(s.stop_loss().is_pending());

    s.on_event(bid(at(10, 16, 0, 7), 9.58, 10'000));
    EXPECT_TRUE(s.account().flat());
    EXPECT_FALSE(s.stop_loss().is_pending());
    EXPECT_EQ(s.account().fills().back().reason, FillReason::StopLoss);
}

TEST(ClosingAuction, StopLossOutsideWindowDoesNothing) {
    ClosingAuctionSession s("ALDAR", ClosingAuctionConfig{});
    run_entry_day(s);

    s.on_event(bid(at(10, 5, 0, 7), 9.00, 3000));
    s.on_event(ask(at(10, 5, 1, 7), 9.05, 3000));

    EXPECT_EQ(s.summary().stop_losses, 0u);
    EXPECT_EQ(s.account().position(), 10'000);
    EXPECT_TRUE(s.exit_order().has_value());
}
