#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "mmsim/config.hpp"

using namespace mmsim;

TEST(BacktestConfig, EmptyDocumentGivesDefaults) {
    const auto cfg = BacktestConfig::from_string("{}");

    EXPECT_EQ(cfg.variant, StrategyVariant::Baseline);
    const auto& sc = cfg.security("ANY");
    EXPECT_EQ(sc.quote_size_bid, 50'000);
    EXPECT_EQ(sc.quote_size_ask, 50'000);
    EXPECT_EQ(sc.refill_interval, seconds(60));
    EXPECT_EQ(sc.max_position, 2'000'000);
    EXPECT_FALSE(sc.max_notional.has_value());
    EXPECT_DOUBLE_EQ(sc.min_liquidity_notional, 25'000.0);
    EXPECT_DOUBLE_EQ(sc.stop_loss_threshold_pct, 2.0);

    const auto& ca = cfg.closing_auction("ANY");
    EXPECT_EQ(ca.vwap_window_min, 15);
    EXPECT_DOUBLE_EQ(ca.spread_vwap_pct, 0.5);
    EXPECT_DOUBLE_EQ(ca.order_notional, 250'000.0);
    EXPECT_DOUBLE_EQ(ca.auction_fill_pct, 10.0);
    EXPECT_EQ(ca.exchange, Exchange::ADX);
}

TEST(BacktestConfig, PerSecurityOverridesFallBackToDefaults) {
    const auto cfg = BacktestConfig::from_string(R"({
        "strategy": "price_follow",
        "defaults":   { "quote_size": 1000, "refill_interval_sec": 30 },
        "securities": {
            "EMAAR": { "quote_size_ask": 400, "max_notional": 150000,
                       "min_local_currency_before_quote": 0 }
        }
    })");

    EXPECT_EQ(cfg.variant, StrategyVariant::PriceFollow);

    const auto& emaar = cfg.security("EMAAR");
    EXPECT_EQ(emaar.quote_size_bid, 1000);
    EXPECT_EQ(emaar.quote_size_ask, 400);
    EXPECT_EQ(emaar.refill_interval, seconds(30));
    ASSERT_TRUE(emaar.max_notional.has_value());
    EXPECT_DOUBLE_EQ(*emaar.max_notional, 150'000.0);
    EXPECT_DOUBLE_EQ(emaar.min_liquidity_notional, 0.0);

    const auto& other = cfg.security("ADNOCGAS");
    EXPECT_EQ(other.quote_size_bid, 1000);
    EXPECT_EQ(other.quote_size_ask, 1000);
    EXPECT_FALSE(other.max_notional.has_value());
}

TEST(BacktestConfig, LegacyVariantNamesAccepted) {
    EXPECT_EQ(parse_strategy_variant("v1_baseline"), StrategyVariant::Baseline);
    EXPECT_EQ(parse_strategy_variant("v2_1_stop_loss"), StrategyVariant::PriceFollowStopLoss);
    EXPECT_EQ(parse_strategy_variant("liquidity_monitor"), StrategyVariant::LiquidityMonitor);
    EXPECT_FALSE(parse_strategy_variant("v9"));
}

TEST(BacktestConfig, ScheduleOverrides) {
    const auto cfg = BacktestConfig::from_string(R"({
        "schedule": { "eod_cutoff": "14:50", "strict_window": true }
    })");

    EXPECT_EQ(cfg.schedule.eod_cutoff, hms(14, 50, 0));
    EXPECT_TRUE(cfg.schedule.strict_window);
    EXPECT_EQ(cfg.schedule.continuous_start, hms(10, 5, 0));
}

TEST(BacktestConfig, ClosingAuctionSection) {
    const auto cfg = BacktestConfig::from_string(R"({
        "closing_auction": {
            "auction_fill_pct": 25,
            "defaults":   { "spread_vwap_pct": 1.0 },
            "securities": { "ALDAR": { "order_quantity": 5000, "trend_filter_sell_enabled": false } },
            "exchanges":  { "ALDAR": "ADX", "EMAAR": "DFM" }
        }
    })");

    const auto& aldar = cfg.closing_auction("ALDAR");
    EXPECT_DOUBLE_EQ(aldar.auction_fill_pct, 25.0);
    EXPECT_DOUBLE_EQ(aldar.spread_vwap_pct, 1.0);
    ASSERT_TRUE(aldar.order_quantity.has_value());
    EXPECT_EQ(*aldar.order_quantity, 5000);
    EXPECT_FALSE(aldar.trend_filter_sell_enabled);
    EXPECT_EQ(aldar.exchange, Exchange::ADX);

    const auto& emaar = cfg.closing_auction("EMAAR");
    EXPECT_EQ(emaar.exchange, Exchange::DFM);
    EXPECT_DOUBLE_EQ(emaar.spread_vwap_pct, 1.0);

    EXPECT_DOUBLE_EQ(cfg.closing_auction("OTHER").auction_fill_pct, 25.0);
}

TEST(BacktestConfig, ClosingAuctionSecuritiesAtTopLevel) {
    const auto cfg = BacktestConfig::from_string(R"({
        "closing_auction": {
            "auction_fill_pct": 20,
            "EMAAR": { "spread_vwap_pct": 1.0, "exchange": "DFM" },
            "ALDAR": { "order_quantity": 3000 },
            "exchanges": { "ALDAR": "ADX" }
        }
    })");

    const auto& emaar = cfg.closing_auction("EMAAR");
    EXPECT_DOUBLE_EQ(emaar.spread_vwap_pct, 1.0);
    EXPECT_EQ(emaar.exchange, Exchange::DFM);
    EXPECT_DOUBLE_EQ(emaar.auction_fill_pct, 20.0);

    const auto& aldar = cfg.closing_auction("ALDAR");
    ASSERT_TRUE(aldar.order_quantity.has_value());
    EXPECT_EQ(*aldar.order_quantity, 3000);
    EXPECT_DOUBLE_EQ(aldar.spread_vwap_pct, 0.5);

    EXPECT_FALSE(cfg.closing_auction("OTHER").order_quantity.has_value());
}

TEST(BacktestConfig, UnknownClosingAuctionKeysThrow) {
    // misspelt setting inside a security entry
    EXPECT_THROW(BacktestConfig::from_string(
                     R"({"closing_auction": {"EMAAR": {"spread_vwap": 1.0}}})"),
                 std::runtime_error);
    // misspelt top-level setting is not a security object
    EXPECT_THROW(BacktestConfig::from_string(
                     R"({"closing_auction": {"auction_fill": 20}})"),
                 std::runtime_error);
    // the same security twice
    EXPECT_THROW(BacktestConfig::from_string(
                     R"({"closing_auction": {"EMAAR": {}, "securities": {"EMAAR": {}}}})"),
                 std::runtime_error);

    try {
        BacktestConfig::from_string(R"({"closing_auction": {"EMAAR": {"spread_vwap": 1.0}}})");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("closing_auction.EMAAR.spread_vwap"),
                  std::string::npos);
    }
}

TEST(BacktestConfig, MalformedValuesThrow) {
    EXPECT_THROW(BacktestConfig::from_string("not json"), std::runtime_error);
    EXPECT_THROW(BacktestConfig::from_string(R"({"strategy": "v9"})"), std::runtime_error);
    EXPECT_THROW(BacktestConfig::from_string(R"({"defaults": {"quote_size": -5}})"),
                 std::runtime_error);
    EXPECT_THROW(BacktestConfig::from_string(R"({"defaults": {"max_position": "lots"}})"),
                 std::runtime_error);
    EXPECT_THROW(BacktestConfig::from_string(R"({"schedule": {"eod_cutoff": "25:00"}})"),
                 std::runtime_error);
    EXPECT_THROW(BacktestConfig::from_string(
                     R"({"closing_auction": {"exchanges": {"X": "NYSE"}}})"),
                 std::runtime_error);
}

TEST(BacktestConfig, ErrorMessageNamesTheKey) {
    try {
        BacktestConfig::from_string(R"({"securities": {"FAB": {"refill_interval_sec": -1}}})");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("securities.FAB.refill_interval_sec"),
                  std::string::npos);
    }
}

TEST(BacktestConfig, MissingFileThrows) {
    EXPECT_THROW(BacktestConfig::load("/nonexistent/mmsim.json"), std::runtime_error);
}
