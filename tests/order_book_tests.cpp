#include <gtest/gtest.h>

#include "mmsim/order_book.hpp"
#include "mmsim/types.hpp"

using namespace mmsim;

namespace {

MarketEvent ev(EventType type, Price price, Quantity qty) {
    MarketEvent e;
    e.type  = type;
    e.price = price;
    e.qty   = qty;
    return e;
}

} // namespace

TEST(OrderBookBasic, IsEmptyOnInit) {
    OrderBook book;
    EXPECT_TRUE(book.empty());

    auto bb = book.best_bid();
    auto ba = book.best_ask();

    EXPECT_FALSE(bb.valid);
    EXPECT_FALSE(ba.valid);
    EXPECT_FALSE(book.last_trade().valid);
}

TEST(OrderBookUpdate, SingleBidSetsBestBid) {
    OrderBook book;

    book.apply_update(ev(EventType::Bid, 10.00, 200));

    auto bb = book.best_bid();
    auto ba = book.best_ask();

    EXPECT_TRUE(bb.valid);
    EXPECT_DOUBLE_EQ(bb.price, 10.00);
    EXPECT_EQ(bb.qty, 200);

    EXPECT_FALSE(ba.valid);
}

TEST(OrderBookUpdate, BestBidIsMaxPriceBestAskIsMinPrice) {
    OrderBook book;

    book.apply_update(ev(EventType::Bid, 10.00, 100));
    book.apply_update(ev(EventType::Bid, 10.05, 5));
    book.apply_update(ev(EventType::Ask, 10.20, 7));
    book.apply_update(ev(EventType::Ask, 10.10, 9));

    EXPECT_DOUBLE_EQ(book.best_bid().price, 10.05);
    EXPECT_EQ(book.best_bid().qty, 5);
    EXPECT_DOUBLE_EQ(book.best_ask().price, 10.10);
    EXPECT_EQ(book.best_ask().qty, 9);
    EXPECT_EQ(book.bid_levels(), 2u);
    EXPECT_EQ(book.ask_levels(), 2u);
}

TEST(OrderBookUpdate, UpdateOverwritesAndIsIdempotent) {
    OrderBook book;

    book.apply_update(ev(EventType::Ask, 10.10, 300));
    book.apply_update(ev(EventType::Ask, 10.10, 120));
    EXPECT_EQ(book.quantity_at(BookSide::Ask, 10.10), 120);

    // the same update twice leaves the same book
    book.apply_update(ev(EventType::Ask, 10.10, 120));
    EXPECT_EQ(book.quantity_at(BookSide::Ask, 10.10), 120);
    EXPECT_EQ(book.ask_levels(), 1u);
}

TEST(OrderBookUpdate, ZeroQuantityDeletesLevel) {
    OrderBook book;

    book.apply_update(ev(EventType::Bid, 10.00, 100));
    book.apply_update(ev(EventType::Bid, 9.99, 50));
    book.apply_update(ev(EventType::Bid, 10.00, 0));

    EXPECT_EQ(book.quantity_at(BookSide::Bid, 10.00), 0);
    EXPECT_DOUBLE_EQ(book.best_bid().price, 9.99);
}

TEST(OrderBookUpdate, NonPositivePriceIsIgnored) {
    OrderBook book;

    book.apply_update(ev(EventType::Bid, 0.0, 100));
    book.apply_update(ev(EventType::Ask, -1.0, 100));
    book.apply_update(ev(EventType::Unknown, 10.0, 100));

    EXPECT_TRUE(book.empty());
}

TEST(OrderBookUpdate, TradeRecordsLastPriceOnly) {
    OrderBook book;

    book.apply_update(ev(EventType::Bid, 10.00, 100));
    book.apply_update(ev(EventType::Trade, 10.00, 60));

    EXPECT_EQ(book.quantity_at(BookSide::Bid, 10.00), 100);
    auto lt = book.last_trade();
    EXPECT_TRUE(lt.valid);
    EXPECT_DOUBLE_EQ(lt.price, 10.00);
    EXPECT_EQ(lt.qty, 60);
}

TEST(OrderBookRemove, PartialThenExhaust) {
    OrderBook book;
    book.apply_update(ev(EventType::Bid, 10.00, 100));

    EXPECT_EQ(book.remove(BookSide::Bid, 10.00, 40), 40);
    EXPECT_EQ(book.quantity_at(BookSide::Bid, 10.00), 60);

    // больше, чем есть на уровне: удаляется только остаток
    EXPECT_EQ(book.remove(BookSide::Bid, 10.00, 500), 60);
    EXPECT_FALSE(book.best_bid().valid);
}

TEST(OrderBookRemove, MissingLevelRemovesNothing) {
    OrderBook book;
    book.apply_update(ev(EventType::Ask, 10.10, 100));

    EXPECT_EQ(book.remove(BookSide::Ask, 10.20, 10), 0);
    EXPECT_EQ(book.remove(BookSide::Bid, 10.10, 10), 0);
    EXPECT_EQ(book.quantity_at(BookSide::Ask, 10.10), 100);
}

TEST(OrderBookBasic, ClearDropsEverything) {
    OrderBook book;
    book.apply_update(ev(EventType::Bid, 10.00, 100));
    book.apply_update(ev(EventType::Ask, 10.10, 100));
    book.apply_update(ev(EventType::Trade, 10.05, 1));

    book.clear();

    EXPECT_TRUE(book.empty());
    EXPECT_FALSE(book.last_trade().valid);
}
