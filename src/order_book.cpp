#include "mmsim/order_book.hpp"

#include <algorithm> // std::min

namespace mmsim {

bool OrderBook::empty() const noexcept
{
    return bids_.empty() && asks_.empty();
}

void OrderBook::clear() noexcept
{
    bids_.clear();
    asks_.clear();
    last_trade_ = LevelInfo{};
}

template <typename Book>
void OrderBook::set_level(Book& book, Price price, Quantity qty)
{
    if (qty <= 0)
    {
        book.erase(price);
        return;
    }
    // Перезаписываем уровень, а не суммируем.
    book[price] = qty;
}

template <typename Book>
Quantity OrderBook::remove_from(Book& book, Price price, Quantity qty)
{
    if (qty <= 0)
        return 0;

    auto it = book.find(price);
    if (it == book.end())
        return 0;

    Quantity removed = std::min(qty, it->second);
    it->second -= removed;
    if (it->second <= 0)
        book.erase(it);

    return removed;
}

void OrderBook::apply_update(const MarketEvent& ev)
{
    // NaN also fails this check.
    if (!(ev.price > 0.0))
        return;

    switch (ev.type)
    {
    case EventType::Bid:
        set_level(bids_, ev.price, ev.qty);
        break;
    case EventType::Ask:
        set_level(asks_, ev.price, ev.qty);
        break;
    case EventType::Trade:
        last_trade_.valid = true;
        last_trade_.price = ev.price;
        last_trade_.qty   = ev.qty;
        break;
    default:
        // неизвестный тип события
        break;
    }
}

LevelInfo OrderBook::best_bid() const noexcept
{
    LevelInfo info;
    if (bids_.empty())
        return info;

    const auto& [price, qty] = *bids_.begin(); // max price due to std::greater

    info.valid = true;
    info.price = price;
    info.qty   = qty;
    return info;
}

LevelInfo OrderBook::best_ask() const noexcept
{
    LevelInfo info;
    if (asks_.empty())
        return info;

    const auto& [price, qty] = *asks_.begin(); // min price due to std::less

    info.valid = true;
    info.price = price;
    info.qty   = qty;
    return info;
}

Quantity OrderBook::quantity_at(BookSide side, Price price) const noexcept
{
    if (side == BookSide::Bid)
    {
        auto it = bids_.find(price);
        return it == bids_.end() ? 0 : it->second;
    }

    auto it = asks_.find(price);
    return it == asks_.end() ? 0 : it->second;
}

Quantity OrderBook::remove(BookSide side, Price price, Quantity qty)
{
    if (side == BookSide::Bid)
        return remove_from(bids_, price, qty);
    return remove_from(asks_, price, qty);
}

} // namespace mmsim
