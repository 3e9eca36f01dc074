#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mmsim {

using Price     = double;          // exchange price in local currency
using Quantity  = std::int64_t;    // shares
using Timestamp = std::int64_t;    // ns since 1970-01-01, exchange local time
using TradingDate = std::int32_t;  // days since 1970-01-01

/// Direction of an execution.
enum class Side {
    Buy,
    Sell
};

/// Side of the book / of our two-sided quote.
enum class BookSide {
    Bid,
    Ask
};

struct LevelInfo {
    Price    price{};
    Quantity qty{};
    bool     valid{false};
};

/// Why a fill record was produced.
enum class FillReason : std::uint8_t {
    Quote,          // passive fill of our resting quote
    EodFlatten,     // forced end-of-day close
    StopLoss,       // stop-loss liquidation
    AuctionEntry,   // closing auction entry
    VwapExit        // next-day exit at the entry VWAP
};

/// One execution, append-only in execution order.
struct FillRecord {
    Timestamp  ts{0};
    Side       side{Side::Buy};
    Price      price{0.0};
    Quantity   qty{0};
    double     realized_pnl{0.0};  // contribution of this fill
    Quantity   position{0};        // position after the fill
    double     cumulative_pnl{0.0};
    FillReason reason{FillReason::Quote};
};

inline Side opposite(Side s) noexcept
{
    return s == Side::Buy ? Side::Sell : Side::Buy;
}

/// Buy fills belong to the bid quote, sell fills to the ask quote.
inline BookSide quote_side_of(Side s) noexcept
{
    return s == Side::Buy ? BookSide::Bid : BookSide::Ask;
}

inline std::string_view to_string(Side s) noexcept
{
    return s == Side::Buy ? "buy" : "sell";
}

inline std::string_view to_string(BookSide s) noexcept
{
    return s == BookSide::Bid ? "bid" : "ask";
}

std::string_view to_string(FillReason r) noexcept;

} // namespace mmsim
