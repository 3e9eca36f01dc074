#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "mmsim/types.hpp"

namespace mmsim {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000LL;
constexpr std::int64_t kSecondsPerDay  = 86'400LL;
constexpr std::int64_t kNanosPerDay    = kSecondsPerDay * kNanosPerSecond;

/// Time of day in ns since midnight.
constexpr std::int64_t hms(int h, int m, int s) noexcept
{
    return (static_cast<std::int64_t>(h) * 3600 + m * 60 + s) * kNanosPerSecond;
}

constexpr std::int64_t seconds(std::int64_t s) noexcept
{
    return s * kNanosPerSecond;
}

TradingDate  trading_date(Timestamp ts) noexcept;
std::int64_t time_of_day(Timestamp ts) noexcept;

/// Build a timestamp from a civil date and a local wall-clock time.
Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         int hour = 0, int minute = 0, int second = 0,
                         std::int64_t nanos = 0) noexcept;

/// "YYYY-MM-DD"
std::string format_date(TradingDate date);

/// "YYYY-MM-DD HH:MM:SS.ffffff"
std::string format_timestamp(Timestamp ts);

/// Accepts "YYYY-MM-DD HH:MM:SS", optionally followed by a fraction and
/// with 'T' instead of the blank.
std::optional<Timestamp> parse_timestamp(std::string_view text);

/// Accepts "HH:MM" or "HH:MM:SS"; returns ns since midnight.
std::optional<std::int64_t> parse_time_of_day(std::string_view text);

enum class SessionPhase : std::uint8_t {
    PreOpen,
    OpeningAuction,
    SilentPeriod,
    Continuous,
    ClosingAuction,
    PostClose
};

std::string_view to_string(SessionPhase phase) noexcept;

/**
 * Fixed intraday schedule of one exchange.
 *
 *   [.., opening_auction_start)                 PreOpen
 *   [opening_auction_start, silent_start)       OpeningAuction
 *   [silent_start, continuous_start)            SilentPeriod
 *   [continuous_start, closing_auction_start)   Continuous
 *   [closing_auction_start, close_end]          ClosingAuction
 *   (close_end, ..]                             PostClose
 *
 * eod_cutoff lies inside the closing auction; positions are flattened there.
 */
struct SessionSchedule {
    std::int64_t opening_auction_start = hms(9, 30, 0);
    std::int64_t silent_start          = hms(10, 0, 0);
    std::int64_t continuous_start      = hms(10, 5, 0);
    std::int64_t closing_auction_start = hms(14, 45, 0);
    std::int64_t eod_cutoff            = hms(14, 55, 0);
    std::int64_t close_end             = hms(15, 0, 0);

    /// Only the continuous phase is processed at all.
    bool strict_window = false;

    SessionPhase classify(Timestamp ts) const noexcept;

    bool is_eod_cutoff(Timestamp ts) const noexcept
    {
        return time_of_day(ts) >= eod_cutoff;
    }

    bool allows_book_updates(SessionPhase phase) const noexcept;
    bool allows_quoting(SessionPhase phase) const noexcept;
    bool allows_fills(SessionPhase phase) const noexcept;

    /// Throws std::runtime_error if the boundaries are not ordered.
    void validate() const;
};

} // namespace mmsim
