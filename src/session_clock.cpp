#include "mmsim/session_clock.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mmsim {

namespace {

// Civil calendar <-> day count (proleptic Gregorian), days since 1970-01-01.
std::int64_t days_from_civil(std::int64_t y, unsigned month, unsigned day) noexcept
{
    const std::int64_t m = month;
    const std::int64_t d = day;
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

struct Civil {
    std::int64_t year;
    unsigned     month;
    unsigned     day;
};

Civil civil_from_days(std::int64_t z) noexcept
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp  = (5 * doy + 2) / 153;
    const auto d = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const auto m = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    return Civil{yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

bool parse_fixed(std::string_view text, std::size_t pos, std::size_t len, int& out)
{
    if (pos + len > text.size())
        return false;
    const char* first = text.data() + pos;
    const char* last  = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

std::optional<std::int64_t> parse_clock(std::string_view text, std::size_t pos,
                                        bool seconds_required)
{
    int h = 0, m = 0, s = 0;
    if (!parse_fixed(text, pos, 2, h) || text.size() < pos + 5 || text[pos + 2] != ':'
        || !parse_fixed(text, pos + 3, 2, m))
        return std::nullopt;

    if (text.size() > pos + 5)
    {
        if (text[pos + 5] != ':' || !parse_fixed(text, pos + 6, 2, s))
            return std::nullopt;
    }
    else if (seconds_required)
    {
        return std::nullopt;
    }

    if (h > 23 || m > 59 || s > 59)
        return std::nullopt;
    return hms(h, m, s);
}

} // namespace

TradingDate trading_date(Timestamp ts) noexcept
{
    std::int64_t days = ts / kNanosPerDay;
    if (ts % kNanosPerDay < 0)
        --days;
    return static_cast<TradingDate>(days);
}

std::int64_t time_of_day(Timestamp ts) noexcept
{
    std::int64_t rem = ts % kNanosPerDay;
    if (rem < 0)
        rem += kNanosPerDay;
    return rem;
}

Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         int hour, int minute, int second,
                         std::int64_t nanos) noexcept
{
    return days_from_civil(year, month, day) * kNanosPerDay
         + hms(hour, minute, second) + nanos;
}

std::string format_date(TradingDate date)
{
    const Civil c = civil_from_days(date);
    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << c.year << '-'
       << std::setw(2) << c.month << '-' << std::setw(2) << c.day;
    return os.str();
}

std::string format_timestamp(Timestamp ts)
{
    const std::int64_t tod = time_of_day(ts);
    const std::int64_t secs = tod / kNanosPerSecond;

    std::ostringstream os;
    os << format_date(trading_date(ts)) << ' ' << std::setfill('0')
       << std::setw(2) << secs / 3600 << ':'
       << std::setw(2) << (secs / 60) % 60 << ':'
       << std::setw(2) << secs % 60 << '.'
       << std::setw(6) << (tod % kNanosPerSecond) / 1000;
    return os.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text)
{
    // YYYY-MM-DD HH:MM:SS[.fffffffff]
    int y = 0, mo = 0, d = 0;
    if (!parse_fixed(text, 0, 4, y) || text.size() < 19 || text[4] != '-'
        || !parse_fixed(text, 5, 2, mo) || text[7] != '-' || !parse_fixed(text, 8, 2, d))
        return std::nullopt;
    if (text[10] != ' ' && text[10] != 'T')
        return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31)
        return std::nullopt;

    auto clock = parse_clock(text.substr(0, 19), 11, true);
    if (!clock)
        return std::nullopt;

    std::int64_t nanos = 0;
    if (text.size() > 19)
    {
        if (text[19] != '.')
            return std::nullopt;
        std::size_t digits = 0;
        for (std::size_t i = 20; i < text.size(); ++i)
        {
            const char c = text[i];
            if (c < '0' || c > '9')
                return std::nullopt;
            if (digits < 9)
            {
                nanos = nanos * 10 + (c - '0');
                ++digits;
            }
        }
        if (digits == 0)
            return std::nullopt;
        for (; digits < 9; ++digits)
            nanos *= 10;
    }

    return days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d)) * kNanosPerDay
         + *clock + nanos;
}

std::optional<std::int64_t> parse_time_of_day(std::string_view text)
{
    if (text.size() != 5 && text.size() != 8)
        return std::nullopt;
    return parse_clock(text, 0, false);
}

std::string_view to_string(SessionPhase phase) noexcept
{
    switch (phase)
    {
    case SessionPhase::PreOpen:        return "pre_open";
    case SessionPhase::OpeningAuction: return "opening_auction";
    case SessionPhase::SilentPeriod:   return "silent_period";
    case SessionPhase::Continuous:     return "continuous";
    case SessionPhase::ClosingAuction: return "closing_auction";
    case SessionPhase::PostClose:      return "post_close";
    }
    return "unknown";
}

SessionPhase SessionSchedule::classify(Timestamp ts) const noexcept
{
    const std::int64_t t = time_of_day(ts);

    if (t < opening_auction_start)
        return SessionPhase::PreOpen;
    if (t < silent_start)
        return SessionPhase::OpeningAuction;
    if (t < continuous_start)
        return SessionPhase::SilentPeriod;
    if (t < closing_auction_start)
        return SessionPhase::Continuous;
    if (t <= close_end)
        return SessionPhase::ClosingAuction;
    return SessionPhase::PostClose;
}

bool SessionSchedule::allows_book_updates(SessionPhase phase) const noexcept
{
    switch (phase)
    {
    case SessionPhase::PreOpen:
    case SessionPhase::OpeningAuction:
        return !strict_window;
    case SessionPhase::Continuous:
        return true;
    default:
        return false;
    }
}

bool SessionSchedule::allows_quoting(SessionPhase phase) const noexcept
{
    // Quotes may be built during the auction, they just cannot be hit.
    return allows_book_updates(phase);
}

bool SessionSchedule::allows_fills(SessionPhase phase) const noexcept
{
    return phase == SessionPhase::Continuous;
}

void SessionSchedule::validate() const
{
    const bool ordered = opening_auction_start <= silent_start
                      && silent_start <= continuous_start
                      && continuous_start <= closing_auction_start
                      && closing_auction_start <= eod_cutoff
                      && eod_cutoff <= close_end
                      && close_end < kNanosPerDay;
    if (!ordered)
        throw std::runtime_error("session schedule boundaries are not in order");
}

} // namespace mmsim
