#pragma once

#include <optional>

#include "mmsim/config.hpp"
#include "mmsim/types.hpp"

namespace mmsim {

struct QuoteCandidate {
    Price    price{0.0};
    Quantity size{0};
    bool     valid{false};   // false when that side of the book is empty
};

struct QuoteSet {
    QuoteCandidate bid;
    QuoteCandidate ask;

    const QuoteCandidate& side(BookSide s) const noexcept
    {
        return s == BookSide::Bid ? bid : ask;
    }
};

/// Join-the-touch pricing with position-aware sizing.
class QuoteGenerator
{
public:
    /// nullopt only when both sides of the book are empty.
    static std::optional<QuoteSet> generate(const LevelInfo& best_bid,
                                            const LevelInfo& best_ask,
                                            Quantity position,
                                            const SecurityConfig& cfg);

    /// max_position, tightened by max_notional converted to shares at the
    /// mid (or at the only available touch).
    static Quantity position_limit(const LevelInfo& best_bid,
                                   const LevelInfo& best_ask,
                                   const SecurityConfig& cfg);
};

} // namespace mmsim
