#include "mmsim/quote_generator.hpp"

#include <algorithm>
#include <cmath>

namespace mmsim {

Quantity QuoteGenerator::position_limit(const LevelInfo& best_bid,
                                        const LevelInfo& best_ask,
                                        const SecurityConfig& cfg)
{
    Quantity limit = cfg.max_position;
    if (!cfg.max_notional)
        return limit;

    Price ref = 0.0;
    if (best_bid.valid && best_ask.valid)
        ref = (best_bid.price + best_ask.price) / 2.0;
    else if (best_bid.valid)
        ref = best_bid.price;
    else if (best_ask.valid)
        ref = best_ask.price;

    if (ref > 0.0)
    {
        const auto by_notional = static_cast<Quantity>(std::floor(*cfg.max_notional / ref));
        limit = std::min(limit, by_notional);
    }
    return limit;
}

std::optional<QuoteSet> QuoteGenerator::generate(const LevelInfo& best_bid,
                                                 const LevelInfo& best_ask,
                                                 Quantity position,
                                                 const SecurityConfig& cfg)
{
    if (!best_bid.valid && !best_ask.valid)
        return std::nullopt;

    const Quantity limit = position_limit(best_bid, best_ask, cfg);

    QuoteSet q;
    if (best_bid.valid)
    {
        q.bid.valid = true;
        q.bid.price = best_bid.price;
        // headroom to +limit
        q.bid.size = std::max<Quantity>(0, std::min(cfg.quote_size_bid, limit - position));
    }
    if (best_ask.valid)
    {
        q.ask.valid = true;
        q.ask.price = best_ask.price;
        // headroom to -limit
        q.ask.size = std::max<Quantity>(0, std::min(cfg.quote_size_ask, limit + position));
    }
    return q;
}

} // namespace mmsim
