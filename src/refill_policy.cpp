#include "mmsim/refill_policy.hpp"

#include <algorithm>

namespace mmsim {

bool TimedRefillPolicy::may_requote(const QuoteSideState& s, Timestamp now) const
{
    if (!s.last_refill)
        return true; // first quote ever
    return now - *s.last_refill >= interval_;
}

Quantity TimedRefillPolicy::offer_size(const QuoteSideState&, Quantity candidate, Timestamp) const
{
    return candidate;
}

void TimedRefillPolicy::on_placed(QuoteSideState& s, Timestamp now) const
{
    s.last_refill = now;
}

bool CooldownRefillPolicy::in_cooldown(const QuoteSideState& s, Timestamp now) const noexcept
{
    if (!s.last_fill)
        return false;
    return now - *s.last_fill < cooldown_;
}

Quantity CooldownRefillPolicy::offer_size(const QuoteSideState& s, Quantity candidate,
                                          Timestamp now) const
{
    if (!in_cooldown(s, now))
        return candidate;
    // No top-up during cooldown, position headroom still applies.
    return std::max<Quantity>(0, std::min(s.remaining, candidate));
}

} // namespace mmsim
