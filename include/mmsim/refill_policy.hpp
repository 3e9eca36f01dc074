#pragma once

#include <cstdint>
#include <optional>

#include "mmsim/types.hpp"

namespace mmsim {

/**
 * Our simulated resting order on one side, plus that side's timers.
 *
 * price is kept even while the side is suppressed so a later re-quote can
 * tell whether the price moved. ahead_qty is the visible level quantity we
 * joined behind; it never includes our own size.
 */
struct QuoteSideState {
    std::optional<Price> price;
    bool     displayed{false};   // live and hittable
    Quantity ahead_qty{0};
    Quantity remaining{0};

    std::optional<Timestamp> last_refill;  // last placement or fill
    std::optional<Timestamp> last_fill;
};

/**
 * Decides when a side may be re-quoted and with how much size.
 *
 * Idle -> Quoted(timer running) -> Expired -> re-Quoted.
 */
class RefillPolicy
{
public:
    virtual ~RefillPolicy() = default;

    /// Whether the side is re-evaluated on this event at all.
    virtual bool may_requote(const QuoteSideState& s, Timestamp now) const = 0;

    /// Size actually offered, given the generator's candidate size.
    virtual Quantity offer_size(const QuoteSideState& s, Quantity candidate, Timestamp now) const = 0;

    /// True if an accepted re-quote at an unchanged price keeps queue position.
    virtual bool keeps_queue_on_same_price() const noexcept = 0;

    virtual void on_placed(QuoteSideState& s, Timestamp now) const = 0;

    /// Every own fill restarts both timers of the side it hit.
    virtual void on_fill(QuoteSideState& s, Timestamp now) const
    {
        s.last_refill = now;
        s.last_fill   = now;
    }
};

/// Sticky quotes: a side is re-placed (full size, fresh queue) only once the
/// interval since the last placement or fill has elapsed.
class TimedRefillPolicy final : public RefillPolicy
{
public:
    explicit TimedRefillPolicy(std::int64_t interval_ns) : interval_(interval_ns) {}

    bool may_requote(const QuoteSideState& s, Timestamp now) const override;
    Quantity offer_size(const QuoteSideState& s, Quantity candidate, Timestamp now) const override;
    bool keeps_queue_on_same_price() const noexcept override { return false; }
    void on_placed(QuoteSideState& s, Timestamp now) const override;

    std::int64_t interval() const noexcept { return interval_; }

private:
    std::int64_t interval_;
};

/// Price follows the touch on every event; after a fill only the unfilled
/// remainder may be offered until the cooldown elapses.
class CooldownRefillPolicy final : public RefillPolicy
{
public:
    explicit CooldownRefillPolicy(std::int64_t cooldown_ns) : cooldown_(cooldown_ns) {}

    bool may_requote(const QuoteSideState&, Timestamp) const override { return true; }
    Quantity offer_size(const QuoteSideState& s, Quantity candidate, Timestamp now) const override;
    bool keeps_queue_on_same_price() const noexcept override { return true; }
    void on_placed(QuoteSideState&, Timestamp) const override {}

    bool in_cooldown(const QuoteSideState& s, Timestamp now) const noexcept;

    std::int64_t cooldown() const noexcept { return cooldown_; }

private:
    std::int64_t cooldown_;
};

} // namespace mmsim
