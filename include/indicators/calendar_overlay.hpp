#pragma once
#include <utility>
#include "core/config.hpp"
#include "core/trade_date.hpp"
#include "core/types.hpp"

namespace ind {

// Monthly SPX expiration: 3rd Friday of d's month
core::TradeDate monthly_opex(const core::TradeDate& d);
// VIX expiration: 3rd Wednesday of d's month
core::TradeDate vix_expiration(const core::TradeDate& d);

// Calendar modifier from date arithmetic only (no market data).
// Priority: FOMC blackout > VIX-expiry discount > OpEx amplifier > normal.
class CalendarOverlay {
public:
    explicit CalendarOverlay(core::CalendarConfig cfg = {}) : cfg_(std::move(cfg)) {}

    const core::CalendarConfig& config() const { return cfg_; }

    core::CalendarContext compute_overlay(const core::TradeDate& d) const;
    bool in_fomc_blackout(const core::TradeDate& d) const;

private:
    core::CalendarConfig cfg_;
};

} // namespace ind
