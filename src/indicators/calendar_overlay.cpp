#include "indicators/calendar_overlay.hpp"
#include <cstdlib>

using core::CalendarContext;
using core::CalendarLabel;
using core::TradeDate;

namespace ind {

namespace {
constexpr int kWednesday = 3;
constexpr int kFriday = 5;
}

TradeDate monthly_opex(const TradeDate& d){
    return TradeDate::nth_weekday(d.year, d.month, kFriday, 3);
}

TradeDate vix_expiration(const TradeDate& d){
    return TradeDate::nth_weekday(d.year, d.month, kWednesday, 3);
}

bool CalendarOverlay::in_fomc_blackout(const TradeDate& d) const {
    for (const auto& f : cfg_.fomc_dates)
        if (std::labs(days_between(f, d)) <= cfg_.fomc_blackout_days) return true;
    return false;
}

CalendarContext CalendarOverlay::compute_overlay(const TradeDate& d) const {
    CalendarContext c;
    c.fomc_blackout        = in_fomc_blackout(d);
    c.opex_amplifier       = std::labs(days_between(monthly_opex(d), d)) <= cfg_.opex_window_days;
    c.vixpiration_discount = std::labs(days_between(vix_expiration(d), d)) <= cfg_.vix_window_days;

    if (c.fomc_blackout){
        c.modifier = cfg_.blackout_modifier;
        c.label = CalendarLabel::FomcBlackout;
    } else if (c.vixpiration_discount && !c.opex_amplifier){
        c.modifier = cfg_.vixpiration_modifier;
        c.label = CalendarLabel::VixpirationDiscount;
    } else if (c.opex_amplifier){
        c.modifier = cfg_.opex_modifier;
        c.label = CalendarLabel::OpexAmplifier;
    } else {
        c.modifier = cfg_.normal_modifier;
        c.label = CalendarLabel::Normal;
    }
    return c;
}

} // namespace ind
