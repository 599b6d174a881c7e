#include <gtest/gtest.h>
#include "indicators/calendar_overlay.hpp"

using core::CalendarLabel;
using core::TradeDate;

TEST(CalendarOverlay, ExpirationDates){
    EXPECT_EQ(ind::monthly_opex({2025, 11, 5}), (TradeDate{2025, 11, 21}));
    EXPECT_EQ(ind::vix_expiration({2025, 11, 5}), (TradeDate{2025, 11, 19}));
    EXPECT_EQ(ind::monthly_opex({2025, 12, 30}), (TradeDate{2025, 12, 19}));
}

TEST(CalendarOverlay, NormalDay){
    ind::CalendarOverlay ov;
    auto c = ov.compute_overlay({2025, 11, 5});
    EXPECT_EQ(c.label, CalendarLabel::Normal);
    EXPECT_DOUBLE_EQ(c.modifier, 1.0);
    EXPECT_FALSE(c.fomc_blackout);
    EXPECT_FALSE(c.opex_amplifier);
    EXPECT_FALSE(c.vixpiration_discount);
}

TEST(CalendarOverlay, OpexWindowAmplifies){
    ind::CalendarOverlay ov;
    const TradeDate opex{2025, 11, 21};
    for (int off = -2; off <= 2; ++off){
        auto c = ov.compute_overlay(opex.plus_days(off));
        EXPECT_EQ(c.label, CalendarLabel::OpexAmplifier) << off;
        EXPECT_DOUBLE_EQ(c.modifier, 1.5) << off;
        EXPECT_TRUE(c.opex_amplifier) << off;
    }
    EXPECT_EQ(ov.compute_overlay(opex.plus_days(4)).label, CalendarLabel::Normal);
}

TEST(CalendarOverlay, VixExpiryInsideOpexWindowStillAmplifies){
    ind::CalendarOverlay ov;
    auto c = ov.compute_overlay({2025, 11, 19});
    EXPECT_TRUE(c.vixpiration_discount);
    EXPECT_TRUE(c.opex_amplifier);
    EXPECT_EQ(c.label, CalendarLabel::OpexAmplifier);
}

TEST(CalendarOverlay, VixDiscountWhenOpexWindowIsNarrow){
    core::CalendarConfig cfg;
    cfg.opex_window_days = 0;
    ind::CalendarOverlay ov(cfg);
    auto c = ov.compute_overlay({2025, 11, 19});
    EXPECT_EQ(c.label, CalendarLabel::VixpirationDiscount);
    EXPECT_DOUBLE_EQ(c.modifier, 0.7);
}

TEST(CalendarOverlay, FomcBlackout){
    ind::CalendarOverlay ov;
    for (auto d : {TradeDate{2025, 12, 9}, TradeDate{2025, 12, 10}, TradeDate{2025, 12, 11}}){
        auto c = ov.compute_overlay(d);
        EXPECT_TRUE(c.fomc_blackout) << d.iso();
        EXPECT_EQ(c.label, CalendarLabel::FomcBlackout) << d.iso();
        EXPECT_DOUBLE_EQ(c.modifier, 0.0) << d.iso();
    }
    EXPECT_FALSE(ov.in_fomc_blackout({2025, 12, 12}));
    EXPECT_FALSE(ov.in_fomc_blackout({2025, 12, 8}));
}

TEST(CalendarOverlay, BlackoutBeatsOpex){
    core::CalendarConfig cfg;
    cfg.fomc_dates = {TradeDate{2025, 11, 20}};
    ind::CalendarOverlay ov(cfg);
    auto c = ov.compute_overlay({2025, 11, 21});
    EXPECT_TRUE(c.opex_amplifier);
    EXPECT_EQ(c.label, CalendarLabel::FomcBlackout);
    EXPECT_DOUBLE_EQ(c.modifier, 0.0);
}

TEST(CalendarOverlay, EmptyFomcCalendar){
    core::CalendarConfig cfg;
    cfg.fomc_dates.clear();
    ind::CalendarOverlay ov(cfg);
    EXPECT_EQ(ov.compute_overlay({2025, 12, 10}).label, CalendarLabel::Normal);
}
