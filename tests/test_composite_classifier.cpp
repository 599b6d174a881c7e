#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include "strategy/composite_classifier.hpp"

using core::CalendarContext;
using core::CalendarLabel;
using core::Composite;
using core::SignalLevel;
using core::SignalMap;

namespace {

SignalMap firing(std::initializer_list<const char*> keys){
    SignalMap m;
    for (auto k : keys){
        core::SignalRecord r;
        r.key = k;
        r.level = SignalLevel::Action;
        r.tier = 1;
        m[k] = r;
    }
    return m;
}

CalendarContext normal(){ return {}; }

CalendarContext opex(){
    CalendarContext c;
    c.opex_amplifier = true;
    c.modifier = 1.5;
    c.label = CalendarLabel::OpexAmplifier;
    return c;
}

CalendarContext vix_discount(){
    CalendarContext c;
    c.vixpiration_discount = true;
    c.modifier = 0.7;
    c.label = CalendarLabel::VixpirationDiscount;
    return c;
}

CalendarContext blackout(){
    CalendarContext c;
    c.fomc_blackout = true;
    c.modifier = 0.0;
    c.label = CalendarLabel::FomcBlackout;
    return c;
}

} // namespace

TEST(CompositeClassifier, FewerThanTwoActionsIsNull){
    strategy::CompositeClassifier cls;
    auto r = cls.classify(firing({"skewing"}), normal());
    EXPECT_FALSE(r.composite.has_value());
    ASSERT_EQ(r.tier1_firing.size(), 1u);
    EXPECT_FALSE(cls.classify(SignalMap{}, normal()).composite.has_value());
}

TEST(CompositeClassifier, WarningsDoNotCount){
    auto m = firing({"skewing"});
    core::SignalRecord w;
    w.key = "fbfwd30_20";
    w.level = SignalLevel::Warning;
    w.tier = 2;
    m[w.key] = w;
    strategy::CompositeClassifier cls;
    EXPECT_FALSE(cls.classify(m, normal()).composite.has_value());
}

TEST(CompositeClassifier, CoreStrong){
    strategy::CompositeClassifier cls;
    auto r = cls.classify(firing({"skewing", "rip", "contango"}), normal());
    ASSERT_TRUE(r.composite.has_value());
    EXPECT_EQ(*r.composite, Composite::FearBounceStrong);
    EXPECT_EQ(r.counts.core, 3);
    EXPECT_EQ(r.counts.groups_firing, 1);
}

TEST(CompositeClassifier, CoreStrongDuringOpex){
    strategy::CompositeClassifier cls;
    auto r = cls.classify(firing({"skewing", "rip", "contango"}), opex());
    EXPECT_EQ(r.composite, Composite::FearBounceStrongOpex);
}

TEST(CompositeClassifier, VixDiscountRaisesCoreThreshold){
    strategy::CompositeClassifier cls;
    EXPECT_EQ(cls.classify(firing({"skewing", "rip", "contango"}), vix_discount()).composite,
              Composite::FearBounceLong);
    EXPECT_EQ(cls.classify(firing({"skewing", "rip", "contango", "credit_spread"}), vix_discount()).composite,
              Composite::FearBounceStrong);
}

TEST(CompositeClassifier, FomcBlackoutSuppressesEverything){
    strategy::CompositeClassifier cls;
    auto r = cls.classify(firing({"skewing", "rip", "skew_25d_rr", "contango", "credit_spread"}), blackout());
    EXPECT_FALSE(r.composite.has_value());
    EXPECT_EQ(r.tier1_firing.size(), 5u);
    EXPECT_EQ(r.counts.core, 5);
    EXPECT_FALSE(cls.classify(firing({"skewing", "rip"}), blackout(), true).composite.has_value());
}

TEST(CompositeClassifier, MultiGroup){
    strategy::CompositeClassifier cls;
    auto m = firing({"skewing", "rip", "wing_skew_30d", "borrow_term"});
    auto r = cls.classify(m, normal());
    EXPECT_EQ(r.counts.groups_firing, 3);
    EXPECT_EQ(r.composite, Composite::MultiSignalStrong);
    EXPECT_EQ(cls.classify(m, vix_discount()).composite, Composite::FearBounceStrong);

    // four groups override the discount
    m = firing({"skewing", "rip", "wing_skew_30d", "borrow_term", "iv_momentum"});
    EXPECT_EQ(cls.classify(m, vix_discount()).composite, Composite::MultiSignalStrong);
}

TEST(CompositeClassifier, IndependentGroups){
    strategy::CompositeClassifier cls;
    EXPECT_EQ(cls.classify(firing({"borrow_term", "borrow_spread", "wing_skew_10d"}), normal()).composite,
              Composite::FundingStress);
    EXPECT_EQ(cls.classify(firing({"wing_skew_30d", "wing_skew_10d", "iv_momentum"}), normal()).composite,
              Composite::WingPanic);
    EXPECT_EQ(cls.classify(firing({"iv_momentum", "contango_change", "borrow_spread"}), normal()).composite,
              Composite::VolAcceleration);
    // one group alone is not enough
    EXPECT_FALSE(cls.classify(firing({"borrow_term", "borrow_spread"}), normal()).composite.has_value());
}

TEST(CompositeClassifier, CorePair){
    strategy::CompositeClassifier cls;
    EXPECT_EQ(cls.classify(firing({"skewing", "credit_spread"}), normal()).composite, Composite::FearBounceLong);
}

TEST(CompositeClassifier, Intraday){
    strategy::CompositeClassifier cls;
    EXPECT_EQ(cls.classify(firing({"skewing", "rip", "contango", "wing_skew_30d"}), normal(), true).composite,
              Composite::DirectionalBearish);
    EXPECT_EQ(cls.classify(firing({"skewing", "rip"}), normal(), true).composite,
              Composite::DirectionalBearishWeak);
    EXPECT_EQ(cls.classify(firing({"wing_skew_30d", "borrow_term"}), normal(), true).composite,
              Composite::DirectionalBearishWeak);
}

TEST(CompositeClassifier, TierOneOrderIsCanonical){
    auto m = firing({"zz_custom", "rip", "skewing", "borrow_term"});
    auto t1 = strategy::CompositeClassifier::tier1_firing(m);
    ASSERT_EQ(t1.size(), 4u);
    EXPECT_EQ(t1[0], "skewing");
    EXPECT_EQ(t1[1], "rip");
    EXPECT_EQ(t1[2], "borrow_term");
    EXPECT_EQ(t1[3], "zz_custom");
}

TEST(CompositeClassifier, RuleTablesAreInspectable){
    const auto& daily = strategy::CompositeClassifier::rules(false);
    ASSERT_EQ(daily.size(), 8u);
    EXPECT_STREQ(daily.front().name, "multi_group_vix_discount");
    EXPECT_STREQ(daily.back().name, "core_pair");
    EXPECT_EQ(daily.back().outcome, Composite::FearBounceLong);

    strategy::CascadeState st;
    st.counts.funding = 2;
    st.counts.groups_firing = 2;
    int matched = -1;
    for (size_t i = 0; i < daily.size(); ++i)
        if (daily[i].when(st)){ matched = static_cast<int>(i); break; }
    ASSERT_GE(matched, 0);
    EXPECT_EQ(daily[matched].outcome, Composite::FundingStress);

    EXPECT_EQ(strategy::CompositeClassifier::rules(true).size(), 2u);
}

TEST(CompositeClassifier, IsPure){
    strategy::CompositeClassifier cls;
    auto m = firing({"skewing", "rip", "wing_skew_30d"});
    auto a = cls.classify(m, opex());
    auto b = cls.classify(m, opex());
    EXPECT_EQ(a.composite, b.composite);
    EXPECT_EQ(a.tier1_firing, b.tier1_firing);
}

TEST(CompositeClassifier, GroupListsComeFromConfig){
    auto m = firing({"skewing", "rip", "wing_skew_30d"});
    EXPECT_EQ(strategy::CompositeClassifier().classify(m, normal()).composite, Composite::FearBounceLong);

    core::SignalConfig cfg;
    cfg.core_signals = {"skewing", "rip", "wing_skew_30d"};
    strategy::CompositeClassifier cls(cfg);
    auto r = cls.classify(m, normal());
    EXPECT_EQ(r.counts.core, 3);
    EXPECT_EQ(r.counts.groups_firing, 2);
    EXPECT_EQ(r.composite, Composite::FearBounceStrong);
}
