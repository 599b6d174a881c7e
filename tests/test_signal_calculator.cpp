#include <gtest/gtest.h>
#include <cmath>
#include <set>
#include "indicators/signal_calculator.hpp"

using core::MarketSnapshot;
using core::ReferenceState;
using core::SignalLevel;

namespace {

core::SignalMap run(const MarketSnapshot& s, const ReferenceState& ref = {},
                    const std::optional<core::CreditQuad>& credit = std::nullopt){
    ind::SignalCalculator calc;
    return calc.compute_signals("SPY", s, ref, credit);
}

}

TEST(SignalCalculator, EmptySnapshotYieldsAllKeysNeutral){
    auto out = run(MarketSnapshot{});
    ASSERT_EQ(out.size(), 19u);
    for (const auto& k : ind::signal_order()){
        ASSERT_TRUE(out.count(k)) << k;
        EXPECT_EQ(out.at(k).level, SignalLevel::Ok) << k;
        EXPECT_TRUE(std::isfinite(out.at(k).value)) << k;
        EXPECT_EQ(out.at(k).key, k);
        EXPECT_FALSE(out.at(k).label.empty());
    }
    EXPECT_DOUBLE_EQ(out.at("fbfwd30_20").value, 1.0);
}

TEST(SignalCalculator, OrderCoversNineteenDistinctKeys){
    const auto& order = ind::signal_order();
    ASSERT_EQ(order.size(), 19u);
    std::set<std::string> uniq(order.begin(), order.end());
    EXPECT_EQ(uniq.size(), 19u);
}

TEST(SignalCalculator, CoreLevelsFireAboveThreshold){
    auto out = run({{"skewing", 0.06}, {"rip", 75.123}});
    EXPECT_EQ(out.at("skewing").level, SignalLevel::Action);
    EXPECT_EQ(out.at("skewing").tier, 1);
    EXPECT_EQ(out.at("rip").level, SignalLevel::Action);
    EXPECT_DOUBLE_EQ(out.at("rip").value, 75.12);

    out = run({{"skewing", 0.05}, {"rip", 70.0}});
    EXPECT_EQ(out.at("skewing").level, SignalLevel::Ok);
    EXPECT_EQ(out.at("rip").level, SignalLevel::Ok);
}

TEST(SignalCalculator, RiskReversalComparesAgainstBaseline){
    ReferenceState ref;
    ref.set_baseline({{"dlt25Iv30d", 0.30}, {"dlt75Iv30d", 0.28}});
    auto out = run({{"dlt25Iv30d", 0.32}, {"dlt75Iv30d", 0.28}}, ref);
    const auto& rr = out.at("skew_25d_rr");
    EXPECT_EQ(rr.level, SignalLevel::Action);
    EXPECT_NEAR(rr.value, 0.04, 1e-9);
    ASSERT_TRUE(rr.baseline.has_value());
    EXPECT_NEAR(*rr.baseline, 0.02, 1e-9);
    EXPECT_NEAR(*rr.change, 0.02, 1e-9);
}

TEST(SignalCalculator, MissingBaselineMeansNoChange){
    auto out = run({{"dlt25Iv30d", 0.40}, {"dlt75Iv30d", 0.20}, {"contango", 0.05}});
    EXPECT_EQ(out.at("skew_25d_rr").level, SignalLevel::Ok);
    EXPECT_DOUBLE_EQ(*out.at("skew_25d_rr").change, 0.0);
    EXPECT_EQ(out.at("contango").level, SignalLevel::Ok);
}

TEST(SignalCalculator, ContangoCollapseAndInversion){
    ReferenceState ref;
    ref.set_baseline({{"contango", 0.10}});
    auto out = run({{"contango", 0.04}}, ref);
    EXPECT_EQ(out.at("contango").level, SignalLevel::Action);
    EXPECT_NEAR(*out.at("contango").change, -0.6, 1e-9);

    out = run({{"contango", -0.01}});
    EXPECT_EQ(out.at("contango").level, SignalLevel::Action);

    // tiny baseline: percentage change is not computed
    ref.set_baseline({{"contango", 0.0005}});
    out = run({{"contango", 0.0001}}, ref);
    EXPECT_EQ(out.at("contango").level, SignalLevel::Ok);
    EXPECT_DOUBLE_EQ(*out.at("contango").change, 0.0);
}

TEST(SignalCalculator, CreditSignal){
    ind::SignalCalculator calc;
    auto cs = calc.compute_credit_signal(100.0, 100.0, 101.0, 100.0);
    ASSERT_EQ(cs.size(), 1u);
    EXPECT_EQ(cs.at("credit_spread").level, SignalLevel::Action);
    EXPECT_NEAR(cs.at("credit_spread").value, -0.0099, 1e-9);

    EXPECT_TRUE(calc.compute_credit_signal(100.0, 100.0, 0.0, 100.0).empty());
    EXPECT_TRUE(calc.compute_credit_signal(0.0, 100.0, 101.0, 100.0).empty());
    EXPECT_TRUE(calc.compute_credit_signal(100.0, 100.0, 100.0, 0.0).empty());

    cs = calc.compute_credit_signal(core::CreditQuad{100.0, 100.0, 100.2, 100.0});
    ASSERT_EQ(cs.size(), 1u);
    EXPECT_EQ(cs.at("credit_spread").level, SignalLevel::Ok);
}

TEST(SignalCalculator, CreditQuadFlowsIntoSignalSet){
    auto out = run({}, {}, core::CreditQuad{100.0, 100.0, 101.0, 100.0});
    EXPECT_EQ(out.size(), 19u);
    EXPECT_EQ(out.at("credit_spread").level, SignalLevel::Action);

    out = run({}, {}, core::CreditQuad{100.0, 100.0, 0.0, 100.0});
    EXPECT_EQ(out.size(), 19u);
    EXPECT_EQ(out.at("credit_spread").level, SignalLevel::Ok);
    EXPECT_DOUBLE_EQ(out.at("credit_spread").value, 0.0);
}

TEST(SignalCalculator, WingSkewNeedsBothLegs){
    auto out = run({{"dlt95Iv30d", 0.45}, {"dlt5Iv30d", 0.25}, {"dlt95Iv10d", 0.50}});
    EXPECT_EQ(out.at("wing_skew_30d").level, SignalLevel::Action);
    EXPECT_NEAR(out.at("wing_skew_30d").value, 0.2, 1e-9);
    EXPECT_EQ(out.at("wing_skew_10d").level, SignalLevel::Ok);
    EXPECT_DOUBLE_EQ(out.at("wing_skew_10d").value, 0.0);
}

TEST(SignalCalculator, FundingStress){
    auto out = run({{"borrow30", 0.06}, {"borrow2y", 0.05}, {"riskFree30", 0.015}});
    EXPECT_EQ(out.at("borrow_term").level, SignalLevel::Action);
    EXPECT_EQ(out.at("borrow_spread").level, SignalLevel::Action);

    out = run({{"borrow30", 0.06}, {"riskFree30", 0.04}});
    EXPECT_EQ(out.at("borrow_term").level, SignalLevel::Ok);
    EXPECT_DOUBLE_EQ(out.at("borrow_term").value, 0.0);
    EXPECT_EQ(out.at("borrow_spread").level, SignalLevel::Ok);
}

TEST(SignalCalculator, MomentumAgainstPreviousDay){
    ReferenceState ref;
    ref.set_previous_day({{"iv30d", 0.20}, {"skewing", 0.01}, {"contango", 0.08}});
    auto out = run({{"iv30d", 0.21}, {"skewing", 0.04}, {"contango", 0.04}}, ref);
    EXPECT_EQ(out.at("iv_momentum").level, SignalLevel::Action);
    EXPECT_NEAR(*out.at("iv_momentum").previous_value, 0.20, 1e-9);
    EXPECT_EQ(out.at("skewing_change").level, SignalLevel::Action);
    EXPECT_EQ(out.at("contango_change").level, SignalLevel::Action);
    EXPECT_NEAR(out.at("contango_change").value, -0.04, 1e-9);
}

TEST(SignalCalculator, MissingPreviousValueMeansNoMomentum){
    ReferenceState ref;
    ref.set_previous_day({{"rip", 60.0}});
    auto out = run({{"iv30d", 0.35}, {"skewing", 0.09}, {"contango", -0.05}}, ref);
    for (auto k : {"iv_momentum", "skewing_change", "contango_change"}){
        EXPECT_EQ(out.at(k).level, SignalLevel::Ok) << k;
        EXPECT_DOUBLE_EQ(*out.at(k).change, 0.0) << k;
        EXPECT_DOUBLE_EQ(*out.at(k).previous_value, 0.0) << k;
    }
}

TEST(SignalCalculator, NoPreviousDayMeansNoMomentum){
    auto out = run({{"iv30d", 0.35}, {"skewing", 0.04}, {"contango", 0.04}});
    EXPECT_EQ(out.at("iv_momentum").level, SignalLevel::Ok);
    EXPECT_EQ(out.at("skewing_change").level, SignalLevel::Ok);
    EXPECT_EQ(out.at("contango_change").level, SignalLevel::Ok);
}

TEST(SignalCalculator, SecondarySignalsUseLowerTiers){
    ReferenceState ref;
    ref.set_baseline({{"iv30d", 0.20}});
    ref.set_previous_day({{"rDrv30", 0.10}, {"rSlp30", 0.1}});
    auto out = run({{"fbfwd30_20", 1.10}, {"confidence", 0.90}, {"mwAdj30", 0.002},
                    {"iv10d", 0.25}, {"iv30d", 0.20}, {"fwd30_20", 0.22}, {"fwd60_30", 0.20},
                    {"rDrv30", 0.12}, {"rSlp30", 0.5}}, ref);
    EXPECT_EQ(out.at("fbfwd30_20").level, SignalLevel::Warning);
    EXPECT_EQ(out.at("fbfwd30_20").tier, 2);
    EXPECT_EQ(out.at("model_confidence").level, SignalLevel::Warning);
    EXPECT_EQ(out.at("mw_adj_30").level, SignalLevel::Warning);
    EXPECT_EQ(out.at("iv10_iv30").level, SignalLevel::Warning);
    EXPECT_NEAR(out.at("iv10_iv30").value, 1.25, 1e-9);
    EXPECT_EQ(out.at("rSlp30").level, SignalLevel::Warning);
    EXPECT_EQ(out.at("fwd_kink").level, SignalLevel::Info);
    EXPECT_EQ(out.at("fwd_kink").tier, 3);
    EXPECT_EQ(out.at("rDrv30").level, SignalLevel::Info);
}

TEST(SignalCalculator, GuardedDenominators){
    auto out = run({{"iv10d", 0.25}, {"iv30d", 0.005}, {"confidence", 0.0}});
    EXPECT_DOUBLE_EQ(out.at("iv10_iv30").value, 0.0);
    EXPECT_EQ(out.at("iv10_iv30").level, SignalLevel::Ok);
    EXPECT_EQ(out.at("model_confidence").level, SignalLevel::Ok);
}

TEST(SignalCalculator, ThresholdsComeFromConfig){
    core::SignalConfig cfg;
    cfg.skewing_thresh = 0.10;
    ind::SignalCalculator calc(cfg);
    auto out = calc.compute_signals("SPY", {{"skewing", 0.06}}, {});
    EXPECT_EQ(out.at("skewing").level, SignalLevel::Ok);
}
