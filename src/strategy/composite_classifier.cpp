#include "strategy/composite_classifier.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "indicators/signal_calculator.hpp"

using core::Composite;
using core::SignalLevel;
using core::SignalMap;

namespace strategy {

namespace {

bool is_action(const SignalMap& signals, const std::string& key){
    auto it = signals.find(key);
    return it != signals.end() && it->second.level == SignalLevel::Action;
}

int count_action(const SignalMap& signals, const std::vector<std::string>& keys){
    return static_cast<int>(std::count_if(keys.begin(), keys.end(),
                            [&](const std::string& k){ return is_action(signals, k); }));
}

} // namespace

const std::vector<CompositeRule>& CompositeClassifier::rules(bool intraday){
    static const std::vector<CompositeRule> daily{
        {"multi_group_vix_discount",
         [](const CascadeState& s){ return s.counts.groups_firing >= 3 && s.vix_discount && s.counts.groups_firing < 4; },
         Composite::FearBounceStrong},
        {"multi_group",
         [](const CascadeState& s){ return s.counts.groups_firing >= 3; },
         Composite::MultiSignalStrong},
        {"core_strong_opex",
         [](const CascadeState& s){ return s.counts.core >= s.core_threshold() && s.opex_amplifier; },
         Composite::FearBounceStrongOpex},
        {"core_strong",
         [](const CascadeState& s){ return s.counts.core >= s.core_threshold(); },
         Composite::FearBounceStrong},
        {"funding_stress",
         [](const CascadeState& s){ return s.counts.funding >= 2 && s.counts.groups_firing >= 2; },
         Composite::FundingStress},
        {"wing_panic",
         [](const CascadeState& s){ return s.counts.wing >= 2 && s.counts.groups_firing >= 2; },
         Composite::WingPanic},
        {"vol_acceleration",
         [](const CascadeState& s){ return s.counts.momentum >= 2 && s.counts.groups_firing >= 2; },
         Composite::VolAcceleration},
        {"core_pair",
         [](const CascadeState& s){ return s.counts.core >= 2; },
         Composite::FearBounceLong},
    };
    // intraday reads the same fear as bearish
    static const std::vector<CompositeRule> live{
        {"bearish",
         [](const CascadeState& s){
             return s.counts.groups_firing >= 3 || (s.counts.core >= s.composite_min && s.counts.groups_firing >= 2);
         },
         Composite::DirectionalBearish},
        {"bearish_weak",
         [](const CascadeState& s){ return s.counts.core >= 2 || s.counts.groups_firing >= 2; },
         Composite::DirectionalBearishWeak},
    };
    return intraday ? live : daily;
}

std::vector<std::string> CompositeClassifier::tier1_firing(const SignalMap& signals){
    std::vector<std::string> out;
    auto fires = [](const core::SignalRecord& r){ return r.tier == 1 && r.level == SignalLevel::Action; };
    const auto& order = ind::signal_order();
    for (const auto& k : order){
        auto it = signals.find(k);
        if (it != signals.end() && fires(it->second)) out.push_back(k);
    }
    for (const auto& [k, r] : signals){
        if (!fires(r)) continue;
        if (std::find(order.begin(), order.end(), k) == order.end()) out.push_back(k);
    }
    return out;
}

core::GroupCounts CompositeClassifier::count_groups(const SignalMap& signals) const {
    core::GroupCounts g;
    g.core     = count_action(signals, cfg_.core_signals);
    g.wing     = count_action(signals, cfg_.wing_signals);
    g.funding  = count_action(signals, cfg_.funding_signals);
    g.momentum = count_action(signals, cfg_.momentum_signals);
    g.groups_firing = (g.core >= 2) + (g.wing >= 1) + (g.funding >= 1) + (g.momentum >= 1);
    return g;
}

core::CompositeResult CompositeClassifier::classify(const SignalMap& signals,
                                                    const core::CalendarContext& calendar,
                                                    bool intraday) const {
    core::CompositeResult res;
    res.tier1_firing = tier1_firing(signals);
    res.counts = count_groups(signals);

    if (res.tier1_firing.size() < 2) return res;
    if (calendar.fomc_blackout){
        spdlog::debug("composite suppressed: FOMC blackout ({} tier-1 firing)", res.tier1_firing.size());
        return res;
    }

    CascadeState st;
    st.counts = res.counts;
    st.vix_discount = calendar.vixpiration_discount && !calendar.opex_amplifier;
    st.opex_amplifier = calendar.opex_amplifier;
    st.composite_min = cfg_.composite_min;
    st.composite_min_vix = cfg_.composite_min_vix;

    for (const auto& rule : rules(intraday)){
        if (!rule.when(st)) continue;
        res.composite = rule.outcome;
        spdlog::debug("composite {} via {} (core={} wing={} fund={} mom={} groups={})",
                      core::to_string(rule.outcome), rule.name, st.counts.core, st.counts.wing,
                      st.counts.funding, st.counts.momentum, st.counts.groups_firing);
        break;
    }
    return res;
}

} // namespace strategy
