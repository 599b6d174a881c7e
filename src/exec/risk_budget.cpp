#include "exec/risk_budget.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

using core::Composite;
using core::SignalStrength;

namespace exec {

static double round_cents(double v){ return std::round(v * 100.0) / 100.0; }
static double floor_cents(double v){ return std::floor(v * 100.0) / 100.0; }

double RiskBudgetSizer::core_multiplier(int core_count) const {
    auto it = cfg_.core_multipliers.find(core_count);
    return it == cfg_.core_multipliers.end() ? 1.0 : it->second;
}

double RiskBudgetSizer::composite_multiplier(std::optional<Composite> composite) const {
    if (!composite) return 1.0;
    auto it = cfg_.composite_multipliers.find(*composite);
    return it == cfg_.composite_multipliers.end() ? 1.0 : it->second;
}

SignalStrength RiskBudgetSizer::classify_strength(int core_count, int groups_firing,
                                                  std::optional<Composite> composite){
    const bool independent = composite && (*composite == Composite::FundingStress ||
                                           *composite == Composite::WingPanic ||
                                           *composite == Composite::VolAcceleration);
    if ((composite && *composite == Composite::MultiSignalStrong) || groups_firing >= 3 || core_count >= 5)
        return SignalStrength::Extreme;
    if (core_count >= 4 || (core_count >= 3 && groups_firing >= 2)) return SignalStrength::VeryStrong;
    if (core_count >= 3 || independent) return SignalStrength::Strong;
    if (core_count >= 2 || groups_firing >= 2) return SignalStrength::Moderate;
    return SignalStrength::None;
}

RiskBudgetResult RiskBudgetSizer::compute(int core_count, std::optional<Composite> composite,
                                          int groups_firing, int wing_count, int fund_count, int mom_count,
                                          std::optional<double> capital_override,
                                          double calendar_modifier) const {
    RiskBudgetResult r;
    r.capital = capital_for(capital_override);
    r.core_count = core_count;
    r.groups_firing = groups_firing;
    r.composite = composite;
    r.calendar_modifier = calendar_modifier;

    const double base_risk = r.capital * cfg_.base_risk_pct;
    const double max_risk  = r.capital * cfg_.max_risk_pct;

    r.core_multiplier = core_multiplier(core_count);
    // setups driven by wing/funding/momentum must not be sized to nothing
    const int total = core_count + wing_count + fund_count + mom_count;
    if (core_count < 2 && total >= cfg_.non_core_floor_min_signals)
        r.core_multiplier = std::max(r.core_multiplier, cfg_.non_core_floor);

    r.composite_multiplier = composite_multiplier(composite);
    r.group_bonus = 1.0 + std::max(0, groups_firing - 1) * cfg_.group_bonus_pct;
    r.multiplier = r.core_multiplier * r.composite_multiplier * r.group_bonus * calendar_modifier;

    const double raw = base_risk * r.multiplier;
    // largest whole-cent amount not above max_risk
    const double near_cap = round_cents(max_risk);
    const double cap = std::max(0.0, near_cap <= max_risk ? near_cap : floor_cents(max_risk));
    r.risk_budget = std::clamp(round_cents(raw), 0.0, cap);
    r.base_risk = round_cents(base_risk);
    r.strength = classify_strength(core_count, groups_firing, composite);

    spdlog::debug("risk budget {:.2f} = {:.2f} x {:.4f} (core {:.2f}, composite {:.2f}, groups {:.2f}, cal {:.2f}), cap {:.2f}",
                  r.risk_budget, base_risk, r.multiplier, r.core_multiplier, r.composite_multiplier,
                  r.group_bonus, calendar_modifier, max_risk);
    return r;
}

} // namespace exec
