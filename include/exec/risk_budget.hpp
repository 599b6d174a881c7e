#pragma once
#include <optional>
#include <utility>
#include "core/config.hpp"
#include "core/types.hpp"

namespace exec {

struct RiskBudgetResult {
    double risk_budget{0.0};
    double base_risk{0.0};
    double multiplier{1.0};
    double core_multiplier{1.0};
    double composite_multiplier{1.0};
    double group_bonus{1.0};
    double calendar_modifier{1.0};
    int core_count{0};
    int groups_firing{0};
    std::optional<core::Composite> composite;
    core::SignalStrength strength{core::SignalStrength::None};
    double capital{0.0};
};

// Signal-weighted sizing:
//   budget = min(capital * base_pct * core * composite * group_bonus * calendar,
//                capital * max_pct)
class RiskBudgetSizer {
public:
    explicit RiskBudgetSizer(core::SizingConfig cfg = {}) : cfg_(std::move(cfg)) {}

    const core::SizingConfig& config() const { return cfg_; }

    RiskBudgetResult compute(int core_count,
                             std::optional<core::Composite> composite = std::nullopt,
                             int groups_firing = 0,
                             int wing_count = 0,
                             int fund_count = 0,
                             int mom_count = 0,
                             std::optional<double> capital_override = std::nullopt,
                             double calendar_modifier = 1.0) const;

    RiskBudgetResult compute(const core::CompositeResult& composite,
                             const core::CalendarContext& calendar,
                             std::optional<double> capital_override = std::nullopt) const {
        const auto& g = composite.counts;
        return compute(g.core, composite.composite, g.groups_firing, g.wing, g.funding, g.momentum,
                       capital_override, calendar.modifier);
    }

    // Portfolio-level cap on total risk deployed in one day
    double max_daily_budget(std::optional<double> capital_override = std::nullopt) const {
        return capital_for(capital_override) * cfg_.max_daily_risk_pct;
    }

    double core_multiplier(int core_count) const;
    double composite_multiplier(std::optional<core::Composite> composite) const;

    static core::SignalStrength classify_strength(int core_count, int groups_firing,
                                                  std::optional<core::Composite> composite);

private:
    double capital_for(std::optional<double> capital_override) const {
        return (capital_override && *capital_override > 0.0) ? *capital_override : cfg_.account_capital;
    }

    core::SizingConfig cfg_;
};

} // namespace exec
