#pragma once
#include <string>
#include <utility>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace strategy {

// Everything a cascade rule may look at
struct CascadeState {
    core::GroupCounts counts;
    bool vix_discount{false};     // VIX-expiry discount without an OpEx overlap
    bool opex_amplifier{false};
    int composite_min{3};
    int composite_min_vix{4};

    int core_threshold() const { return vix_discount ? composite_min_vix : composite_min; }
};

struct CompositeRule {
    const char* name;
    bool (*when)(const CascadeState&);
    core::Composite outcome;
};

// Fuses ACTION counts per signal group and the calendar context into one
// composite verdict. Rules are evaluated top to bottom, first match wins.
class CompositeClassifier {
public:
    explicit CompositeClassifier(core::SignalConfig cfg = {}) : cfg_(std::move(cfg)) {}

    core::CompositeResult classify(const core::SignalMap& signals,
                                   const core::CalendarContext& calendar,
                                   bool intraday = false) const;

    core::GroupCounts count_groups(const core::SignalMap& signals) const;

    static std::vector<std::string> tier1_firing(const core::SignalMap& signals);
    static const std::vector<CompositeRule>& rules(bool intraday);

private:
    core::SignalConfig cfg_;
};

} // namespace strategy
