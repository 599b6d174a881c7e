#pragma once
#include <optional>
#include <utility>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace strategy {

// Signal-group picture behind the core count; enables composite bonuses
struct SelectionContext {
    std::optional<core::Composite> composite;
    int groups_firing{0};
    int wing{0};
    int fund{0};
    int mom{0};
};

inline SelectionContext context_from(const core::CompositeResult& r){
    return {r.composite, r.counts.groups_firing, r.counts.wing, r.counts.funding, r.counts.momentum};
}

// Scores every catalog structure from IV rank, 25/75-delta skew and
// contango, plus composite bonuses when a context is given.
class StructureSelector {
public:
    explicit StructureSelector(core::SelectorConfig cfg = {}) : cfg_(std::move(cfg)) {}

    const core::SelectorConfig& config() const { return cfg_; }

    // Every structure exactly once, highest score first; ties keep catalog order.
    std::vector<core::StructureScore> rank(const core::MarketSnapshot& snap,
                                           int core_count,
                                           std::optional<double> iv_rank_override = std::nullopt,
                                           const std::optional<SelectionContext>& ctx = std::nullopt) const;

    core::StructureScore select_top(const core::MarketSnapshot& snap,
                                    int core_count,
                                    std::optional<double> iv_rank_override = std::nullopt,
                                    const std::optional<SelectionContext>& ctx = std::nullopt) const;

    double iv_rank_of(const core::MarketSnapshot& snap, std::optional<double> iv_rank_override) const;

private:
    const core::StructureBonuses* bonuses_for(const SelectionContext& ctx, double iv_rank) const;

    core::SelectorConfig cfg_;
};

} // namespace strategy
