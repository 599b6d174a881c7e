#include "strategy/structure_selector.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using core::StructureScore;
using core::TradeStructure;

namespace strategy {

namespace {

// Collects points and the conditions that produced them
struct Tally {
    double score{0.0};
    std::vector<std::string> why;

    void add(bool cond, double pts, std::string reason){
        if (!cond) return;
        score += pts;
        why.push_back(std::move(reason));
    }

    std::string reason() const {
        if (why.empty()) return "no qualifying conditions";
        std::string out;
        for (size_t i = 0; i < why.size(); ++i){
            if (i) out += "; ";
            out += why[i];
        }
        return out;
    }
};

} // namespace

double StructureSelector::iv_rank_of(const core::MarketSnapshot& snap, std::optional<double> iv_rank_override) const {
    if (iv_rank_override) return *iv_rank_override;
    return snap.has("ivRank1m") ? snap.get("ivRank1m") : cfg_.default_iv_rank;
}

const core::StructureBonuses* StructureSelector::bonuses_for(const SelectionContext& ctx, double iv_rank) const {
    if (!ctx.composite) return nullptr;
    if (*ctx.composite == core::Composite::VolAcceleration && iv_rank <= cfg_.mid_iv_rank)
        return &cfg_.vol_accel_low_iv_bonuses;
    auto it = cfg_.composite_bonuses.find(*ctx.composite);
    return it == cfg_.composite_bonuses.end() ? nullptr : &it->second;
}

std::vector<StructureScore> StructureSelector::rank(const core::MarketSnapshot& snap, int core_count,
                                                    std::optional<double> iv_rank_override,
                                                    const std::optional<SelectionContext>& ctx) const {
    const double iv = iv_rank_of(snap, iv_rank_override);
    const double skew = snap.get("dlt25Iv30d") - snap.get("dlt75Iv30d");
    const double contango = snap.get("contango");
    const int groups = ctx ? ctx->groups_firing : 0;
    const auto& p = cfg_.points;
    const auto* bonuses = ctx ? bonuses_for(*ctx, iv) : nullptr;

    const bool high_iv = iv > cfg_.high_iv_rank;
    const bool low_iv = iv < cfg_.low_iv_rank;
    const bool steep = skew > cfg_.high_skew;
    const bool strong = core_count >= cfg_.strong_signal_min;
    const bool multi = groups >= cfg_.multi_group_min;

    const auto iv_gt  = [&](double t){ return fmt::format("IV rank {:g} > {:g}", iv, t); };
    const auto iv_lt  = [&](double t){ return fmt::format("IV rank {:g} < {:g}", iv, t); };
    const auto sk_gt  = [&](double t){ return fmt::format("skew {:.4f} > {:.4f}", skew, t); };
    const auto ct_gt  = [&](double t){ return fmt::format("contango {:.4f} > {:.4f}", contango, t); };
    const auto ct_lt  = [&](double t){ return fmt::format("contango {:.4f} < {:.4f}", contango, t); };
    const auto core_s = [&]{ return fmt::format("core signals {} >= {}", core_count, cfg_.strong_signal_min); };
    const auto core_or_groups = [&]{
        return strong ? core_s() : fmt::format("groups firing {} >= {}", groups, cfg_.multi_group_min);
    };

    std::vector<StructureScore> out;
    out.reserve(core::structure_catalog().size());
    for (auto t : core::structure_catalog()){
        Tally s;
        if (bonuses){
            auto it = bonuses->find(t);
            if (it != bonuses->end() && it->second != 0.0)
                s.add(true, it->second, fmt::format("{} {:+g}", core::to_string(*ctx->composite), it->second));
        }
        switch (t){
            case TradeStructure::BullPutSpread:
                s.add(high_iv, p.bps_high_iv, iv_gt(cfg_.high_iv_rank));
                s.add(steep, p.bps_steep_skew, sk_gt(cfg_.high_skew));
                s.add(contango > cfg_.contango_rich, p.bps_contango, ct_gt(cfg_.contango_rich));
                break;
            case TradeStructure::LongCall:
                s.add(low_iv, p.lc_low_iv, iv_lt(cfg_.low_iv_rank));
                s.add(strong, p.lc_strong_signal, core_s());
                s.add(contango < cfg_.contango_positive, p.lc_flat_contango, ct_lt(cfg_.contango_positive));
                break;
            case TradeStructure::CallDebitSpread:
                s.add(true, p.cds_base, "base");
                s.add(iv >= cfg_.low_iv_rank && iv <= cfg_.high_iv_rank, p.cds_mid_iv,
                      fmt::format("IV rank {:g} in [{:g}, {:g}]", iv, cfg_.low_iv_rank, cfg_.high_iv_rank));
                s.add(skew >= cfg_.moderate_skew && skew <= cfg_.high_skew, p.cds_moderate_skew,
                      fmt::format("skew {:.4f} in [{:.4f}, {:.4f}]", skew, cfg_.moderate_skew, cfg_.high_skew));
                break;
            case TradeStructure::CallRatioSpread:
                s.add(strong || multi, p.crs_strong_signal, core_or_groups());
                s.add(iv > cfg_.mid_iv_rank, p.crs_iv, iv_gt(cfg_.mid_iv_rank));
                s.add(skew > cfg_.moderate_skew, p.crs_skew, sk_gt(cfg_.moderate_skew));
                break;
            case TradeStructure::BrokenWingButterfly:
                if (core_count >= cfg_.extreme_signal_min || (strong && multi))
                    s.add(true, p.bwb_extreme_signal,
                          fmt::format("core signals {}, groups firing {}", core_count, groups));
                else
                    s.add(strong, p.bwb_strong_signal, core_s());
                s.add(iv > cfg_.pin_iv_low && iv < cfg_.pin_iv_high, p.bwb_pin_iv,
                      fmt::format("IV rank {:g} in ({:g}, {:g})", iv, cfg_.pin_iv_low, cfg_.pin_iv_high));
                break;
            case TradeStructure::PutDebitSpread:
                s.add(high_iv, p.pds_high_iv, iv_gt(cfg_.high_iv_rank));
                s.add(steep, p.pds_steep_skew, sk_gt(cfg_.high_skew));
                s.add(contango < cfg_.contango_flat, p.pds_flat_contango, ct_lt(cfg_.contango_flat));
                break;
            case TradeStructure::LongPut:
                s.add(low_iv, p.lput_low_iv, iv_lt(cfg_.low_iv_rank));
                s.add(strong || multi, p.lput_strong_signal, core_or_groups());
                s.add(contango < cfg_.contango_flat, p.lput_flat_contango, ct_lt(cfg_.contango_flat));
                break;
            case TradeStructure::BearCallSpread:
                s.add(high_iv, p.bcs_high_iv, iv_gt(cfg_.high_iv_rank));
                s.add(steep, p.bcs_steep_skew, sk_gt(cfg_.high_skew));
                s.add(contango < cfg_.contango_flat, p.bcs_flat_contango, ct_lt(cfg_.contango_flat));
                break;
            case TradeStructure::IronButterfly:
                s.add(high_iv, p.ifly_high_iv, iv_gt(cfg_.high_iv_rank));
                s.add(std::fabs(skew) < cfg_.flat_skew, p.ifly_flat_skew,
                      fmt::format("|skew| {:.4f} < {:.4f}", std::fabs(skew), cfg_.flat_skew));
                s.add(contango > cfg_.contango_rich, p.ifly_contango, ct_gt(cfg_.contango_rich));
                break;
            case TradeStructure::ShortIronCondor:
                s.add(iv > cfg_.mid_iv_rank, p.sic_iv, iv_gt(cfg_.mid_iv_rank));
                s.add(std::fabs(skew) < cfg_.high_skew, p.sic_skew,
                      fmt::format("|skew| {:.4f} < {:.4f}", std::fabs(skew), cfg_.high_skew));
                s.add(contango > cfg_.contango_positive, p.sic_contango, ct_gt(cfg_.contango_positive));
                s.add(core_count <= cfg_.weak_core_max && groups <= cfg_.weak_groups_max, p.sic_weak_signal,
                      fmt::format("weak signal (core {}, groups {})", core_count, groups));
                break;
        }
        out.push_back({t, s.score, s.reason()});
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const StructureScore& a, const StructureScore& b){ return a.score > b.score; });
    spdlog::debug("structure rank: iv {:g} skew {:.4f} contango {:.4f} -> {} ({:g})",
                  iv, skew, contango, core::to_string(out.front().structure), out.front().score);
    return out;
}

StructureScore StructureSelector::select_top(const core::MarketSnapshot& snap, int core_count,
                                             std::optional<double> iv_rank_override,
                                             const std::optional<SelectionContext>& ctx) const {
    return rank(snap, core_count, iv_rank_override, ctx).front();
}

} // namespace strategy
