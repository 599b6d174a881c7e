#include "core/config.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core {

std::vector<TradeDate> default_fomc_dates(){
    // FOMC statement days
    return {
        {2024, 1, 31}, {2024, 3, 20}, {2024, 5, 1},  {2024, 6, 12},
        {2024, 7, 31}, {2024, 9, 18}, {2024, 11, 7}, {2024, 12, 18},
        {2025, 1, 29}, {2025, 3, 19}, {2025, 5, 7},  {2025, 6, 18},
        {2025, 7, 30}, {2025, 9, 17}, {2025, 10, 29}, {2025, 12, 10},
        {2026, 1, 28}, {2026, 3, 18}, {2026, 4, 29}, {2026, 6, 17},
        {2026, 7, 29}, {2026, 9, 16}, {2026, 10, 28}, {2026, 12, 9},
    };
}

std::map<Composite, StructureBonuses> default_composite_bonuses(){
    using T = TradeStructure;
    return {
        // stress premium: sell it, don't pay it
        {Composite::FundingStress, {{T::BullPutSpread, 3.0}, {T::BearCallSpread, 2.5},
                                    {T::ShortIronCondor, 2.0}, {T::IronButterfly, 1.5},
                                    {T::LongCall, -1.0}, {T::LongPut, -1.0}}},
        // put-wing panic leaves the call wing cheap
        {Composite::WingPanic, {{T::LongCall, 3.0}, {T::CallDebitSpread, 2.5},
                                {T::CallRatioSpread, 2.0}, {T::BullPutSpread, -1.5},
                                {T::ShortIronCondor, -2.0}}},
        // vol momentum from an elevated base tends to revert
        {Composite::VolAcceleration, {{T::IronButterfly, 3.0}, {T::ShortIronCondor, 2.5},
                                      {T::BullPutSpread, 2.0}, {T::BearCallSpread, 1.5}}},
        {Composite::MultiSignalStrong, {{T::CallRatioSpread, 2.5}, {T::BrokenWingButterfly, 2.0},
                                        {T::LongCall, 1.5}}},
        {Composite::FearBounceStrong, {{T::LongCall, 1.0}, {T::CallDebitSpread, 0.5}}},
        {Composite::FearBounceStrongOpex, {{T::LongCall, 1.0}, {T::CallDebitSpread, 0.5}}},
        {Composite::FearBounceLong, {{T::CallDebitSpread, 1.5}, {T::BullPutSpread, 1.0},
                                     {T::CallRatioSpread, -1.0}, {T::BrokenWingButterfly, -1.0}}},
    };
}

StructureBonuses default_vol_accel_low_iv_bonuses(){
    return {{TradeStructure::LongCall, 2.0}, {TradeStructure::CallDebitSpread, 1.5}};
}

namespace {

template <class T>
void read(const json& j, const char* key, T& out){
    out = j.value(key, out);
}

std::optional<int> to_int(const std::string& s){
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno != 0) return std::nullopt;
    return static_cast<int>(v);
}

std::optional<double> to_double(const std::string& s){
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end == s.c_str() || *end != '\0' || errno != 0) return std::nullopt;
    return v;
}

StructureBonuses read_bonuses(const json& j){
    StructureBonuses out;
    for (auto& [name, v] : j.items()){
        auto t = parse_structure(name);
        if (!t){ spdlog::warn("config: unknown structure '{}' ignored", name); continue; }
        out[*t] = v.get<double>();
    }
    return out;
}

void read_signals(const json& j, SignalConfig& c){
    read(j, "skewing_thresh", c.skewing_thresh);
    read(j, "rip_thresh", c.rip_thresh);
    read(j, "skew_change_thresh", c.skew_change_thresh);
    read(j, "contango_drop_thresh", c.contango_drop_thresh);
    read(j, "credit_thresh", c.credit_thresh);
    read(j, "wing_skew_30d_thresh", c.wing_skew_30d_thresh);
    read(j, "wing_skew_10d_thresh", c.wing_skew_10d_thresh);
    read(j, "borrow_term_thresh", c.borrow_term_thresh);
    read(j, "borrow_spread_thresh", c.borrow_spread_thresh);
    read(j, "iv_momentum_thresh", c.iv_momentum_thresh);
    read(j, "skewing_change_thresh", c.skewing_change_thresh);
    read(j, "contango_change_thresh", c.contango_change_thresh);
    read(j, "fbfwd_high", c.fbfwd_high);
    read(j, "fbfwd_low", c.fbfwd_low);
    read(j, "slope_change_thresh", c.slope_change_thresh);
    read(j, "fwd_kink_thresh", c.fwd_kink_thresh);
    read(j, "rdrv_rise_thresh", c.rdrv_rise_thresh);
    read(j, "iv_flat_thresh", c.iv_flat_thresh);
    read(j, "model_confidence_thresh", c.model_confidence_thresh);
    read(j, "mw_adj_thresh", c.mw_adj_thresh);
    read(j, "iv10_iv30_thresh", c.iv10_iv30_thresh);
    read(j, "contango_base_min", c.contango_base_min);
    read(j, "iv30_min", c.iv30_min);
    read(j, "core_signals", c.core_signals);
    read(j, "wing_signals", c.wing_signals);
    read(j, "funding_signals", c.funding_signals);
    read(j, "momentum_signals", c.momentum_signals);
    read(j, "composite_min", c.composite_min);
    read(j, "composite_min_vix", c.composite_min_vix);
}

void read_calendar(const json& j, CalendarConfig& c){
    if (j.contains("fomc_dates")){
        std::vector<TradeDate> dates;
        for (auto& d : j["fomc_dates"]){
            auto s = d.get<std::string>();
            auto td = TradeDate::parse(s);
            if (!td){ spdlog::warn("config: bad FOMC date '{}' ignored", s); continue; }
            dates.push_back(*td);
        }
        c.fomc_dates = std::move(dates);
    }
    read(j, "fomc_blackout_days", c.fomc_blackout_days);
    read(j, "opex_window_days", c.opex_window_days);
    read(j, "vix_window_days", c.vix_window_days);
    read(j, "blackout_modifier", c.blackout_modifier);
    read(j, "vixpiration_modifier", c.vixpiration_modifier);
    read(j, "opex_modifier", c.opex_modifier);
    read(j, "normal_modifier", c.normal_modifier);
}

void read_sizing(const json& j, SizingConfig& c){
    read(j, "account_capital", c.account_capital);
    read(j, "base_risk_pct", c.base_risk_pct);
    read(j, "max_risk_pct", c.max_risk_pct);
    read(j, "max_daily_risk_pct", c.max_daily_risk_pct);
    read(j, "group_bonus_pct", c.group_bonus_pct);
    read(j, "non_core_floor", c.non_core_floor);
    read(j, "non_core_floor_min_signals", c.non_core_floor_min_signals);
    // lookup tables replace the defaults wholesale
    if (j.contains("core_multipliers")){
        std::map<int, double> m;
        for (auto& [k, v] : j["core_multipliers"].items()){
            auto n = to_int(k);
            if (!n){ spdlog::warn("config: core_multipliers key '{}' is not an integer", k); continue; }
            m[*n] = v.get<double>();
        }
        c.core_multipliers = std::move(m);
    }
    if (j.contains("composite_multipliers")){
        std::map<Composite, double> m;
        for (auto& [k, v] : j["composite_multipliers"].items()){
            auto comp = parse_composite(k);
            if (!comp){ spdlog::warn("config: unknown composite '{}' ignored", k); continue; }
            m[*comp] = v.get<double>();
        }
        c.composite_multipliers = std::move(m);
    }
}

void read_points(const json& j, SelectorPoints& p){
    read(j, "bps_high_iv", p.bps_high_iv);
    read(j, "bps_steep_skew", p.bps_steep_skew);
    read(j, "bps_contango", p.bps_contango);
    read(j, "lc_low_iv", p.lc_low_iv);
    read(j, "lc_strong_signal", p.lc_strong_signal);
    read(j, "lc_flat_contango", p.lc_flat_contango);
    read(j, "cds_base", p.cds_base);
    read(j, "cds_mid_iv", p.cds_mid_iv);
    read(j, "cds_moderate_skew", p.cds_moderate_skew);
    read(j, "crs_strong_signal", p.crs_strong_signal);
    read(j, "crs_iv", p.crs_iv);
    read(j, "crs_skew", p.crs_skew);
    read(j, "bwb_extreme_signal", p.bwb_extreme_signal);
    read(j, "bwb_strong_signal", p.bwb_strong_signal);
    read(j, "bwb_pin_iv", p.bwb_pin_iv);
    read(j, "pds_high_iv", p.pds_high_iv);
    read(j, "pds_steep_skew", p.pds_steep_skew);
    read(j, "pds_flat_contango", p.pds_flat_contango);
    read(j, "lput_low_iv", p.lput_low_iv);
    read(j, "lput_strong_signal", p.lput_strong_signal);
    read(j, "lput_flat_contango", p.lput_flat_contango);
    read(j, "bcs_high_iv", p.bcs_high_iv);
    read(j, "bcs_steep_skew", p.bcs_steep_skew);
    read(j, "bcs_flat_contango", p.bcs_flat_contango);
    read(j, "ifly_high_iv", p.ifly_high_iv);
    read(j, "ifly_flat_skew", p.ifly_flat_skew);
    read(j, "ifly_contango", p.ifly_contango);
    read(j, "sic_iv", p.sic_iv);
    read(j, "sic_skew", p.sic_skew);
    read(j, "sic_contango", p.sic_contango);
    read(j, "sic_weak_signal", p.sic_weak_signal);
}

void read_selector(const json& j, SelectorConfig& c){
    read(j, "high_iv_rank", c.high_iv_rank);
    read(j, "low_iv_rank", c.low_iv_rank);
    read(j, "mid_iv_rank", c.mid_iv_rank);
    read(j, "pin_iv_low", c.pin_iv_low);
    read(j, "pin_iv_high", c.pin_iv_high);
    read(j, "high_skew", c.high_skew);
    read(j, "moderate_skew", c.moderate_skew);
    read(j, "flat_skew", c.flat_skew);
    read(j, "contango_rich", c.contango_rich);
    read(j, "contango_positive", c.contango_positive);
    read(j, "contango_flat", c.contango_flat);
    read(j, "strong_signal_min", c.strong_signal_min);
    read(j, "extreme_signal_min", c.extreme_signal_min);
    read(j, "multi_group_min", c.multi_group_min);
    read(j, "weak_core_max", c.weak_core_max);
    read(j, "weak_groups_max", c.weak_groups_max);
    read(j, "default_iv_rank", c.default_iv_rank);
    if (j.contains("points")) read_points(j["points"], c.points);
    if (j.contains("composite_bonuses")){
        for (auto& [k, v] : j["composite_bonuses"].items()){
            auto comp = parse_composite(k);
            if (!comp){ spdlog::warn("config: unknown composite '{}' ignored", k); continue; }
            c.composite_bonuses[*comp] = read_bonuses(v);
        }
    }
    if (j.contains("vol_accel_low_iv_bonuses"))
        c.vol_accel_low_iv_bonuses = read_bonuses(j["vol_accel_low_iv_bonuses"]);
}

} // namespace

MarketSnapshot snapshot_from_json(const json& j){
    MarketSnapshot snap;
    if (!j.is_object()) return snap;
    for (auto& [k, v] : j.items()){
        std::optional<double> x;
        if (v.is_number()) x = v.get<double>();
        else if (v.is_string()) x = to_double(v.get<std::string>());
        if (x && std::isfinite(*x)) snap.set(k, *x);
    }
    return snap;
}

EngineConfig config_from_json(const json& j){
    EngineConfig cfg;
    if (!j.is_object()) return cfg;
    if (j.contains("signals"))  read_signals(j["signals"], cfg.signals);
    if (j.contains("calendar")) read_calendar(j["calendar"], cfg.calendar);
    if (j.contains("sizing"))   read_sizing(j["sizing"], cfg.sizing);
    if (j.contains("selector")) read_selector(j["selector"], cfg.selector);
    return cfg;
}

std::optional<EngineConfig> load_config_file(const std::string& path){
    std::ifstream f(path);
    if (!f.good()){
        spdlog::error("config: cannot open {}", path);
        return std::nullopt;
    }
    try {
        auto j = json::parse(f);
        auto cfg = config_from_json(j);
        spdlog::info("config: loaded {}", path);
        return cfg;
    } catch (const json::exception& e) {
        spdlog::error("config: {} : {}", path, e.what());
    }
    return std::nullopt;
}

} // namespace core
