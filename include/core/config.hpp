#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/trade_date.hpp"
#include "core/types.hpp"

namespace core {

// --- Signal thresholds (one per signal) and group membership
struct SignalConfig {
    // core fear
    double skewing_thresh{0.05};
    double rip_thresh{70.0};
    double skew_change_thresh{0.010};
    double contango_drop_thresh{0.50};
    double credit_thresh{-0.005};
    // wing skew
    double wing_skew_30d_thresh{0.19};
    double wing_skew_10d_thresh{0.16};
    // funding stress
    double borrow_term_thresh{0.0075};
    double borrow_spread_thresh{0.042};
    // vol momentum
    double iv_momentum_thresh{0.005};
    double skewing_change_thresh{0.02};
    double contango_change_thresh{-0.03};
    // secondary
    double fbfwd_high{1.05};
    double fbfwd_low{0.95};
    double slope_change_thresh{0.3};
    double fwd_kink_thresh{0.01};
    double rdrv_rise_thresh{0.01};
    double iv_flat_thresh{0.005};
    double model_confidence_thresh{0.97};
    double mw_adj_thresh{0.001};
    double iv10_iv30_thresh{1.05};
    // denominator guards
    double contango_base_min{0.001};
    double iv30_min{0.01};

    std::vector<std::string> core_signals{"skewing", "rip", "skew_25d_rr", "contango", "credit_spread"};
    std::vector<std::string> wing_signals{"wing_skew_30d", "wing_skew_10d"};
    std::vector<std::string> funding_signals{"borrow_term", "borrow_spread"};
    std::vector<std::string> momentum_signals{"iv_momentum", "skewing_change", "contango_change"};

    int composite_min{3};
    int composite_min_vix{4};   // core threshold while the VIX-expiry discount is active
};

std::vector<TradeDate> default_fomc_dates();

struct CalendarConfig {
    std::vector<TradeDate> fomc_dates = default_fomc_dates();
    int fomc_blackout_days{1};
    int opex_window_days{3};
    int vix_window_days{1};
    double blackout_modifier{0.0};
    double vixpiration_modifier{0.7};
    double opex_modifier{1.5};
    double normal_modifier{1.0};
};

struct SizingConfig {
    double account_capital{250000.0};
    double base_risk_pct{0.02};
    double max_risk_pct{0.05};
    double max_daily_risk_pct{0.10};
    double group_bonus_pct{0.15};
    // non-core driven setups are never sized below this core multiplier
    double non_core_floor{0.8};
    int non_core_floor_min_signals{3};

    std::map<int, double> core_multipliers{{3, 1.0}, {4, 1.5}, {5, 2.0}};
    std::map<Composite, double> composite_multipliers{
        {Composite::MultiSignalStrong, 1.5},
        {Composite::FearBounceStrong, 1.0},
        {Composite::FearBounceStrongOpex, 1.3},
        {Composite::FundingStress, 1.2},
        {Composite::WingPanic, 1.1},
        {Composite::VolAcceleration, 0.9},
        {Composite::FearBounceLong, 0.7},
    };
};

// Points awarded per structure condition
struct SelectorPoints {
    double bps_high_iv{3.0}, bps_steep_skew{2.0}, bps_contango{1.0};
    double lc_low_iv{3.0}, lc_strong_signal{2.0}, lc_flat_contango{1.0};
    double cds_base{2.5}, cds_mid_iv{1.5}, cds_moderate_skew{1.0};
    double crs_strong_signal{3.0}, crs_iv{1.5}, crs_skew{0.5};
    double bwb_extreme_signal{3.0}, bwb_strong_signal{1.5}, bwb_pin_iv{1.0};
    double pds_high_iv{2.0}, pds_steep_skew{2.0}, pds_flat_contango{2.0};
    double lput_low_iv{3.0}, lput_strong_signal{2.0}, lput_flat_contango{1.0};
    double bcs_high_iv{2.5}, bcs_steep_skew{1.5}, bcs_flat_contango{2.0};
    double ifly_high_iv{3.0}, ifly_flat_skew{1.5}, ifly_contango{1.0};
    double sic_iv{2.0}, sic_skew{1.0}, sic_contango{1.0}, sic_weak_signal{1.0};
};

using StructureBonuses = std::map<TradeStructure, double>;

std::map<Composite, StructureBonuses> default_composite_bonuses();
StructureBonuses default_vol_accel_low_iv_bonuses();

struct SelectorConfig {
    double high_iv_rank{50.0};
    double low_iv_rank{30.0};
    double mid_iv_rank{40.0};          // CRS / SIC / VOL_ACCELERATION split
    double pin_iv_low{30.0};
    double pin_iv_high{60.0};
    double high_skew{0.02};
    double moderate_skew{0.01};
    double flat_skew{0.01};
    double contango_rich{0.05};
    double contango_positive{0.03};
    double contango_flat{0.02};
    int strong_signal_min{4};
    int extreme_signal_min{5};
    int multi_group_min{3};
    int weak_core_max{3};
    int weak_groups_max{1};
    double default_iv_rank{50.0};       // used when the snapshot has no ivRank1m

    SelectorPoints points;
    std::map<Composite, StructureBonuses> composite_bonuses = default_composite_bonuses();
    // VOL_ACCELERATION below mid_iv_rank buys convexity instead
    StructureBonuses vol_accel_low_iv_bonuses = default_vol_accel_low_iv_bonuses();
};

struct EngineConfig {
    SignalConfig signals;
    CalendarConfig calendar;
    SizingConfig sizing;
    SelectorConfig selector;
};

// Overlay the keys present in j onto the defaults; unknown keys are ignored.
EngineConfig config_from_json(const nlohmann::json& j);

// Vendor summary object -> snapshot. Numbers are taken as is, numeric
// strings are parsed; null, bools, objects, arrays and junk are left absent.
MarketSnapshot snapshot_from_json(const nlohmann::json& j);

// Reads a JSON file; logs and returns nullopt on I/O or parse errors.
std::optional<EngineConfig> load_config_file(const std::string& path);

} // namespace core
