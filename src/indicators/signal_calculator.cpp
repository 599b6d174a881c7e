#include "indicators/signal_calculator.hpp"
#include <cmath>
#include <unordered_map>
#include <spdlog/spdlog.h>

using core::MarketSnapshot;
using core::SignalLevel;
using core::SignalMap;
using core::SignalRecord;

namespace ind {

const std::vector<std::string>& signal_order(){
    static const std::vector<std::string> order{
        "skewing", "rip", "skew_25d_rr", "contango", "credit_spread",
        "wing_skew_30d", "wing_skew_10d",
        "borrow_term", "borrow_spread",
        "iv_momentum", "skewing_change", "contango_change",
        "fbfwd30_20", "rSlp30", "fwd_kink", "rDrv30",
        "model_confidence", "mw_adj_30", "iv10_iv30",
    };
    return order;
}

std::string signal_label(const std::string& key){
    static const std::unordered_map<std::string, std::string> labels{
        {"skewing", "Skewing"},
        {"rip", "Risk Implied Premium"},
        {"skew_25d_rr", "Skew (25d RR)"},
        {"contango", "Contango"},
        {"credit_spread", "Credit Spread"},
        {"wing_skew_30d", "Wing Skew 30d (95d-5d)"},
        {"wing_skew_10d", "Wing Skew 10d (95d-5d)"},
        {"borrow_term", "Borrow Term (30d-2y)"},
        {"borrow_spread", "Borrow vs Risk-Free"},
        {"iv_momentum", "IV30 Momentum"},
        {"skewing_change", "Skewing Change"},
        {"contango_change", "Contango Change"},
        {"fbfwd30_20", "Forecast Ratio (fbfwd)"},
        {"rSlp30", "Skew Slope (rSlp30)"},
        {"fwd_kink", "Fwd Vol Kink"},
        {"rDrv30", "RV Derivative"},
        {"model_confidence", "Model Confidence"},
        {"mw_adj_30", "Market Width 30d"},
        {"iv10_iv30", "IV10/IV30 Ratio"},
    };
    auto it = labels.find(key);
    return it == labels.end() ? key : it->second;
}

double round_to(double v, int digits){
    const double f = std::pow(10.0, digits);
    return std::round(v * f) / f;
}

namespace {

SignalRecord make(const std::string& key, double value, bool fires, SignalLevel level, int tier, int digits = 4){
    SignalRecord r;
    r.key   = key;
    r.label = signal_label(key);
    r.value = round_to(value, digits);
    r.level = fires ? level : SignalLevel::Ok;
    r.tier  = tier;
    return r;
}

void put(SignalMap& out, SignalRecord r){
    auto key = r.key;
    out[key] = std::move(r);
}

bool usable(double v){ return v != 0.0 && std::isfinite(v); }

// 1-day change; a missing (0.0) previous value gives no change
double day_change(double cur, double prev){ return prev != 0.0 ? cur - prev : 0.0; }

} // namespace

void SignalCalculator::core_fear(SignalMap& out, const MarketSnapshot& s, const MarketSnapshot& base) const {
    // near-term skew term
    const double skewing = s.get("skewing");
    put(out, make("skewing", skewing, skewing > cfg_.skewing_thresh, SignalLevel::Action, 1));

    // risk implied premium
    const double rip = s.get("rip");
    put(out, make("rip", rip, rip > cfg_.rip_thresh, SignalLevel::Action, 1, 2));

    // 25d risk reversal vs session baseline
    const double d25 = s.get("dlt25Iv30d"), d75 = s.get("dlt75Iv30d");
    const double skew = d25 - d75;
    const double base_skew = base.get("dlt25Iv30d", d25) - base.get("dlt75Iv30d", d75);
    const double skew_chg = skew - base_skew;
    auto rr = make("skew_25d_rr", skew, std::abs(skew_chg) > cfg_.skew_change_thresh, SignalLevel::Action, 1);
    rr.baseline = round_to(base_skew, 4);
    rr.change = round_to(skew_chg, 4);
    put(out, std::move(rr));

    // contango level / collapse vs baseline
    const double ct = s.get("contango");
    const double ct_base = base.get("contango", ct);
    const double ct_pct = std::abs(ct_base) > cfg_.contango_base_min ? (ct - ct_base) / std::abs(ct_base) : 0.0;
    auto c = make("contango", ct, ct_pct < -cfg_.contango_drop_thresh || ct < 0.0, SignalLevel::Action, 1);
    c.baseline = round_to(ct_base, 4);
    c.change = round_to(ct_pct, 4);
    put(out, std::move(c));
}

void SignalCalculator::wing_skew(SignalMap& out, const MarketSnapshot& s) const {
    auto spread = [&](const char* hi, const char* lo){
        const double a = s.get(hi), b = s.get(lo);
        return (usable(a) && usable(b)) ? a - b : 0.0;
    };
    const double w30 = spread("dlt95Iv30d", "dlt5Iv30d");
    const double w10 = spread("dlt95Iv10d", "dlt5Iv10d");
    put(out, make("wing_skew_30d", w30, w30 > cfg_.wing_skew_30d_thresh, SignalLevel::Action, 1));
    put(out, make("wing_skew_10d", w10, w10 > cfg_.wing_skew_10d_thresh, SignalLevel::Action, 1));
}

void SignalCalculator::funding_stress(SignalMap& out, const MarketSnapshot& s) const {
    const double b30 = s.get("borrow30"), b2y = s.get("borrow2y");
    const double term = (usable(b30) && usable(b2y)) ? b30 - b2y : 0.0;
    put(out, make("borrow_term", term, term > cfg_.borrow_term_thresh, SignalLevel::Action, 1));

    const double spread = b30 - s.get("riskFree30");
    put(out, make("borrow_spread", spread, spread > cfg_.borrow_spread_thresh, SignalLevel::Action, 1));
}

void SignalCalculator::vol_momentum(SignalMap& out, const MarketSnapshot& s, const MarketSnapshot& prev) const {
    const double iv = s.get("iv30d"), piv = prev.get("iv30d");
    const double iv_chg = day_change(iv, piv);
    auto r = make("iv_momentum", iv_chg, iv_chg > cfg_.iv_momentum_thresh, SignalLevel::Action, 1);
    r.previous_value = round_to(piv, 4);
    r.change = round_to(iv_chg, 4);
    put(out, std::move(r));

    const double sk = s.get("skewing"), psk = prev.get("skewing");
    const double sk_chg = day_change(sk, psk);
    r = make("skewing_change", sk_chg, sk_chg > cfg_.skewing_change_thresh, SignalLevel::Action, 1);
    r.previous_value = round_to(psk, 4);
    r.change = round_to(sk_chg, 4);
    put(out, std::move(r));

    const double ct = s.get("contango"), pct = prev.get("contango");
    const double ct_chg = day_change(ct, pct);
    r = make("contango_change", ct_chg, ct_chg < cfg_.contango_change_thresh, SignalLevel::Action, 1);
    r.previous_value = round_to(pct, 4);
    r.change = round_to(ct_chg, 4);
    put(out, std::move(r));
}

void SignalCalculator::secondary(SignalMap& out, const MarketSnapshot& s,
                                 const MarketSnapshot& base, const MarketSnapshot& prev) const {
    // absent ratio reads as neutral 1.0
    const double fb = s.get("fbfwd30_20", 1.0);
    put(out, make("fbfwd30_20", fb, fb > cfg_.fbfwd_high || fb < cfg_.fbfwd_low, SignalLevel::Warning, 2));

    const double rslp = s.get("rSlp30"), prev_rslp = prev.get("rSlp30", rslp);
    const double slope_chg = rslp - prev_rslp;
    auto r = make("rSlp30", rslp, std::abs(slope_chg) > cfg_.slope_change_thresh, SignalLevel::Warning, 2);
    r.previous_value = round_to(prev_rslp, 4);
    r.change = round_to(slope_chg, 4);
    put(out, std::move(r));

    const double kink = std::abs(s.get("fwd30_20") - s.get("fwd60_30"));
    put(out, make("fwd_kink", kink, kink > cfg_.fwd_kink_thresh, SignalLevel::Info, 3));

    // realized vol derivative climbing while implied stays flat
    const double rdrv = s.get("rDrv30"), prev_rdrv = prev.get("rDrv30", rdrv);
    const double iv30 = s.get("iv30d"), base_iv = base.get("iv30d", iv30);
    const bool iv_flat = std::abs(iv30 - base_iv) < cfg_.iv_flat_thresh;
    r = make("rDrv30", rdrv, rdrv > prev_rdrv + cfg_.rdrv_rise_thresh && iv_flat, SignalLevel::Info, 3);
    r.previous_value = round_to(prev_rdrv, 4);
    r.baseline = round_to(base_iv, 4);
    put(out, std::move(r));

    // zero means "not reported", not "no confidence"
    const double conf = s.get("confidence");
    put(out, make("model_confidence", conf, conf > 0.0 && conf < cfg_.model_confidence_thresh, SignalLevel::Warning, 2));

    const double mw = s.get("mwAdj30");
    put(out, make("mw_adj_30", mw, mw > cfg_.mw_adj_thresh, SignalLevel::Warning, 2));

    const double iv10 = s.get("iv10d");
    const double ratio = iv30 > cfg_.iv30_min ? iv10 / iv30 : 0.0;
    put(out, make("iv10_iv30", ratio, ratio > cfg_.iv10_iv30_thresh, SignalLevel::Warning, 2));
}

SignalMap SignalCalculator::compute_signals(const std::string& symbol, const MarketSnapshot& snap,
                                            const core::ReferenceState& ref,
                                            const std::optional<core::CreditQuad>& credit) const {
    const MarketSnapshot& base = ref.baseline_or(snap);
    const MarketSnapshot& prev = ref.previous_day_or(snap);

    SignalMap out;
    core_fear(out, snap, base);
    wing_skew(out, snap);
    funding_stress(out, snap);
    vol_momentum(out, snap, prev);
    secondary(out, snap, base, prev);

    SignalMap cs;
    if (credit) cs = compute_credit_signal(*credit);
    if (cs.empty()) put(out, make("credit_spread", 0.0, false, SignalLevel::Action, 1));
    else out.insert(cs.begin(), cs.end());

    if (spdlog::should_log(spdlog::level::debug)){
        int actions = 0;
        for (auto& [k, r] : out) if (r.level == SignalLevel::Action) ++actions;
        spdlog::debug("{}: {} signals, {} ACTION", symbol, out.size(), actions);
    }
    return out;
}

SignalMap SignalCalculator::compute_credit_signal(double a, double b, double a_prev, double b_prev) const {
    SignalMap out;
    if (!usable(a) || !usable(b) || !usable(a_prev) || !usable(b_prev)) return out;
    const double a_chg = (a - a_prev) / a_prev;
    const double b_chg = (b - b_prev) / b_prev;
    const double credit = a_chg - b_chg;
    put(out, make("credit_spread", credit, credit < cfg_.credit_thresh, SignalLevel::Action, 1));
    return out;
}

} // namespace ind
