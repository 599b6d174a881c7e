#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace ind {

// Display order of the 19 signals (core, wing, funding, momentum, secondary)
const std::vector<std::string>& signal_order();
std::string signal_label(const std::string& key);

double round_to(double v, int digits);

// Vol-surface signal set. Stateless: baseline / previous-day rows come in
// through ReferenceState, so one instance can serve every symbol.
class SignalCalculator {
public:
    explicit SignalCalculator(core::SignalConfig cfg = {}) : cfg_(std::move(cfg)) {}

    const core::SignalConfig& config() const { return cfg_; }

    // Always returns all 19 keys. Without a usable credit quad the
    // credit_spread entry is neutral (value 0, OK).
    core::SignalMap compute_signals(const std::string& symbol,
                                    const core::MarketSnapshot& snap,
                                    const core::ReferenceState& ref = {},
                                    const std::optional<core::CreditQuad>& credit = std::nullopt) const;

    // 0 or 1 entries; empty when an input is missing or a previous close is zero
    core::SignalMap compute_credit_signal(double a, double b, double a_prev, double b_prev) const;
    core::SignalMap compute_credit_signal(const core::CreditQuad& q) const {
        return compute_credit_signal(q.a, q.b, q.a_prev, q.b_prev);
    }

private:
    void core_fear(core::SignalMap& out, const core::MarketSnapshot& s, const core::MarketSnapshot& base) const;
    void wing_skew(core::SignalMap& out, const core::MarketSnapshot& s) const;
    void funding_stress(core::SignalMap& out, const core::MarketSnapshot& s) const;
    void vol_momentum(core::SignalMap& out, const core::MarketSnapshot& s, const core::MarketSnapshot& prev) const;
    void secondary(core::SignalMap& out, const core::MarketSnapshot& s,
                   const core::MarketSnapshot& base, const core::MarketSnapshot& prev) const;

    core::SignalConfig cfg_;
};

} // namespace ind
