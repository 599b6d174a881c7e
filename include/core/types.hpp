#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace core {

// One vol-surface summary row for a symbol (metric -> value)
class MarketSnapshot {
public:
    MarketSnapshot() = default;
    MarketSnapshot(std::initializer_list<std::pair<const std::string, double>> init) : values_(init) {}

    // absent key -> 0.0 or the given fallback, never throws
    double get(const std::string& key, double fallback = 0.0) const {
        auto it = values_.find(key);
        return it == values_.end() ? fallback : it->second;
    }
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    void set(const std::string& key, double v) { values_[key] = v; }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, double> values_;
};

// Per-symbol reference rows: session baseline + previous day.
// Owned by the caller; the calculator only reads it.
class ReferenceState {
public:
    void set_baseline(MarketSnapshot s) { baseline_ = std::move(s); }
    void set_previous_day(MarketSnapshot s) { previous_day_ = std::move(s); }

    // unset reference -> current row stands in (no cold-start false positives)
    const MarketSnapshot& baseline_or(const MarketSnapshot& current) const {
        return baseline_ ? *baseline_ : current;
    }
    const MarketSnapshot& previous_day_or(const MarketSnapshot& current) const {
        return previous_day_ ? *previous_day_ : current;
    }

private:
    std::optional<MarketSnapshot> baseline_;
    std::optional<MarketSnapshot> previous_day_;
};

// Ordered by severity
enum class SignalLevel { Ok, Info, Warning, Action };

inline const char* to_string(SignalLevel l) {
    switch (l) {
        case SignalLevel::Info:    return "INFO";
        case SignalLevel::Warning: return "WARNING";
        case SignalLevel::Action:  return "ACTION";
        default:                   return "OK";
    }
}

std::optional<SignalLevel> parse_level(const std::string& s);

struct SignalRecord {
    std::string key;
    std::string label;
    double value{0.0};
    SignalLevel level{SignalLevel::Ok};
    int tier{3};
    std::optional<double> baseline;
    std::optional<double> previous_value;
    std::optional<double> change;
};

using SignalMap = std::map<std::string, SignalRecord>;

// Closes of two reference assets (HY credit / long treasury)
struct CreditQuad {
    double a{0.0};
    double b{0.0};
    double a_prev{0.0};
    double b_prev{0.0};
};

enum class CalendarLabel { Normal, OpexAmplifier, VixpirationDiscount, FomcBlackout };

inline const char* to_string(CalendarLabel l) {
    switch (l) {
        case CalendarLabel::OpexAmplifier:       return "OPEX_AMPLIFIER";
        case CalendarLabel::VixpirationDiscount: return "VIXPIRATION_DISCOUNT";
        case CalendarLabel::FomcBlackout:        return "FOMC_BLACKOUT";
        default:                                 return "NORMAL";
    }
}

struct CalendarContext {
    bool opex_amplifier{false};
    bool vixpiration_discount{false};
    bool fomc_blackout{false};
    double modifier{1.0};
    CalendarLabel label{CalendarLabel::Normal};
};

enum class Composite {
    MultiSignalStrong,
    FearBounceStrong,
    FearBounceStrongOpex,
    FundingStress,
    WingPanic,
    VolAcceleration,
    FearBounceLong,
    DirectionalBearish,
    DirectionalBearishWeak
};

const char* to_string(Composite c);
std::optional<Composite> parse_composite(const std::string& s);
const std::vector<Composite>& all_composites();

struct GroupCounts {
    int core{0};
    int wing{0};
    int funding{0};
    int momentum{0};
    int groups_firing{0};
};

struct CompositeResult {
    std::optional<Composite> composite;
    std::vector<std::string> tier1_firing;
    GroupCounts counts;
};

enum class SignalStrength { None, Moderate, Strong, VeryStrong, Extreme };

inline const char* to_string(SignalStrength s) {
    switch (s) {
        case SignalStrength::Moderate:   return "MODERATE";
        case SignalStrength::Strong:     return "STRONG";
        case SignalStrength::VeryStrong: return "VERY_STRONG";
        case SignalStrength::Extreme:    return "EXTREME";
        default:                         return "NONE";
    }
}

// Catalog order; ties in the ranking keep this order
enum class TradeStructure {
    BullPutSpread,
    LongCall,
    CallDebitSpread,
    CallRatioSpread,
    BrokenWingButterfly,
    PutDebitSpread,
    LongPut,
    BearCallSpread,
    IronButterfly,
    ShortIronCondor
};

const char* to_string(TradeStructure t);
std::optional<TradeStructure> parse_structure(const std::string& s);
const std::vector<TradeStructure>& structure_catalog();

struct StructureScore {
    TradeStructure structure{TradeStructure::BullPutSpread};
    double score{0.0};
    std::string reason;
};

} // namespace core
