#include "core/types.hpp"

namespace core {

std::optional<SignalLevel> parse_level(const std::string& s){
    if (s=="OK") return SignalLevel::Ok;
    if (s=="INFO") return SignalLevel::Info;
    if (s=="WARNING") return SignalLevel::Warning;
    if (s=="ACTION") return SignalLevel::Action;
    return std::nullopt;
}

const char* to_string(Composite c){
    switch (c) {
        case Composite::MultiSignalStrong:      return "MULTI_SIGNAL_STRONG";
        case Composite::FearBounceStrong:       return "FEAR_BOUNCE_STRONG";
        case Composite::FearBounceStrongOpex:   return "FEAR_BOUNCE_STRONG_OPEX";
        case Composite::FundingStress:          return "FUNDING_STRESS";
        case Composite::WingPanic:              return "WING_PANIC";
        case Composite::VolAcceleration:        return "VOL_ACCELERATION";
        case Composite::FearBounceLong:         return "FEAR_BOUNCE_LONG";
        case Composite::DirectionalBearish:     return "DIRECTIONAL_BEARISH";
        case Composite::DirectionalBearishWeak: return "DIRECTIONAL_BEARISH_WEAK";
    }
    return "UNKNOWN";
}

const std::vector<Composite>& all_composites(){
    static const std::vector<Composite> v{
        Composite::MultiSignalStrong, Composite::FearBounceStrong, Composite::FearBounceStrongOpex,
        Composite::FundingStress, Composite::WingPanic, Composite::VolAcceleration,
        Composite::FearBounceLong, Composite::DirectionalBearish, Composite::DirectionalBearishWeak
    };
    return v;
}

std::optional<Composite> parse_composite(const std::string& s){
    for (auto c : all_composites()) if (s==to_string(c)) return c;
    return std::nullopt;
}

const char* to_string(TradeStructure t){
    switch (t) {
        case TradeStructure::BullPutSpread:       return "BULL_PUT_SPREAD";
        case TradeStructure::LongCall:            return "LONG_CALL";
        case TradeStructure::CallDebitSpread:     return "CALL_DEBIT_SPREAD";
        case TradeStructure::CallRatioSpread:     return "CALL_RATIO_SPREAD";
        case TradeStructure::BrokenWingButterfly: return "BROKEN_WING_BUTTERFLY";
        case TradeStructure::PutDebitSpread:      return "PUT_DEBIT_SPREAD";
        case TradeStructure::LongPut:             return "LONG_PUT";
        case TradeStructure::BearCallSpread:      return "BEAR_CALL_SPREAD";
        case TradeStructure::IronButterfly:       return "IRON_BUTTERFLY";
        case TradeStructure::ShortIronCondor:     return "SHORT_IRON_CONDOR";
    }
    return "UNKNOWN";
}

const std::vector<TradeStructure>& structure_catalog(){
    static const std::vector<TradeStructure> v{
        TradeStructure::BullPutSpread, TradeStructure::LongCall, TradeStructure::CallDebitSpread,
        TradeStructure::CallRatioSpread, TradeStructure::BrokenWingButterfly,
        TradeStructure::PutDebitSpread, TradeStructure::LongPut, TradeStructure::BearCallSpread,
        TradeStructure::IronButterfly, TradeStructure::ShortIronCondor
    };
    return v;
}

std::optional<TradeStructure> parse_structure(const std::string& s){
    for (auto t : structure_catalog()) if (s==to_string(t)) return t;
    return std::nullopt;
}

} // namespace core
