#include "core/trade_date.hpp"
#include <cstdio>
#include <fmt/format.h>

namespace core {

// civil <-> serial day conversion (era based, valid far outside any trading range)
long TradeDate::days() const {
    const int y = year - (month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = static_cast<unsigned>(month + (month > 2 ? -3 : 9));
    const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

TradeDate TradeDate::from_days(long z){
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
    const unsigned mp = (5*doy + 2) / 153;
    const unsigned d = doy - (153*mp + 2)/5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d)};
}

int TradeDate::weekday() const {
    const long z = days();
    return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

std::string TradeDate::iso() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::optional<TradeDate> TradeDate::parse(const std::string& s){
    int y=0, m=0, d=0;
    char tail = 0;
    if (s.size() < 10) return std::nullopt;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) return std::nullopt;
    if (m < 1 || m > 12 || d < 1 || d > 31) return std::nullopt;
    TradeDate t{y, m, d};
    // round-trip rejects e.g. 2025-02-30
    if (from_days(t.days()) != t) return std::nullopt;
    return t;
}

TradeDate TradeDate::nth_weekday(int year, int month, int weekday, int n){
    const TradeDate first{year, month, 1};
    const int offset = (weekday - first.weekday() + 7) % 7;
    return first.plus_days(offset + 7L * (n - 1));
}

} // namespace core
