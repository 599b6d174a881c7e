#pragma once
#include <optional>
#include <string>

namespace core {

// Proleptic Gregorian calendar date, no time zone.
struct TradeDate {
    int year{1970};
    int month{1};   // 1..12
    int day{1};     // 1..31

    // days since 1970-01-01
    long days() const;
    static TradeDate from_days(long z);

    // 0=Sunday .. 6=Saturday
    int weekday() const;

    TradeDate plus_days(long n) const { return from_days(days() + n); }
    std::string iso() const;

    static std::optional<TradeDate> parse(const std::string& s); // "YYYY-MM-DD"

    // n-th given weekday of the month (n>=1), e.g. 3rd Friday
    static TradeDate nth_weekday(int year, int month, int weekday, int n);
};

inline long days_between(const TradeDate& a, const TradeDate& b) { return b.days() - a.days(); }

inline bool operator==(const TradeDate& a, const TradeDate& b){
    return a.year==b.year && a.month==b.month && a.day==b.day;
}
inline bool operator!=(const TradeDate& a, const TradeDate& b){ return !(a==b); }
inline bool operator<(const TradeDate& a, const TradeDate& b){ return a.days() < b.days(); }

} // namespace core
