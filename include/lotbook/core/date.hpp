#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace lotbook::core {

enum class Weekday {
    SUNDAY = 0,
    MONDAY,
    TUESDAY,
    WEDNESDAY,
    THURSDAY,
    FRIDAY,
    SATURDAY
};

// Calendar day in the proleptic Gregorian calendar. No time of day, no zone.
class Date {
public:
    Date();
    Date(int year, unsigned month, unsigned day);

    // Accepts YYYY-MM-DD, YYYY/MM/DD, M/D/YYYY and M/D/YY. A trailing
    // time part after 'T' or a space is ignored.
    static std::optional<Date> parse(const std::string& text);
    static Date from_days(int64_t days_since_epoch);
    static Date today();

    int year() const { return year_; }
    unsigned month() const { return month_; }
    unsigned day() const { return day_; }

    // Days since 1970-01-01
    int64_t days() const;
    Weekday weekday() const;

    // Latest date on or before this one that falls on anchor
    Date week_start(Weekday anchor = Weekday::MONDAY) const;
    int64_t days_until(const Date& later) const;
    Date add_days(int64_t count) const;

    std::string to_string() const;
    // YYMMDD
    std::string compact() const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
    bool operator>(const Date& other) const;
    bool operator>=(const Date& other) const;

private:
    int year_;
    unsigned month_;
    unsigned day_;
};

std::optional<Weekday> parse_weekday(const std::string& name);
std::string weekday_name(Weekday day);

} // namespace lotbook::core
