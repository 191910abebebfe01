#include <lotbook/core/date.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <vector>

namespace lotbook::core {

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool valid(int year, unsigned month, unsigned day) {
    return year >= 1 && year <= 9999 && month >= 1 && month <= 12 &&
           day >= 1 && day <= days_in_month(year, month);
}

// Howard Hinnant's days_from_civil / civil_from_days
int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::optional<int> to_int(const std::string& text) {
    if (text.empty() || text.size() > 4) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

Date::Date() : year_(1970), month_(1), day_(1) {}

Date::Date(int year, unsigned month, unsigned day)
    : year_(year), month_(month), day_(day) {}

std::optional<Date> Date::parse(const std::string& text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    std::string body = text.substr(first);
    auto cut = body.find_first_of("T ");
    if (cut != std::string::npos) {
        body = body.substr(0, cut);
    }

    std::vector<std::string> parts;
    bool year_first = false;
    if (body.find('-') != std::string::npos) {
        parts = split(body, '-');
        year_first = true;
    } else {
        parts = split(body, '/');
        year_first = !parts.empty() && parts[0].size() == 4;
    }
    if (parts.size() != 3) {
        return std::nullopt;
    }

    auto a = to_int(parts[0]);
    auto b = to_int(parts[1]);
    auto c = to_int(parts[2]);
    if (!a || !b || !c) {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (year_first) {
        if (parts[0].size() != 4) {
            return std::nullopt;
        }
        year = *a;
        month = *b;
        day = *c;
    } else {
        month = *a;
        day = *b;
        if (parts[2].size() == 2) {
            year = 2000 + *c;
        } else if (parts[2].size() == 4) {
            year = *c;
        } else {
            return std::nullopt;
        }
    }

    if (month < 1 || day < 1 ||
        !valid(year, static_cast<unsigned>(month), static_cast<unsigned>(day))) {
        return std::nullopt;
    }
    return Date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

Date Date::from_days(int64_t days_since_epoch) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civil_from_days(days_since_epoch, y, m, d);
    return Date(y, m, d);
}

Date Date::today() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    return Date(local_tm.tm_year + 1900,
                static_cast<unsigned>(local_tm.tm_mon + 1),
                static_cast<unsigned>(local_tm.tm_mday));
}

int64_t Date::days() const {
    return days_from_civil(year_, month_, day_);
}

Weekday Date::weekday() const {
    // 1970-01-01 was a Thursday
    const int64_t index = (days() % 7 + 11) % 7;
    return static_cast<Weekday>(index);
}

Date Date::week_start(Weekday anchor) const {
    const int current = static_cast<int>(weekday());
    const int target = static_cast<int>(anchor);
    const int shift = (current - target + 7) % 7;
    return add_days(-shift);
}

int64_t Date::days_until(const Date& later) const {
    return later.days() - days();
}

Date Date::add_days(int64_t count) const {
    return from_days(days() + count);
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year_, month_, day_);
    return buffer;
}

std::string Date::compact() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d%02u%02u", year_ % 100, month_, day_);
    return buffer;
}

bool Date::operator==(const Date& other) const {
    return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    if (year_ != other.year_) return year_ < other.year_;
    if (month_ != other.month_) return month_ < other.month_;
    return day_ < other.day_;
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

bool Date::operator>(const Date& other) const {
    return other < *this;
}

bool Date::operator>=(const Date& other) const {
    return !(*this < other);
}

std::optional<Weekday> parse_weekday(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* kNames[] = {"sunday", "monday", "tuesday", "wednesday",
                                   "thursday", "friday", "saturday"};
    for (int i = 0; i < 7; ++i) {
        const std::string full = kNames[i];
        if (lowered == full || lowered == full.substr(0, 3)) {
            return static_cast<Weekday>(i);
        }
    }
    return std::nullopt;
}

std::string weekday_name(Weekday day) {
    static const char* kNames[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                   "Thursday", "Friday", "Saturday"};
    return kNames[static_cast<int>(day)];
}

} // namespace lotbook::core
