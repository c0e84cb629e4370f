#include "datafeed/date.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace datafeed {
namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Howard Hinnant's days_from_civil / civil_from_days.
int32_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

struct Civil {
    int year;
    unsigned month;
    unsigned day;
};

Civil civil_from_days(int32_t z) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int y = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{y + (m <= 2 ? 1 : 0), m, d};
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

} // namespace

Date Date::from_ymd(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("Invalid calendar date " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return Date(days_from_civil(year, month, day));
}

Date Date::from_unix_seconds(int64_t seconds) {
    int64_t days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }
    return Date(static_cast<int32_t>(days));
}

Date Date::parse(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Expected YYYY-MM-DD date, got '" + text + "'");
    }
    for (const std::size_t pos : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) {
            throw std::invalid_argument("Expected YYYY-MM-DD date, got '" + text + "'");
        }
    }
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
        throw std::invalid_argument("Unexpected trailing characters in date '" + text + "'");
    }
    const int year = std::stoi(text.substr(0, 4));
    const auto month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    const auto day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    return from_ymd(year, month, day);
}

Date Date::never() {
    return from_ymd(9999, 12, 31);
}

int Date::year() const {
    return civil_from_days(days_).year;
}

unsigned Date::month() const {
    return civil_from_days(days_).month;
}

unsigned Date::day() const {
    return civil_from_days(days_).day;
}

int Date::weekday() const noexcept {
    // 1970-01-01 was a Thursday.
    const int value = (days_ + 3) % 7;
    return value < 0 ? value + 7 : value;
}

std::string Date::to_string() const {
    const auto civil = civil_from_days(days_);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", civil.year, civil.month, civil.day);
    return buffer;
}

std::ostream& operator<<(std::ostream& os, Date date) {
    return os << date.to_string();
}

Date subtract_business_days(Date date, int count) {
    if (count <= 0) {
        return date;
    }
    Date cursor = date;
    int seen = 0;
    while (seen < count) {
        cursor = cursor.add_days(-1);
        if (cursor.is_business_day()) {
            ++seen;
        }
    }
    return cursor;
}

Date last_business_day_of_month(int year, unsigned month) {
    Date cursor = Date::from_ymd(year, month, days_in_month(year, month));
    while (!cursor.is_business_day()) {
        cursor = cursor.add_days(-1);
    }
    return cursor;
}

bool is_last_business_day_of_month(Date date) {
    return date == last_business_day_of_month(date.year(), date.month());
}

} // namespace datafeed
