#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace datafeed {

// Civil date at day granularity, stored as days since 1970-01-01.
class Date {
public:
    Date() = default;

    static Date from_days(int32_t days) { return Date(days); }
    static Date from_ymd(int year, unsigned month, unsigned day);
    static Date from_unix_seconds(int64_t seconds);

    // Accepts "YYYY-MM-DD" optionally followed by a time component ("2024-01-02 00:00:00").
    static Date parse(const std::string& text);

    // Sentinel expiry for instruments that never roll (9999-12-31).
    static Date never();

    [[nodiscard]] int32_t days_since_epoch() const noexcept { return days_; }
    [[nodiscard]] int year() const;
    [[nodiscard]] unsigned month() const;
    [[nodiscard]] unsigned day() const;

    // 0 = Monday ... 6 = Sunday
    [[nodiscard]] int weekday() const noexcept;
    [[nodiscard]] bool is_business_day() const noexcept { return weekday() < 5; }

    [[nodiscard]] Date add_days(int32_t count) const noexcept { return Date(days_ + count); }
    [[nodiscard]] std::string to_string() const;

    friend int32_t operator-(Date lhs, Date rhs) noexcept { return lhs.days_ - rhs.days_; }
    friend bool operator==(Date lhs, Date rhs) noexcept { return lhs.days_ == rhs.days_; }
    friend bool operator!=(Date lhs, Date rhs) noexcept { return lhs.days_ != rhs.days_; }
    friend bool operator<(Date lhs, Date rhs) noexcept { return lhs.days_ < rhs.days_; }
    friend bool operator<=(Date lhs, Date rhs) noexcept { return lhs.days_ <= rhs.days_; }
    friend bool operator>(Date lhs, Date rhs) noexcept { return lhs.days_ > rhs.days_; }
    friend bool operator>=(Date lhs, Date rhs) noexcept { return lhs.days_ >= rhs.days_; }

private:
    explicit Date(int32_t days) : days_(days) {}

    int32_t days_ = 0;
};

std::ostream& operator<<(std::ostream& os, Date date);

// Weekday business-day arithmetic, holidays ignored. Mirrors `date - BDay(count)`:
// the result is the count-th weekday strictly before `date`.
Date subtract_business_days(Date date, int count);

Date last_business_day_of_month(int year, unsigned month);
bool is_last_business_day_of_month(Date date);

} // namespace datafeed

