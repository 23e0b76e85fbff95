#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace larder {

// Proleptic Gregorian calendar date, stored as days since 1970-01-01.
class Date {
public:
    Date() = default;
    Date(int year, int month, int day);

    // Parses "YYYY-MM-DD". Throws std::invalid_argument on malformed input.
    static Date parse(const std::string& iso);
    static Date from_days(std::int64_t days_since_epoch);
    // UTC calendar day containing the time point.
    static Date from_time_point(std::chrono::system_clock::time_point tp);

    int year() const;
    int month() const;
    int day() const;
    int day_of_year() const;

    // 0 = Sunday ... 6 = Saturday
    int day_of_week() const;
    // 1 = Monday ... 7 = Sunday
    int iso_day_of_week() const;
    bool is_weekend() const;

    std::int64_t days_since_epoch() const { return days_; }
    Date add_days(std::int64_t n) const { return from_days(days_ + n); }
    std::int64_t days_until(const Date& other) const { return other.days_ - days_; }

    // Midnight UTC at the start of this day.
    std::chrono::system_clock::time_point start_of_day() const;

    std::string to_string() const;

    bool operator==(const Date& o) const { return days_ == o.days_; }
    bool operator!=(const Date& o) const { return days_ != o.days_; }
    bool operator<(const Date& o) const { return days_ < o.days_; }
    bool operator<=(const Date& o) const { return days_ <= o.days_; }
    bool operator>(const Date& o) const { return days_ > o.days_; }
    bool operator>=(const Date& o) const { return days_ >= o.days_; }

private:
    std::int64_t days_ = 0;
};

struct DateRange {
    Date start;
    Date end; // inclusive

    bool contains(const Date& d) const { return d >= start && d <= end; }
};

// ISO-8601 week: week 1 is the week holding the year's first Thursday.
struct IsoWeek {
    int year = 0;
    int week = 0;

    bool operator==(const IsoWeek& o) const {
        return year == o.year && week == o.week;
    }
    bool operator<(const IsoWeek& o) const {
        return year != o.year ? year < o.year : week < o.week;
    }
};

std::string to_string(const IsoWeek& week);

IsoWeek iso_week_of(const Date& date);
int iso_weeks_in_year(int iso_year);

// Monday of the given ISO week. Throws std::invalid_argument if the week
// does not exist in that ISO year.
Date iso_week_start(int iso_year, int iso_week);

bool is_leap_year(int year);
int days_in_month(int year, int month);
Date first_of_month(int year, int month);
Date last_of_month(int year, int month);

// "YYYY-MM-DDTHH:MM:SSZ" (fractional seconds and a trailing Z are optional).
// Any other zone suffix is rejected.
std::chrono::system_clock::time_point parse_timestamp(const std::string& iso);
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace larder
