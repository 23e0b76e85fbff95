#include "calendar/date.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace larder {

namespace {

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

// Howard Hinnant's civil calendar algorithms.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
    int year;
    int month;
    int day;
};

Civil civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

} // namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("month out of range: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[month - 1];
}

Date::Date(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("invalid calendar date " + std::to_string(year) +
                                    "-" + std::to_string(month) + "-" +
                                    std::to_string(day));
    }
    days_ = days_from_civil(year, static_cast<unsigned>(month),
                            static_cast<unsigned>(day));
}

Date Date::parse(const std::string& iso) {
    int y = 0;
    int m = 0;
    int d = 0;
    char tail = 0;
    if (iso.size() != 10 ||
        std::sscanf(iso.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) {
        throw std::invalid_argument("malformed date: " + iso);
    }
    return Date(y, m, d);
}

Date Date::from_days(std::int64_t days_since_epoch) {
    Date d;
    d.days_ = days_since_epoch;
    return d;
}

Date Date::from_time_point(std::chrono::system_clock::time_point tp) {
    auto days = std::chrono::floor<Days>(tp.time_since_epoch());
    return from_days(days.count());
}

int Date::year() const { return civil_from_days(days_).year; }
int Date::month() const { return civil_from_days(days_).month; }
int Date::day() const { return civil_from_days(days_).day; }

int Date::day_of_year() const {
    return static_cast<int>(days_ - Date(year(), 1, 1).days_) + 1;
}

int Date::day_of_week() const {
    // 1970-01-01 was a Thursday.
    return static_cast<int>(days_ >= -4 ? (days_ + 4) % 7 : (days_ + 5) % 7 + 6);
}

int Date::iso_day_of_week() const {
    int dow = day_of_week();
    return dow == 0 ? 7 : dow;
}

bool Date::is_weekend() const {
    int dow = day_of_week();
    return dow == 0 || dow == 6;
}

std::chrono::system_clock::time_point Date::start_of_day() const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(Days(days_)));
}

std::string Date::to_string() const {
    Civil c = civil_from_days(days_);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
    return buf;
}

std::string to_string(const IsoWeek& week) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-W%02d", week.year, week.week);
    return buf;
}

IsoWeek iso_week_of(const Date& date) {
    // The ISO year is the year of the Thursday in the same week.
    Date thursday = date.add_days(4 - date.iso_day_of_week());
    return {thursday.year(), (thursday.day_of_year() - 1) / 7 + 1};
}

int iso_weeks_in_year(int iso_year) {
    // Dec 28 always falls in the last ISO week of its year.
    return iso_week_of(Date(iso_year, 12, 28)).week;
}

Date iso_week_start(int iso_year, int iso_week) {
    if (iso_week < 1 || iso_week > iso_weeks_in_year(iso_year)) {
        throw std::invalid_argument("ISO week " + std::to_string(iso_week) +
                                    " does not exist in " +
                                    std::to_string(iso_year));
    }
    // Jan 4 always falls in week 1.
    Date jan4(iso_year, 1, 4);
    Date week1_monday = jan4.add_days(1 - jan4.iso_day_of_week());
    return week1_monday.add_days(7 * (iso_week - 1));
}

Date first_of_month(int year, int month) {
    return Date(year, month, 1);
}

Date last_of_month(int year, int month) {
    return Date(year, month, days_in_month(year, month));
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& iso) {
    if (iso.size() < 19 || iso[10] != 'T') {
        throw std::invalid_argument("malformed timestamp: " + iso);
    }
    Date date = Date::parse(iso.substr(0, 10));

    int h = 0;
    int m = 0;
    int s = 0;
    if (iso[13] != ':' || iso[16] != ':' ||
        std::sscanf(iso.c_str() + 11, "%2d:%2d:%2d", &h, &m, &s) != 3 ||
        h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 60) {
        throw std::invalid_argument("malformed timestamp: " + iso);
    }

    // Only UTC is accepted: optional ".fff", then "Z" or nothing.
    std::size_t pos = 19;
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        std::size_t digits = pos;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) {
            ++pos;
        }
        if (pos == digits) {
            throw std::invalid_argument("malformed timestamp: " + iso);
        }
    }
    if (pos < iso.size() && iso[pos] == 'Z') {
        ++pos;
    }
    if (pos != iso.size()) {
        throw std::invalid_argument("timestamp must be UTC: " + iso);
    }

    return date.start_of_day() + std::chrono::hours(h) +
           std::chrono::minutes(m) + std::chrono::seconds(s);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace larder
