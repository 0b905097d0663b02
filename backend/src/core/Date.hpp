#pragma once
#include <ctime>
#include <optional>
#include <string>

// Calendar day without time of day. Stored as days since 1970-01-01 so that
// arithmetic and comparisons are plain integer operations.
class Date {
public:
    Date() = default;

    static Date fromYmd(int year, unsigned month, unsigned day);
    static std::optional<Date> parse(const std::string& iso); // "YYYY-MM-DD"
    static Date fromTimeT(std::time_t t);                      // local calendar day
    static Date today();                                       // local midnight

    int year() const;
    unsigned month() const;
    unsigned day() const;
    long serial() const { return days; }

    std::string toIso() const;

    Date addDays(long n) const;
    long daysUntil(const Date& other) const { return other.days - days; }

    bool operator==(const Date& o) const { return days == o.days; }
    bool operator!=(const Date& o) const { return days != o.days; }
    bool operator<(const Date& o) const { return days < o.days; }
    bool operator<=(const Date& o) const { return days <= o.days; }
    bool operator>(const Date& o) const { return days > o.days; }
    bool operator>=(const Date& o) const { return days >= o.days; }

private:
    explicit Date(long serialDays) : days(serialDays) {}

    long days = 0;
};
