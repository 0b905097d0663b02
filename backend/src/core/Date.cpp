#include "Date.hpp"
#include <cstdio>
#include <cctype>

namespace {

struct Civil {
    int y;
    unsigned m;
    unsigned d;
};

/*
  Proleptic Gregorian conversions (days since 1970-01-01 <-> y/m/d).
  Eras are 400-year blocks so every branch stays in integer arithmetic.
*/
long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

Civil civilFromDays(long z) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{ static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d };
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned lastDayOfMonth(int y, unsigned m) {
    static const unsigned table[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (m == 2 && isLeap(y)) return 29;
    return table[m - 1];
}

bool readDigits(const std::string& s, size_t pos, size_t count, int& out) {
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

} // namespace

Date Date::fromYmd(int year, unsigned month, unsigned day) {
    return Date(daysFromCivil(year, month, day));
}

std::optional<Date> Date::parse(const std::string& iso) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') return std::nullopt;

    int y = 0, m = 0, d = 0;
    if (!readDigits(iso, 0, 4, y)) return std::nullopt;
    if (!readDigits(iso, 5, 2, m)) return std::nullopt;
    if (!readDigits(iso, 8, 2, d)) return std::nullopt;

    if (m < 1 || m > 12) return std::nullopt;
    if (d < 1 || static_cast<unsigned>(d) > lastDayOfMonth(y, static_cast<unsigned>(m))) return std::nullopt;

    return fromYmd(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

Date Date::fromTimeT(std::time_t t) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    return fromYmd(local.tm_year + 1900,
        static_cast<unsigned>(local.tm_mon + 1),
        static_cast<unsigned>(local.tm_mday));
}

Date Date::today() {
    return fromTimeT(std::time(nullptr));
}

int Date::year() const {
    return civilFromDays(days).y;
}

unsigned Date::month() const {
    return civilFromDays(days).m;
}

unsigned Date::day() const {
    return civilFromDays(days).d;
}

std::string Date::toIso() const {
    const Civil c = civilFromDays(days);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.y, c.m, c.d);
    return std::string(buf);
}

Date Date::addDays(long n) const {
    return Date(days + n);
}
