#include "idcard/calendar.h"
#include "idcard/digit_array.h"
#include <chrono>
#include <ctime>
#include <cstdio>

namespace idcard {
namespace utils {

namespace {

// Days since 1970-01-01 for a civil date (H. Hinnant's algorithm)
long long daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

CalendarDate civilFromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const long long y = static_cast<long long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);

    return makeDate(static_cast<int>(y), static_cast<int>(m), static_cast<int>(d));
}

} // namespace

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

int daysInYear(int year) {
    return isLeapYear(year) ? 366 : 365;
}

bool isValidDate(int year, int month, int day) {
    if (year < MIN_YEAR || year > MAX_YEAR) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

CalendarDate makeDate(int year, int month, int day) {
    CalendarDate date;
    date.year = year;
    date.month = month;
    date.day = day;
    date.valid = isValidDate(year, month, day);
    return date;
}

bool parseCompactDate(const std::string& yyyymmdd, CalendarDate& out) {
    out = CalendarDate{};

    if (yyyymmdd.size() != 8 || !isDigits(yyyymmdd)) {
        return false;
    }

    int year = 0;
    for (size_t i = 0; i < 4; i++) {
        year = year * 10 + digitValue(yyyymmdd[i]);
    }
    int month = digitValue(yyyymmdd[4]) * 10 + digitValue(yyyymmdd[5]);
    int day = digitValue(yyyymmdd[6]) * 10 + digitValue(yyyymmdd[7]);

    out = makeDate(year, month, day);
    return out.valid;
}

std::string formatCompactDate(const CalendarDate& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", date.year, date.month, date.day);
    return buf;
}

std::string formatIsoDate(const CalendarDate& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

int dayOfYear(const CalendarDate& date) {
    return static_cast<int>(daysFromCivil(date.year, date.month, date.day) -
                            daysFromCivil(date.year, 1, 1)) + 1;
}

CalendarDate addDays(const CalendarDate& date, int days) {
    return civilFromDays(daysFromCivil(date.year, date.month, date.day) + days);
}

CalendarDate today() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return makeDate(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

} // namespace utils
} // namespace idcard
