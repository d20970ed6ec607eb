#ifndef IDCARD_CALENDAR_H
#define IDCARD_CALENDAR_H

#include <string>

namespace idcard {
namespace utils {

// Proleptic Gregorian calendar date
struct CalendarDate {
    bool valid = false;
    int year = 0;
    int month = 0;      // 1-12
    int day = 0;        // 1-31
};

constexpr int MIN_YEAR = 1;
constexpr int MAX_YEAR = 9999;

bool isLeapYear(int year);
int daysInMonth(int year, int month);
int daysInYear(int year);

// Check that year/month/day form a real calendar date
bool isValidDate(int year, int month, int day);

CalendarDate makeDate(int year, int month, int day);

/**
 * Parse an 8-digit YYYYMMDD string
 * @return false if the string is not 8 digits or not a real date
 */
bool parseCompactDate(const std::string& yyyymmdd, CalendarDate& out);

// Format as YYYYMMDD (zero padded)
std::string formatCompactDate(const CalendarDate& date);

// Format as YYYY-MM-DD
std::string formatIsoDate(const CalendarDate& date);

// 1-based day of the year
int dayOfYear(const CalendarDate& date);

// Shift a date by a (possibly negative) number of days
CalendarDate addDays(const CalendarDate& date, int days);

// Today's date in local time
CalendarDate today();

} // namespace utils
} // namespace idcard

#endif // IDCARD_CALENDAR_H
