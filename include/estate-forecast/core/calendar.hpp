#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace estateforecast::core::calendar {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief A proleptic Gregorian calendar date (UTC).
 */
struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;

	bool operator==(const CivilDate &other) const {
		return year == other.year && month == other.month && day == other.day;
	}
	bool operator!=(const CivilDate &other) const {
		return !(*this == other);
	}
};

bool isLeapYear(int year);
unsigned daysInMonth(int year, unsigned month);

/**
 * @brief Builds the UTC midnight time point of a calendar date.
 * @throws std::invalid_argument If month or day are out of range.
 */
TimePoint fromCivil(int year, unsigned month, unsigned day);

/// Calendar date (UTC) of a time point.
CivilDate toCivil(const TimePoint &tp);

/**
 * @brief Continuous month count since year 0.
 *
 * `year * 12 + (month - 1) + (day - 1 + time_of_day) / daysInMonth`. The
 * encoding is strictly monotonic in time and exact for month starts, which
 * makes it the regression axis for the trend models.
 */
double monthOrdinal(const TimePoint &tp);

/// Position inside the year in months, in [0, 12).
double monthOfYear(const TimePoint &tp);

/// First day of the month following the month of @p tp.
TimePoint nextMonthStart(const TimePoint &tp);

/// @p count consecutive month starts beginning with nextMonthStart(@p last).
std::vector<TimePoint> monthStartsAfter(const TimePoint &last, int count);

/// Whole calendar months from @p from to @p to (negative when @p to is earlier).
int monthsBetween(const TimePoint &from, const TimePoint &to);

/// ISO formatted date, e.g. "2024-01-01".
std::string formatDate(const TimePoint &tp);

} // namespace estateforecast::core::calendar
