#include "estate-forecast/core/calendar.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace estateforecast::core::calendar {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400LL;

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (static_cast<std::int64_t>(month) + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(day) - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const std::int64_t doe = days - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return CivilDate{static_cast<int>(y), static_cast<unsigned>(m), static_cast<unsigned>(d)};
}

// Splits a time point into whole days since epoch and the remaining seconds of that day.
void splitDays(const TimePoint &tp, std::int64_t &days, double &seconds_of_day) {
	constexpr std::int64_t ns_per_day = kSecondsPerDay * 1000000000LL;
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
	std::int64_t quotient = ns / ns_per_day;
	std::int64_t remainder = ns % ns_per_day;
	if (remainder < 0) {
		--quotient;
		remainder += ns_per_day;
	}
	days = quotient;
	seconds_of_day = static_cast<double>(remainder) / 1e9;
}

} // namespace

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be within [1, 12].");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

TimePoint fromCivil(int year, unsigned month, unsigned day) {
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	const auto days = daysFromCivil(year, month, day);
	return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(days * kSecondsPerDay));
}

CivilDate toCivil(const TimePoint &tp) {
	std::int64_t days = 0;
	double seconds = 0.0;
	splitDays(tp, days, seconds);
	return civilFromDays(days);
}

double monthOrdinal(const TimePoint &tp) {
	std::int64_t days = 0;
	double seconds = 0.0;
	splitDays(tp, days, seconds);
	const auto date = civilFromDays(days);
	const double day_fraction = (static_cast<double>(date.day - 1) + seconds / static_cast<double>(kSecondsPerDay)) /
	                            static_cast<double>(daysInMonth(date.year, date.month));
	return static_cast<double>(date.year) * 12.0 + static_cast<double>(date.month - 1) + day_fraction;
}

double monthOfYear(const TimePoint &tp) {
	const double ordinal = monthOrdinal(tp);
	const double position = ordinal - 12.0 * std::floor(ordinal / 12.0);
	return position >= 12.0 ? 0.0 : position;
}

TimePoint nextMonthStart(const TimePoint &tp) {
	const auto date = toCivil(tp);
	if (date.month == 12) {
		return fromCivil(date.year + 1, 1, 1);
	}
	return fromCivil(date.year, date.month + 1, 1);
}

std::vector<TimePoint> monthStartsAfter(const TimePoint &last, int count) {
	if (count < 0) {
		throw std::invalid_argument("Number of months must be non-negative.");
	}
	std::vector<TimePoint> dates;
	dates.reserve(static_cast<std::size_t>(count));
	auto current = last;
	for (int i = 0; i < count; ++i) {
		current = nextMonthStart(current);
		dates.push_back(current);
	}
	return dates;
}

int monthsBetween(const TimePoint &from, const TimePoint &to) {
	const auto a = toCivil(from);
	const auto b = toCivil(to);
	return (b.year - a.year) * 12 + (static_cast<int>(b.month) - static_cast<int>(a.month));
}

std::string formatDate(const TimePoint &tp) {
	const auto date = toCivil(tp);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
	return std::string(buffer);
}

} // namespace estateforecast::core::calendar
