// Copyright (C) 2023-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include <cstdio>
#include <cstring>

#include <chrono>

#include "../include/termwire/Time.hpp"

namespace termwire
{
namespace time
{
struct EpochOffset {
	EpochOffset()
	{
		const auto wallClock = std::chrono::system_clock::now();
		const Point monotonic = now();
		nanosecondsSinceEpoch =
			std::chrono::duration_cast<std::chrono::nanoseconds>(
				wallClock.time_since_epoch())
				.count() -
			monotonic.ns;
	}
	int64_t nanosecondsSinceEpoch;
};

static const EpochOffset &Glob()
{
	static const EpochOffset glob;
	return glob;
}

Point GetTemporaryTimestamp() { return now(); }

Timestamp TemporaryTimestampToTimestamp(Point tmpTimestamp)
{
	return {Glob().nanosecondsSinceEpoch + tmpTimestamp.ns};
}

Timestamp GetTimestamp()
{
	return TemporaryTimestampToTimestamp(GetTemporaryTimestamp());
}

Diff DeltaNsBetweenTimepoints(Point begin, Point end)
{
	return {end.ns - begin.ns};
}

double DeltaMSecBetweenTimepoints(Point begin, Point end)
{
	return DeltaNsBetweenTimepoints(begin, end).ns / (1000.0 * 1000.0);
}

static bool IsLeapYear(int year)
{
	return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

void YMDFromTimestamp(Timestamp timestamp, int &day, int &month, int &year)
{
	int64_t days = timestamp.ns / (24ll * 3600ll * 1000ll * 1000ll * 1000ll);

	year = 1970;
	while (true) {
		const int max = IsLeapYear(year) ? 366 : 365;
		if (days < max) {
			break;
		}
		days -= max;
		++year;
	}

	const int feb = IsLeapYear(year) ? 29 : 28;
	const int daysPerMonth[12] = {31, feb, 31, 30, 31, 30,
								  31, 31,  30, 31, 30, 31};

	month = 0;
	while (days >= daysPerMonth[month]) {
		days -= daysPerMonth[month];
		month++;
	}
	month++;
	day = days + 1;
}

std::string TimestampToString(Timestamp timestamp, int subsecondDigits)
{
	const std::chrono::nanoseconds nanoseconds(timestamp.ns);
	const std::chrono::seconds seconds =
		std::chrono::duration_cast<std::chrono::seconds>(nanoseconds);
	const int64_t ns = (nanoseconds - seconds).count();

	if (subsecondDigits > 9) {
		subsecondDigits = 9;
	}
	if (subsecondDigits < 0) {
		subsecondDigits = 0;
	}

	// ".mmm.uuu.nnn" truncated to the requested digit count, dots included
	char subsecondsStr[32];
	snprintf(subsecondsStr, sizeof(subsecondsStr), ".%3.3li.%3.3li.%3.3li",
			 (long)(ns / 1000000), (long)((ns / 1000) % 1000),
			 (long)(ns % 1000));
	subsecondsStr[subsecondDigits + ((subsecondDigits + 2) / 3)] = 0;

	int day = 0, month = 0, year = 0;
	YMDFromTimestamp(timestamp, day, month, year);
	const int64_t secs = seconds.count();
	const int h = (secs / 3600) % 24, m = (secs / 60) % 60, s = secs % 60;

	char str[64];
	snprintf(str, sizeof(str), "%4.4i-%2.2i-%2.2i+%2.2i:%2.2i:%2.2i%sU+0",
			 year, month, day, h, m, s, subsecondsStr);
	return str;
}

std::string GetCurrentTimestampString(int subsecondDigits)
{
	return TimestampToString(GetTimestamp(), subsecondDigits);
}
} // namespace time
} // namespace termwire
