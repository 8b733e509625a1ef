// Copyright (C) 2023-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_TIME_HPP
#define TERMWIRE_TIME_HPP

#include <cstdint>

#include <string>

#include <concurrent/time.hpp>

namespace termwire
{
namespace time
{
using namespace concurrent::time;
using Point = point;
using Diff = diff;

// Nanoseconds since unix epoch.
struct Timestamp {
	int64_t ns = 0;
};

Point GetTemporaryTimestamp();
Timestamp TemporaryTimestampToTimestamp(Point tmpTimestamp);
Timestamp GetTimestamp();

Diff DeltaNsBetweenTimepoints(Point begin, Point end);
double DeltaMSecBetweenTimepoints(Point begin, Point end);

std::string TimestampToString(Timestamp timestamp, int subsecondsDigits);
std::string GetCurrentTimestampString(int subsecondsDigits);
void YMDFromTimestamp(Timestamp timestamp, int &day, int &month, int &year);
} // namespace time
} // namespace termwire

#endif
