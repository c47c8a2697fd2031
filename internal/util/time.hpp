#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace cadence::util {

/*
  Time utilities: single place to control clock source and calendar math.

  Record timestamps are naive wall-clock times; calendar helpers interpret
  them as UTC so hour/day grouping is independent of the host time zone.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS[.ffffff]]" and the same with a
// 'T' separator and optional trailing 'Z'.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

std::string FormatIso8601(TimePoint tp);

// Signed difference later - earlier in seconds.
double SecondsBetween(TimePoint earlier, TimePoint later);

int HourOfDay(TimePoint tp);

// 0 = Monday ... 6 = Sunday
int DayOfWeek(TimePoint tp);

std::string_view DayName(int day_of_week);

} // namespace cadence::util
