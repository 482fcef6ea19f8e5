#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace aoef::util {

/*
  Time utilities. Clock source and wire format live here.

  Exchange documents carry naive UTC ISO-8601 datetimes with microsecond
  precision ("2024-05-01T10:20:30.123456"). Now() is truncated to that
  precision so a timestamp survives a save/load cycle unchanged.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

TimePoint Now();

// Fraction is omitted when the microsecond part is zero.
std::string ToIso8601(TimePoint tp);

// Accepts "YYYY-MM-DD[T| ]HH:MM:SS[.f{1,6}][Z|+HH:MM|-HH:MM]" and a bare
// date. Throws MalformedDocumentError otherwise.
TimePoint FromIso8601(std::string_view text);

// Recording calendar fields: "YYYY-MM-DD" and "HH:MM:SS[.ffffff]".
// Both throw MalformedDocumentError on anything else.
void CheckIsoDate(std::string_view text);
void CheckIsoTime(std::string_view text);

} // namespace aoef::util
