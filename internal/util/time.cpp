#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace aoef::util {

namespace {

[[noreturn]] void ThrowBadTimestamp(std::string_view text) {
  throw MalformedDocumentError("Invalid ISO-8601 datetime: '" + std::string(text) + "'");
}

// Reads exactly `width` digits starting at `pos`.
int ReadDigits(std::string_view text, size_t& pos, size_t width) {
  if (pos + width > text.size()) ThrowBadTimestamp(text);

  int value = 0;
  for (size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') ThrowBadTimestamp(text);
    value = value * 10 + (c - '0');
  }
  pos += width;
  return value;
}

void Expect(std::string_view text, size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) ThrowBadTimestamp(text);
  ++pos;
}

// YYYY-MM-DD
void ReadDate(std::string_view text, size_t& pos, std::tm& utc) {
  utc.tm_year = ReadDigits(text, pos, 4) - 1900;
  Expect(text, pos, '-');
  utc.tm_mon = ReadDigits(text, pos, 2) - 1;
  Expect(text, pos, '-');
  utc.tm_mday = ReadDigits(text, pos, 2);

  if (utc.tm_mon < 0 || utc.tm_mon > 11 || utc.tm_mday < 1 || utc.tm_mday > 31) ThrowBadTimestamp(text);
}

// HH:MM:SS[.f{1,}], fraction truncated to microseconds.
void ReadClock(std::string_view text, size_t& pos, std::tm& utc, int64_t& micros) {
  utc.tm_hour = ReadDigits(text, pos, 2);
  Expect(text, pos, ':');
  utc.tm_min = ReadDigits(text, pos, 2);
  Expect(text, pos, ':');
  utc.tm_sec = ReadDigits(text, pos, 2);

  if (utc.tm_hour > 23 || utc.tm_min > 59 || utc.tm_sec > 60) ThrowBadTimestamp(text);

  micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) ThrowBadTimestamp(text);
    for (int i = digits; i < 6; ++i)
      micros *= 10;
  }
}

} // namespace

TimePoint Now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

std::string ToIso8601(TimePoint tp) {
  const auto secs   = std::chrono::floor<std::chrono::seconds>(tp);
  const auto micros = (tp - secs).count();

  const std::time_t t = Clock::to_time_t(secs);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (micros != 0) {
    out << '.' << std::setw(6) << std::setfill('0') << micros;
  }
  return out.str();
}

TimePoint FromIso8601(std::string_view text) {
  size_t pos = 0;

  std::tm utc{};
  ReadDate(text, pos, utc);

  int64_t micros         = 0;
  int     offset_minutes = 0;

  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != ' ') ThrowBadTimestamp(text);
    ++pos;

    ReadClock(text, pos, utc, micros);

    if (pos < text.size()) {
      const char zone = text[pos++];
      if (zone == 'Z') {
        offset_minutes = 0;
      } else if (zone == '+' || zone == '-') {
        const int hours = ReadDigits(text, pos, 2);
        if (pos < text.size() && text[pos] == ':') ++pos;
        const int minutes = ReadDigits(text, pos, 2);
        offset_minutes    = (zone == '+' ? 1 : -1) * (hours * 60 + minutes);
      } else {
        ThrowBadTimestamp(text);
      }
    }
  }

  if (pos != text.size()) ThrowBadTimestamp(text);

  const std::time_t seconds = timegm(&utc);
  if (seconds == static_cast<std::time_t>(-1) && utc.tm_year != 69) ThrowBadTimestamp(text);

  return TimePoint{} + std::chrono::seconds(seconds) - std::chrono::minutes(offset_minutes) +
         std::chrono::microseconds(micros);
}

void CheckIsoDate(std::string_view text) {
  size_t  pos = 0;
  std::tm utc{};
  ReadDate(text, pos, utc);
  if (pos != text.size()) ThrowBadTimestamp(text);
}

void CheckIsoTime(std::string_view text) {
  size_t  pos = 0;
  std::tm utc{};
  int64_t micros = 0;
  ReadClock(text, pos, utc, micros);
  if (pos != text.size()) ThrowBadTimestamp(text);
}

} // namespace aoef::util
