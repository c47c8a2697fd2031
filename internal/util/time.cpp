#include "time.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace cadence::util {

namespace {

constexpr std::array<std::string_view, 7> kDayNames = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};

bool ReadNumber(std::string_view text, std::size_t& pos, std::size_t digits, int& out) {
  if (pos + digits > text.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + digits; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + digits, out);
  if (ec != std::errc{}) {
    return false;
  }
  pos += digits;
  return true;
}

bool Expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

std::chrono::sys_days DaysOf(TimePoint tp) {
  return std::chrono::floor<std::chrono::days>(tp);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::optional<TimePoint> ParseTimestamp(std::string_view raw) {
  const auto  text = Trim(raw);
  std::size_t pos  = 0;

  int year = 0, month = 0, day = 0;
  if (!ReadNumber(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadNumber(text, pos, 2, month) || !Expect(text, pos, '-') ||
      !ReadNumber(text, pos, 2, day)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  int  hour = 0, minute = 0, second = 0;
  long micros = 0;

  if (pos < text.size()) {
    if (text[pos] != ' ' && text[pos] != 'T') {
      return std::nullopt;
    }
    ++pos;
    if (!ReadNumber(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadNumber(text, pos, 2, minute)) {
      return std::nullopt;
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!ReadNumber(text, pos, 2, second)) {
        return std::nullopt;
      }
      if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        long        scale  = 100000;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
          if (digits < 6) {
            micros += (text[pos] - '0') * scale;
            scale /= 10;
          }
          ++digits;
          ++pos;
        }
        if (digits == 0) {
          return std::nullopt;
        }
      }
    }
    if (pos < text.size() && text[pos] == 'Z') {
      ++pos;
    }
    if (pos != text.size()) {
      return std::nullopt;
    }
  }

  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second} +
                  std::chrono::microseconds{micros};
  return std::chrono::time_point_cast<Clock::duration>(tp);
}

std::string FormatIso8601(TimePoint tp) {
  const auto days = DaysOf(tp);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss       hms{std::chrono::floor<std::chrono::seconds>(tp - days)};

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02ld:%02ld:%02ld", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<long>(hms.hours().count()), static_cast<long>(hms.minutes().count()),
                static_cast<long>(hms.seconds().count()));
  return buffer;
}

double SecondsBetween(TimePoint earlier, TimePoint later) {
  return std::chrono::duration<double>(later - earlier).count();
}

int HourOfDay(TimePoint tp) {
  const auto since_midnight = tp - DaysOf(tp);
  return static_cast<int>(std::chrono::floor<std::chrono::hours>(since_midnight).count());
}

int DayOfWeek(TimePoint tp) {
  // iso_encoding: Monday = 1 ... Sunday = 7
  const std::chrono::weekday wd{DaysOf(tp)};
  return static_cast<int>(wd.iso_encoding()) - 1;
}

std::string_view DayName(int day_of_week) {
  if (day_of_week < 0 || day_of_week >= static_cast<int>(kDayNames.size())) {
    return "Unknown";
  }
  return kDayNames[static_cast<std::size_t>(day_of_week)];
}

} // namespace cadence::util
