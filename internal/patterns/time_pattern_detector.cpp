#include "internal/patterns/time_pattern_detector.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <utility>

#include "internal/util/time.hpp"

namespace cadence::patterns {
namespace {

using cadence::model::Pattern;

struct Rule {
  std::size_t min_count;
  double      min_share;
  double      count_divisor;
};

constexpr Rule kHourRule{3, 0.10, 20.0};
constexpr Rule kDayRule{2, 0.10, 10.0};
constexpr Rule kDayHourRule{2, 0.08, 5.0};

bool Passes(const Rule& rule, std::size_t count, std::size_t total) {
  return count >= rule.min_count && static_cast<double>(count) / static_cast<double>(total) >= rule.min_share;
}

double Confidence(const Rule& rule, std::size_t count, std::size_t total) {
  const double c = static_cast<double>(count);
  return std::min(1.0, c / static_cast<double>(total) + c / rule.count_divisor);
}

Pattern MakeTimePattern(std::string subtype, std::string description, double confidence, std::size_t occurrences) {
  Pattern pattern;
  pattern.pattern_type = "time";
  pattern.subtype      = std::move(subtype);
  pattern.description  = std::move(description);
  pattern.confidence   = confidence;
  pattern.occurrences  = occurrences;
  return pattern;
}

} // namespace

std::string_view TimeOfDay(int hour) {
  if (hour >= 5 && hour < 12) {
    return "morning";
  }
  if (hour >= 12 && hour < 17) {
    return "afternoon";
  }
  if (hour >= 17 && hour < 22) {
    return "evening";
  }
  return "night";
}

cadence::collaborators::DetectorOutput TimePatternDetector::Analyze(const cadence::ingest::RecordTable& records) {
  cadence::collaborators::DetectorOutput output;
  const auto                             total = records.size();
  if (total == 0) {
    return output;
  }

  std::map<int, std::size_t>                 by_hour;
  std::map<int, std::size_t>                 by_day;
  std::map<std::pair<int, int>, std::size_t> by_day_hour;
  for (const auto& record : records.records()) {
    const int hour = cadence::util::HourOfDay(record.timestamp);
    const int day  = cadence::util::DayOfWeek(record.timestamp);
    ++by_hour[hour];
    ++by_day[day];
    ++by_day_hour[{day, hour}];
  }

  for (const auto& [hour, count] : by_hour) {
    if (!Passes(kHourRule, count, total)) {
      continue;
    }
    auto pattern = MakeTimePattern("hour", fmt::format("Frequent communication during the {} (around {}:00)", TimeOfDay(hour), hour),
                                   Confidence(kHourRule, count, total), count);
    pattern.metadata["hour"] = hour;
    output.patterns.push_back(std::move(pattern));
  }

  for (const auto& [day, count] : by_day) {
    if (!Passes(kDayRule, count, total)) {
      continue;
    }
    auto pattern = MakeTimePattern("day", fmt::format("Frequent communication on {}s", cadence::util::DayName(day)), Confidence(kDayRule, count, total), count);
    pattern.metadata["day"]        = day;
    pattern.metadata["is_weekend"] = day >= 5 ? 1.0 : 0.0;
    output.patterns.push_back(std::move(pattern));
  }

  for (const auto& [slot, count] : by_day_hour) {
    if (!Passes(kDayHourRule, count, total)) {
      continue;
    }
    const auto [day, hour] = slot;
    auto pattern = MakeTimePattern("day_hour",
                                   fmt::format("Frequent communication on {} {}s (around {}:00)", cadence::util::DayName(day), TimeOfDay(hour), hour),
                                   Confidence(kDayHourRule, count, total), count);
    pattern.metadata["day"]  = day;
    pattern.metadata["hour"] = hour;
    output.patterns.push_back(std::move(pattern));
  }

  return output;
}

} // namespace cadence::patterns
