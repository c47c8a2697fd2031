#include "internal/analysis/response_timing.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/stats.hpp"
#include "internal/util/time.hpp"

namespace cadence::analysis {
namespace {

using cadence::model::Direction;
using cadence::model::ResponsePair;
using cadence::model::TimingStatistics;

constexpr int kPercentiles[] = {25, 50, 75, 90, 95};

template <typename Key>
std::map<Key, double> GroupMeans(const std::map<Key, std::vector<double>>& groups) {
  std::map<Key, double> means;
  for (const auto& [key, values] : groups) {
    if (auto mean = cadence::util::Mean(values)) {
      means.emplace(key, *mean);
    }
  }
  return means;
}

std::optional<double> MeanOfHours(const std::map<int, double>& by_hour, bool (*in_bucket)(int)) {
  std::vector<double> means;
  for (const auto& [hour, mean] : by_hour) {
    if (in_bucket(hour)) {
      means.push_back(mean);
    }
  }
  return cadence::util::Mean(means);
}

} // namespace

std::vector<ResponsePair> ExtractResponsePairs(const cadence::ingest::RecordTable& table) {
  std::vector<ResponsePair> pairs;

  const auto order = table.SortedByCounterpartyThenTime();
  for (std::size_t i = 1; i < order.size(); ++i) {
    const auto& previous = table[order[i - 1]];
    const auto& current  = table[order[i]];
    if (previous.counterparty != current.counterparty) {
      continue;
    }
    if (previous.direction != Direction::kReceived || current.direction != Direction::kSent) {
      continue;
    }

    const double latency = cadence::util::SecondsBetween(previous.timestamp, current.timestamp);
    if (latency <= 0.0) {
      continue;
    }

    ResponsePair pair;
    pair.counterparty    = current.counterparty;
    pair.received_at     = previous.timestamp;
    pair.sent_at         = current.timestamp;
    pair.latency_seconds = latency;
    pairs.push_back(std::move(pair));
  }
  return pairs;
}

ResponseTimingAnalyzer::ResponseTimingAnalyzer(AnalysisOptions options) : options_(std::move(options)) {
}

TimingStatistics ResponseTimingAnalyzer::Analyze(const cadence::ingest::RecordTable& table) const {
  return Summarize(ExtractResponsePairs(table));
}

TimingStatistics ResponseTimingAnalyzer::Summarize(std::vector<ResponsePair> pairs) const {
  TimingStatistics stats;
  stats.distribution.bin_edges = LatencyBinEdges();
  stats.distribution.bin_counts.assign(LatencyBinEdges().size() - 1, 0);

  if (pairs.empty()) {
    CADENCE_LOG_DEBUG("no response pairs found");
    return stats;
  }

  std::vector<double>                        latencies;
  std::map<std::string, std::vector<double>> by_counterparty;
  std::map<int, std::vector<double>>         by_hour;
  std::map<std::string, std::vector<double>> by_day;
  latencies.reserve(pairs.size());

  for (auto& pair : pairs) {
    latencies.push_back(pair.latency_seconds);
    by_counterparty[pair.counterparty].push_back(pair.latency_seconds);
    by_hour[cadence::util::HourOfDay(pair.sent_at)].push_back(pair.latency_seconds);
    by_day[std::string(cadence::util::DayName(cadence::util::DayOfWeek(pair.sent_at)))].push_back(pair.latency_seconds);

    pair.is_quick   = pair.latency_seconds < options_.quick_threshold_seconds;
    pair.is_delayed = pair.latency_seconds > options_.delayed_threshold_seconds;
    stats.quick_count += pair.is_quick ? 1 : 0;
    stats.delayed_count += pair.is_delayed ? 1 : 0;
  }

  stats.total_pairs     = pairs.size();
  stats.average_seconds = cadence::util::Mean(latencies);
  stats.median_seconds  = cadence::util::Median(latencies);

  auto& dist   = stats.distribution;
  dist.count   = latencies.size();
  dist.mean    = stats.average_seconds.value_or(0.0);
  dist.std_dev = cadence::util::SampleStdDev(latencies);
  dist.min     = *std::min_element(latencies.begin(), latencies.end());
  dist.max     = *std::max_element(latencies.begin(), latencies.end());
  for (int p : kPercentiles) {
    dist.percentiles[p] = cadence::util::Quantile(latencies, p / 100.0).value_or(0.0);
  }
  dist.bin_counts = cadence::util::Histogram(latencies, dist.bin_edges);

  stats.per_counterparty_average = GroupMeans(by_counterparty);
  stats.by_hour_average          = GroupMeans(by_hour);
  stats.by_day_average           = GroupMeans(by_day);

  const auto outlier_flags = cadence::util::FlagIqrOutliers(latencies, options_.outlier_iqr_k);
  for (std::size_t i = 0; i < pairs.size(); ++i) {
    pairs[i].is_outlier = outlier_flags[i];
    if (pairs[i].is_outlier) {
      stats.outliers.push_back(pairs[i]);
    }
  }

  // Earliest hour wins ties; the map iterates hours in ascending order.
  for (const auto& [hour, mean] : stats.by_hour_average) {
    if (!stats.best_hour || mean < stats.by_hour_average.at(*stats.best_hour)) {
      stats.best_hour = hour;
    }
  }

  stats.time_of_day.morning_seconds   = MeanOfHours(stats.by_hour_average, [](int h) { return h >= 5 && h < 12; });
  stats.time_of_day.afternoon_seconds = MeanOfHours(stats.by_hour_average, [](int h) { return h >= 12 && h < 18; });
  stats.time_of_day.evening_seconds   = MeanOfHours(stats.by_hour_average, [](int h) { return h >= 18 || h < 5; });

  stats.pairs = std::move(pairs);
  return stats;
}

} // namespace cadence::analysis
