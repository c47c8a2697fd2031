#include "stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace cadence::util {

std::optional<double> Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

std::optional<double> Median(const std::vector<double>& values) {
  return Quantile(values, 0.5);
}

std::optional<double> Quantile(std::vector<double> values, double q) {
  if (values.empty()) {
    return std::nullopt;
  }
  std::sort(values.begin(), values.end());

  q                  = std::clamp(q, 0.0, 1.0);
  const double rank  = q * static_cast<double>(values.size() - 1);
  const auto   lo    = static_cast<std::size_t>(std::floor(rank));
  const auto   hi    = static_cast<std::size_t>(std::ceil(rank));
  const double frac  = rank - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

double SampleStdDev(const std::vector<double>& values) {
  if (values.size() < 2) {
    return 0.0;
  }
  const double mean = *Mean(values);
  double       sum  = 0.0;
  for (double v : values) {
    sum += (v - mean) * (v - mean);
  }
  return std::sqrt(sum / static_cast<double>(values.size() - 1));
}

std::optional<IqrFence> ComputeIqrFence(const std::vector<double>& values, double k) {
  if (values.empty()) {
    return std::nullopt;
  }
  IqrFence fence;
  fence.q1         = *Quantile(values, 0.25);
  fence.q3         = *Quantile(values, 0.75);
  const double iqr = fence.q3 - fence.q1;
  fence.lower      = fence.q1 - k * iqr;
  fence.upper      = fence.q3 + k * iqr;
  return fence;
}

std::vector<bool> FlagIqrOutliers(const std::vector<double>& values, double k) {
  std::vector<bool> flags(values.size(), false);
  const auto        fence = ComputeIqrFence(values, k);
  if (!fence) {
    return flags;
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    flags[i] = fence->IsOutlier(values[i]);
  }
  return flags;
}

std::vector<std::size_t> Histogram(const std::vector<double>& values, const std::vector<double>& edges) {
  if (edges.size() < 2) {
    return {};
  }
  std::vector<std::size_t> counts(edges.size() - 1, 0);
  for (double v : values) {
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
      if (v >= edges[i] && v < edges[i + 1]) {
        ++counts[i];
        break;
      }
    }
  }
  return counts;
}

} // namespace cadence::util
