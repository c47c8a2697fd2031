#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace cadence::util {

/*
  Small descriptive-statistics helpers over double samples.

  Quantiles use linear interpolation between closest ranks, so results are
  deterministic for a given multiset of values regardless of input order.
*/

std::optional<double> Mean(const std::vector<double>& values);
std::optional<double> Median(const std::vector<double>& values);

// q in [0, 1]
std::optional<double> Quantile(std::vector<double> values, double q);

// Sample standard deviation (n - 1 denominator); 0 for fewer than two values.
double SampleStdDev(const std::vector<double>& values);

struct IqrFence {
  double q1{0.0};
  double q3{0.0};
  double lower{0.0};
  double upper{0.0};

  bool IsOutlier(double value) const {
    return value < lower || value > upper;
  }
};

// Tukey fences [Q1 - k*IQR, Q3 + k*IQR]; nullopt for an empty sample.
std::optional<IqrFence> ComputeIqrFence(const std::vector<double>& values, double k = 1.5);

std::vector<bool> FlagIqrOutliers(const std::vector<double>& values, double k = 1.5);

// Counts values into half-open bins [edges[i], edges[i+1]); values outside are dropped.
std::vector<std::size_t> Histogram(const std::vector<double>& values, const std::vector<double>& edges);

} // namespace cadence::util
