#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/util/result.hpp"
#include "internal/util/stats.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace {

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) < eps;
}

void TestParseTimestampAcceptsSupportedLayouts() {
  const auto date_only = cadence::util::ParseTimestamp("2023-01-02");
  const auto spaced    = cadence::util::ParseTimestamp("2023-01-02 10:30");
  const auto seconds   = cadence::util::ParseTimestamp("2023-01-02 10:30:15");
  const auto iso       = cadence::util::ParseTimestamp("2023-01-02T10:30:15Z");
  const auto fraction  = cadence::util::ParseTimestamp("2023-01-02T10:30:15.250000");

  assert(date_only && spaced && seconds && iso && fraction);
  assert(cadence::util::SecondsBetween(*date_only, *spaced) == 10 * 3600 + 30 * 60);
  assert(cadence::util::SecondsBetween(*seconds, *iso) == 0.0);
  assert(Near(cadence::util::SecondsBetween(*seconds, *fraction), 0.25));
  assert(cadence::util::FormatIso8601(*iso) == "2023-01-02T10:30:15");
}

void TestParseTimestampRejectsMalformedInput() {
  assert(!cadence::util::ParseTimestamp("not-a-date"));
  assert(!cadence::util::ParseTimestamp("2023-02-30"));
  assert(!cadence::util::ParseTimestamp("2023-01-02 25:00"));
  assert(!cadence::util::ParseTimestamp("2023-01-02 10:30:15 extra"));
  assert(!cadence::util::ParseTimestamp(""));
}

void TestCalendarHelpers() {
  const auto monday = *cadence::util::ParseTimestamp("2023-01-02 23:59:59");
  const auto sunday = *cadence::util::ParseTimestamp("2023-01-01 00:00:00");

  assert(cadence::util::HourOfDay(monday) == 23);
  assert(cadence::util::DayOfWeek(monday) == 0);
  assert(cadence::util::DayOfWeek(sunday) == 6);
  assert(cadence::util::DayName(0) == "Monday");
  assert(cadence::util::DayName(6) == "Sunday");
  assert(cadence::util::SecondsBetween(monday, sunday) < 0.0);
}

void TestProtoTimestampConversion() {
  const auto tp = *cadence::util::ParseTimestamp("2023-01-02T10:30:15.5");
  const auto ts = cadence::util::ToProto(tp);
  assert(ts.nanos() == 500000000);
  assert(cadence::util::FromProto(ts) == tp);
}

void TestDescriptiveStatistics() {
  assert(!cadence::util::Mean({}));
  assert(!cadence::util::Median({}));
  assert(*cadence::util::Median({1.0, 3.0, 2.0}) == 2.0);
  assert(Near(*cadence::util::Quantile({1.0, 2.0, 3.0, 4.0}, 0.25), 1.75));
  assert(cadence::util::SampleStdDev({5.0}) == 0.0);
  assert(Near(cadence::util::SampleStdDev({2, 4, 4, 4, 5, 5, 7, 9}), std::sqrt(32.0 / 7.0)));
}

void TestIqrOutliersAreDeterministic() {
  const std::vector<double> values{10, 12, 11, 13, 12, 100};

  const auto fence = cadence::util::ComputeIqrFence(values);
  assert(fence.has_value());
  assert(Near(fence->q1, 11.25));
  assert(Near(fence->q3, 12.75));

  const auto flags = cadence::util::FlagIqrOutliers(values);
  const auto again = cadence::util::FlagIqrOutliers(values);
  assert(flags == again);
  assert(flags == std::vector<bool>({false, false, false, false, false, true}));
  assert(!cadence::util::ComputeIqrFence({}));
}

void TestHistogramUsesHalfOpenBins() {
  const auto counts = cadence::util::Histogram({0.0, 59.9, 60.0, 299.0, 300.0, -1.0}, {0.0, 60.0, 300.0});
  assert(counts == std::vector<std::size_t>({2, 2}));
}

void TestResultCarriesValueOrError() {
  auto ok = cadence::util::Result<int>::Ok(7);
  assert(ok && *ok == 7);

  auto err = cadence::util::Result<int>::Err("");
  assert(!err);
  assert(err.error == "unknown error");

  bool threw = false;
  try {
    (void)err.Value();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(cadence::util::ToLower("Error During X") == "error during x");
}

} // namespace

int main() {
  TestParseTimestampAcceptsSupportedLayouts();
  TestParseTimestampRejectsMalformedInput();
  TestCalendarHelpers();
  TestProtoTimestampConversion();
  TestDescriptiveStatistics();
  TestIqrOutliersAreDeterministic();
  TestHistogramUsesHalfOpenBins();
  TestResultCarriesValueOrError();

  std::cout << "cadence_unit_util: pass\n";
  return 0;
}
