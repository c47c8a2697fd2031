#include "internal/patterns/significance.hpp"

#include <algorithm>
#include <cmath>

namespace cadence::patterns {

double ResolveConfidence(const cadence::model::Pattern& pattern) {
  double confidence = 0.0;
  if (pattern.confidence) {
    confidence = *pattern.confidence;
  } else if (pattern.significance) {
    confidence = *pattern.significance / 3.0;
  }
  if (std::isnan(confidence)) {
    return 0.0;
  }
  return std::clamp(confidence, 0.0, 1.0);
}

double PatternSignificance(double confidence, std::size_t occurrences, std::size_t total_records) {
  const double expected = std::max(1.0, 0.1 * static_cast<double>(total_records));
  return std::clamp(confidence, 0.0, 1.0) * std::min(1.0, static_cast<double>(occurrences) / expected);
}

void ScoreAndRank(std::vector<cadence::model::Pattern>& patterns, std::size_t total_records) {
  for (auto& pattern : patterns) {
    pattern.confidence           = ResolveConfidence(pattern);
    pattern.pattern_significance = PatternSignificance(*pattern.confidence, pattern.occurrences, total_records);
  }
  std::stable_sort(patterns.begin(), patterns.end(),
                   [](const auto& a, const auto& b) { return a.pattern_significance > b.pattern_significance; });
}

std::vector<cadence::model::Pattern> FilterByConfidence(const std::vector<cadence::model::Pattern>& patterns, double min_confidence,
                                                        double max_confidence) {
  std::vector<cadence::model::Pattern> kept;
  for (const auto& pattern : patterns) {
    const double confidence = ResolveConfidence(pattern);
    if (min_confidence <= confidence && confidence < max_confidence) {
      kept.push_back(pattern);
    }
  }
  return kept;
}

} // namespace cadence::patterns
