#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/analysis.hpp"

namespace cadence::patterns {

// Confidence in [0, 1]: the pattern's own confidence when set, otherwise its
// first-stage significance divided by 3, otherwise 0.
double ResolveConfidence(const cadence::model::Pattern& pattern);

// confidence * min(1, occurrences / max(1, 0.1 * total_records)); always <= 1.
double PatternSignificance(double confidence, std::size_t occurrences, std::size_t total_records);

// Second-stage scoring of every pattern, then a stable descending sort.
void ScoreAndRank(std::vector<cadence::model::Pattern>& patterns, std::size_t total_records);

// Keeps patterns with min_confidence <= confidence < max_confidence.
std::vector<cadence::model::Pattern> FilterByConfidence(const std::vector<cadence::model::Pattern>& patterns, double min_confidence = 0.0,
                                                        double max_confidence = 1.0);

} // namespace cadence::patterns
