#pragma once

#include <vector>

#include "internal/model/analysis.hpp"

namespace cadence::patterns {

// First-stage significance of an average response time, in [0, 3].
double ResponseTimeSignificance(double average_seconds);

/*
  Maps a ResponseAnalysis onto uniform pattern records with first-stage
  significance (scale about 0..3). Stages that failed contribute nothing.

  | pattern                              | emitted when                                |
  |--------------------------------------|---------------------------------------------|
  | response_time/average                | average latency defined                     |
  | response_time/quick_responder        | quick_ratio > 0.3                           |
  | response_time/delayed_responder      | delayed_ratio > 0.2                         |
  | reciprocity/initiation_imbalance     | initiation ratio < 0.3 or > 0.7             |
  | conversation_flow/long_conversations | > 10 conversations, mean duration > 1800 s  |
  | conversation_flow/message_intensive  | mean message count > 15                     |

  Ratio denominators use the total pair count, falling back to
  quick + delayed; with a zero denominator no ratio pattern is emitted.
*/
std::vector<cadence::model::Pattern> ConvertResponseAnalysis(const cadence::model::ResponseAnalysis& analysis);

} // namespace cadence::patterns
