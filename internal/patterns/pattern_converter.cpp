#include "internal/patterns/pattern_converter.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace cadence::patterns {
namespace {

using cadence::model::Pattern;

constexpr double      kQuickRatioThreshold   = 0.3;
constexpr double      kDelayedRatioThreshold = 0.2;
constexpr double      kInitiationLow         = 0.3;
constexpr double      kInitiationHigh        = 0.7;
constexpr std::size_t kLongConversationMin   = 10;
constexpr double      kLongDurationSeconds   = 1800.0;
constexpr double      kIntensiveMessageCount = 15.0;

Pattern MakePattern(std::string type, std::string subtype, std::string description, double significance, std::size_t occurrences) {
  Pattern pattern;
  pattern.pattern_type = std::move(type);
  pattern.subtype      = std::move(subtype);
  pattern.description  = std::move(description);
  pattern.significance = significance;
  pattern.occurrences  = occurrences;
  return pattern;
}

void AppendTimingPatterns(const cadence::model::TimingStatistics& timing, std::vector<Pattern>& out) {
  if (timing.average_seconds) {
    const double average = *timing.average_seconds;
    auto pattern = MakePattern("response_time", "average", fmt::format("Average response time is {:.1f} minutes", average / 60.0),
                               ResponseTimeSignificance(average), timing.total_pairs);
    pattern.metadata["value_seconds"] = average;
    if (timing.median_seconds) {
      pattern.metadata["median_seconds"] = *timing.median_seconds;
    }
    out.push_back(std::move(pattern));
  }

  const std::size_t denominator = timing.total_pairs > 0 ? timing.total_pairs : timing.quick_count + timing.delayed_count;
  if (denominator == 0) {
    return;
  }

  const double quick_ratio = static_cast<double>(timing.quick_count) / static_cast<double>(denominator);
  if (quick_ratio > kQuickRatioThreshold) {
    auto pattern = MakePattern("response_time", "quick_responder", fmt::format("Responds quickly to {:.0f}% of messages", quick_ratio * 100.0),
                               std::min(3.0, quick_ratio * 5.0), timing.quick_count);
    pattern.metadata["quick_ratio"] = quick_ratio;
    out.push_back(std::move(pattern));
  }

  const double delayed_ratio = static_cast<double>(timing.delayed_count) / static_cast<double>(denominator);
  if (delayed_ratio > kDelayedRatioThreshold) {
    auto pattern = MakePattern("response_time", "delayed_responder", fmt::format("Responds slowly to {:.0f}% of messages", delayed_ratio * 100.0),
                               std::min(3.0, delayed_ratio * 6.0), timing.delayed_count);
    pattern.metadata["delayed_ratio"] = delayed_ratio;
    out.push_back(std::move(pattern));
  }
}

void AppendReciprocityPatterns(const cadence::model::ReciprocityAnalysis& reciprocity, std::vector<Pattern>& out) {
  if (!reciprocity.overall_initiation_ratio) {
    return;
  }

  const double ratio = *reciprocity.overall_initiation_ratio;
  if (ratio >= kInitiationLow && ratio <= kInitiationHigh) {
    return;
  }

  std::size_t initiations = 0;
  for (const auto& [counterparty, summary] : reciprocity.counterparties) {
    initiations += summary.total_initiations;
  }

  const auto description = ratio < kInitiationLow
                               ? fmt::format("User rarely initiates conversations ({:.0f}% of initiations)", ratio * 100.0)
                               : fmt::format("User usually initiates conversations ({:.0f}% of initiations)", ratio * 100.0);
  auto pattern = MakePattern("reciprocity", "initiation_imbalance", description, std::min(2.5, std::abs(0.5 - ratio) * 6.0), initiations);
  pattern.metadata["initiation_ratio"] = ratio;
  out.push_back(std::move(pattern));
}

void AppendFlowPatterns(const cadence::model::ConversationFlowAnalysis& flows, std::vector<Pattern>& out) {
  if (flows.conversation_count > kLongConversationMin && flows.average_duration_seconds && *flows.average_duration_seconds > kLongDurationSeconds) {
    const double duration = *flows.average_duration_seconds;
    auto pattern = MakePattern("conversation_flow", "long_conversations", fmt::format("Conversations tend to be long (average {:.0f} minutes)", duration / 60.0),
                               std::min(2.0, duration / 3600.0), flows.conversation_count);
    pattern.metadata["average_duration_seconds"] = duration;
    pattern.metadata["conversation_count"]       = static_cast<double>(flows.conversation_count);
    out.push_back(std::move(pattern));
  }

  if (flows.average_message_count && *flows.average_message_count > kIntensiveMessageCount) {
    const double messages = *flows.average_message_count;
    auto pattern = MakePattern("conversation_flow", "message_intensive", fmt::format("Conversations are message-intensive (average {:.1f} messages)", messages),
                               std::min(2.0, messages / 10.0), flows.conversation_count);
    pattern.metadata["average_message_count"] = messages;
    out.push_back(std::move(pattern));
  }
}

} // namespace

double ResponseTimeSignificance(double average_seconds) {
  if (average_seconds < 60.0) {
    return std::min(3.0, 3.0 * (60.0 - average_seconds) / 50.0);
  }
  if (average_seconds > 3600.0) {
    return std::min(3.0, 1.5 * average_seconds / 3600.0);
  }
  return std::clamp(std::abs(600.0 - average_seconds) / 600.0, 0.5, 1.5);
}

std::vector<Pattern> ConvertResponseAnalysis(const cadence::model::ResponseAnalysis& analysis) {
  std::vector<Pattern> patterns;
  if (analysis.response_times) {
    AppendTimingPatterns(*analysis.response_times, patterns);
  }
  if (analysis.reciprocity) {
    AppendReciprocityPatterns(*analysis.reciprocity, patterns);
  }
  if (analysis.conversation_flows) {
    AppendFlowPatterns(*analysis.conversation_flows, patterns);
  }
  return patterns;
}

} // namespace cadence::patterns
