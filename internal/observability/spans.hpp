#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace cadence::runtime::config {
class RuntimeConfig;
}

namespace cadence::observability {

bool InitializeTracing(const cadence::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const cadence::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span around one unit of analysis work. Without ENABLE_OTEL every
  member is an inline no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Span for one named analysis stage: "cadence.stage.<stage>", with the
// stage also set as the "cadence.stage" attribute.
SpanScope StageSpan(std::string_view stage);

/*
  Engine counters. `route` is the RPC name, e.g.
  "AnalysisService.DetectPatterns". `stage` is a sub-analysis or
  collaborator step that degraded without failing the call.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordAnalysis(std::string_view route, bool success);
  void ObserveAnalysisLatencyMs(std::string_view route, double latency_ms);
  void RecordStageFailure(std::string_view stage);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const cadence::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const cadence::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAnalysis(std::string_view, bool) {
}

inline void Metrics::ObserveAnalysisLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordStageFailure(std::string_view) {
}
#endif

inline SpanScope StageSpan(std::string_view stage) {
  SpanScope span(std::string("cadence.stage.") + std::string(stage));
  span.SetAttribute("cadence.stage", stage);
  return span;
}

} // namespace cadence::observability
