#include "analysis_service.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "internal/analysis/response_analyzer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/orchestrator/pattern_orchestrator.hpp"
#include "internal/service/report_codec.hpp"
#include "internal/util/errors.hpp"

namespace cadence::service {

using namespace cadence::analysis::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::size_t rows, Fn&& fn) {
  cadence::observability::SpanScope span(route);
  span.SetAttribute("records.rows", static_cast<std::int64_t>(rows));

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    cadence::observability::Metrics::Instance().RecordAnalysis(route, true);
    cadence::observability::Metrics::Instance().ObserveAnalysisLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CADENCE_LOG_ERROR("RPC failed", {cadence::observability::StringField("route", route), cadence::observability::StringField("error", ex.what())});
    cadence::observability::Metrics::Instance().RecordAnalysis(route, false);
    cadence::observability::Metrics::Instance().ObserveAnalysisLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

std::size_t RowCount(const RecordBatch& batch) {
  std::size_t rows = 0;
  for (const auto& column : batch.columns()) {
    rows = std::max<std::size_t>(rows, static_cast<std::size_t>(column.values_size()));
  }
  return rows;
}

} // namespace

AnalysisService::AnalysisService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.analyzer || !ctx_.orchestrator) {
    throw cadence::util::InvalidArgument("analysis service requires an analyzer and an orchestrator");
  }
}

ResponseAnalysisReport AnalysisService::AnalyzeResponses(const AnalyzeRequest& req) {
  return ObserveRpc("AnalysisService.AnalyzeResponses", RowCount(req.records()), [&] {
    const auto mapping = MergeMapping(ctx_.default_mapping, req.column_mapping());
    return ToProto(ctx_.analyzer->Analyze(FromProto(req.records()), mapping));
  });
}

PatternReport AnalysisService::DetectPatterns(const AnalyzeRequest& req) {
  return ObserveRpc("AnalysisService.DetectPatterns", RowCount(req.records()), [&] {
    const auto mapping = MergeMapping(ctx_.default_mapping, req.column_mapping());
    return ToProto(ctx_.orchestrator->DetectPatterns(FromProto(req.records()), mapping));
  });
}

PredictResponseReply AnalysisService::PredictResponse(const PredictResponseRequest& req) {
  return ObserveRpc("AnalysisService.PredictResponse", RowCount(req.records()), [&] {
    const auto mapping = MergeMapping(ctx_.default_mapping, req.column_mapping());
    return ToProto(ctx_.analyzer->PredictResponseBehavior(FromProto(req.records()), req.counterparty(), mapping));
  });
}

} // namespace cadence::service
