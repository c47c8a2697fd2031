#pragma once

#include <string>

#include "cadence/analysis/v1.hpp"
#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/raw_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::service {

/*
  Conversions between the wire messages and the in-process model.

  Inbound: RecordBatch becomes a RawTable (cells stay untyped; validation
  happens in the analyzer). Outbound: every report field is copied, stage
  results map onto the oneof value or its error stub.
*/

cadence::ingest::RawTable FromProto(const cadence::analysis::v1::RecordBatch& batch);
cadence::analysis::v1::RecordBatch ToProto(const cadence::ingest::RawTable& table);

// Request aliases overlay the server default mapping.
// Throws util::InvalidArgument on an unknown key.
cadence::ingest::ColumnMapping MergeMapping(const cadence::ingest::ColumnMapping&                  defaults,
                                            const google::protobuf::Map<std::string, std::string>& overrides);

cadence::analysis::v1::ResponseAnalysisReport ToProto(const cadence::model::ResponseAnalysis& analysis);
cadence::analysis::v1::PatternReport          ToProto(const cadence::model::PatternReport& report);
cadence::analysis::v1::PredictResponseReply   ToProto(const cadence::model::ResponsePrediction& prediction);

} // namespace cadence::service
