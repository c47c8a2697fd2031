#pragma once

#include <optional>
#include <string>

#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::collaborators {

/*
  Optional model-backed augmentation. Implementations may block and may
  throw (including "model not trained"); the engine catches every failure
  and records it without failing the call. nullopt means the model had
  nothing to add.
*/
class MlService {
 public:
  virtual ~MlService() = default;

  virtual std::optional<cadence::model::MlAugmentation> Predict(const std::string& model_name, const cadence::ingest::RecordTable& records,
                                                                const cadence::ingest::ColumnMapping& mapping) = 0;
};

} // namespace cadence::collaborators
