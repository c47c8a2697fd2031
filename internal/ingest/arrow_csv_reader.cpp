#include "internal/ingest/arrow_csv_reader.hpp"

#include <arrow/array.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/table.h>

#include <filesystem>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cadence::ingest {
namespace {

std::vector<std::string> ColumnToStrings(const arrow::ChunkedArray& column) {
  std::vector<std::string> values;
  values.reserve(static_cast<std::size_t>(column.length()));

  for (const auto& chunk : column.chunks()) {
    if (chunk->type_id() == arrow::Type::STRING) {
      const auto& strings = static_cast<const arrow::StringArray&>(*chunk);
      for (int64_t i = 0; i < strings.length(); ++i) {
        values.push_back(strings.IsNull(i) ? std::string() : strings.GetString(i));
      }
      continue;
    }

    for (int64_t i = 0; i < chunk->length(); ++i) {
      if (chunk->IsNull(i)) {
        values.emplace_back();
        continue;
      }
      values.push_back(Unwrap(chunk->GetScalar(i))->ToString());
    }
  }
  return values;
}

} // namespace

RawTable ArrowCsvReader::Read(const std::string& path, const ColumnMapping& mapping) {
  if (!std::filesystem::exists(path)) {
    throw cadence::util::NotFound("csv file not found: " + path);
  }

  auto input = Unwrap(arrow::io::ReadableFile::Open(path));

  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  for (const auto& [key, column] : mapping.ToMap()) {
    convert_options.column_types[column] = arrow::utf8();
  }
  // Empty cells stay empty strings instead of turning into nulls.
  convert_options.strings_can_be_null = false;

  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, arrow::csv::ReadOptions::Defaults(),
                                                     arrow::csv::ParseOptions::Defaults(), convert_options));
  auto table  = Unwrap(reader->Read());

  RawTable raw;
  for (int i = 0; i < table->num_columns(); ++i) {
    raw.AddColumn(table->field(i)->name(), ColumnToStrings(*table->column(i)));
  }

  CADENCE_LOG_DEBUG("csv loaded", {cadence::observability::StringField("path", path), cadence::observability::IntField("rows", table->num_rows()),
                                   cadence::observability::IntField("columns", table->num_columns())});
  return raw;
}

} // namespace cadence::ingest
