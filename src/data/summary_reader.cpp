#include <topline/data/summary_reader.h>
#include <topline/core/errors.h>
#include <topline/data/storage.h>
#include "../transforms/components/dataframe_utils.h"
#include <algorithm>
#include <parquet/arrow/reader.h>
#include <spdlog/spdlog.h>

namespace topline::data {

using transform::utils::ThrowIfNotOk;
using transform::utils::ValueOrThrow;

namespace {

std::shared_ptr<arrow::DataType> ArrowType(epoch_core::ColumnType type) {
  switch (type) {
  case epoch_core::ColumnType::String:
    return arrow::utf8();
  case epoch_core::ColumnType::Integer:
    return arrow::int64();
  case epoch_core::ColumnType::Decimal:
    return arrow::float64();
  default:
    break;
  }
  throw std::invalid_argument("Unsupported column type " +
                              epoch_core::ColumnTypeWrapper::ToString(type));
}

// Spark writes _SUCCESS, _temporary/ and .crc files beside the data
bool IsHiddenEntry(std::string_view relative) {
  size_t start = 0;
  while (start < relative.size()) {
    auto end = relative.find('/', start);
    if (end == std::string_view::npos) {
      end = relative.size();
    }
    if (end > start && (relative[start] == '_' || relative[start] == '.')) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

} // namespace

std::vector<std::string> SummaryReader::ListParquetFiles(std::string const &uri) {
  const auto location = ResolveLocation(uri);

  arrow::fs::FileSelector selector;
  selector.base_dir = location.path;
  selector.recursive = true;
  auto entries = ValueOrThrow(location.filesystem->GetFileInfo(selector),
                              "Failed to list " + uri);

  std::vector<std::string> files;
  for (auto const &entry : entries) {
    if (!entry.IsFile() || !entry.path().ends_with(".parquet")) {
      continue;
    }
    std::string_view relative{entry.path()};
    if (relative.starts_with(location.path)) {
      relative.remove_prefix(location.path.size());
    }
    if (!relative.empty() && relative.front() == '/') {
      relative.remove_prefix(1);
    }
    if (!IsHiddenEntry(relative)) {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);
  return files;
}

std::shared_ptr<arrow::Table>
SummaryReader::ApplyInputSchema(std::shared_ptr<arrow::Table> const &table,
                                std::string const &path) const {
  arrow::FieldVector fields;
  std::vector<std::shared_ptr<arrow::ChunkedArray>> columns;
  fields.reserve(m_inputSchema.size());
  columns.reserve(m_inputSchema.size());

  for (auto const &spec : m_inputSchema) {
    auto column = table->GetColumnByName(spec.name);
    if (!column) {
      throw SchemaMismatchError(path + " has no column '" + spec.name + "'");
    }
    auto type = ArrowType(spec.type);
    columns.push_back(transform::utils::CastColumn(column, type, spec.name));
    fields.push_back(arrow::field(spec.name, type));
  }
  return arrow::Table::Make(arrow::schema(fields), columns, table->num_rows());
}

epoch_frame::DataFrame SummaryReader::Read(std::string const &uri) const {
  const auto files = ListParquetFiles(uri);
  if (files.empty()) {
    throw std::runtime_error("No parquet files found under " + uri);
  }
  const auto location = ResolveLocation(uri);

  std::vector<std::shared_ptr<arrow::Table>> tables;
  tables.reserve(files.size());
  for (auto const &path : files) {
    auto input = ValueOrThrow(location.filesystem->OpenInputFile(path),
                              "Failed to open " + path);
    auto reader = ValueOrThrow(
        parquet::arrow::OpenFile(input, arrow::default_memory_pool()),
        "Failed to open parquet file " + path);

    std::shared_ptr<arrow::Table> table;
    ThrowIfNotOk(reader->ReadTable(&table), "Failed to read " + path);
    tables.push_back(ApplyInputSchema(table, path));
    SPDLOG_DEBUG("Read {} rows from {}", table->num_rows(), path);
  }

  auto summary = ValueOrThrow(arrow::ConcatenateTables(tables),
                              "Failed to concatenate " + uri);
  summary = ValueOrThrow(summary->CombineChunks(),
                         "Failed to combine chunks of " + uri);
  SPDLOG_INFO("Read {} summary rows from {} parquet files under {}",
              summary->num_rows(), files.size(), uri);
  return epoch_frame::DataFrame(summary);
}

} // namespace topline::data
