#include "schema_reconciler.h"
#include "../dataframe_utils.h"
#include <epoch_frame/factory/index_factory.h>
#include <spdlog/spdlog.h>

namespace topline::transform {

namespace {

CubeDimension DimensionOf(std::string_view name) {
  for (size_t d = 0; d < kDimensionCount; ++d) {
    if (DIMENSION_COLUMNS[d] == name) {
      return static_cast<CubeDimension>(d);
    }
  }
  throw std::invalid_argument("not a report dimension: " + std::string{name});
}

template <typename BuilderType, typename ValueType>
std::shared_ptr<arrow::Array> BuildNumeric(Cube const &cube,
                                           std::ptrdiff_t fieldIndex,
                                           std::string const &name) {
  BuilderType builder;
  const auto context = "Failed to build column '" + name + "'";
  utils::ThrowIfNotOk(builder.Reserve(static_cast<int64_t>(cube.rows.size())),
                      context);

  for (auto const &row : cube.rows) {
    if (fieldIndex < 0) {
      builder.UnsafeAppend(ValueType{0});
      continue;
    }
    auto const &sum = row.sums[static_cast<size_t>(fieldIndex)];
    if (IsNull(sum)) {
      builder.UnsafeAppendNull();
    } else if (auto const *integer = std::get_if<int64_t>(&sum)) {
      builder.UnsafeAppend(static_cast<ValueType>(*integer));
    } else {
      builder.UnsafeAppend(static_cast<ValueType>(std::get<double>(sum)));
    }
  }
  return utils::ValueOrThrow(builder.Finish(), context);
}

} // namespace

std::shared_ptr<arrow::Array>
SchemaReconciler::BuildDimension(Cube const &cube,
                                 CubeDimension dimension) const {
  arrow::StringBuilder builder;
  const auto context = "Failed to build column '" +
                       std::string{DIMENSION_COLUMNS[static_cast<size_t>(dimension)]} +
                       "'";
  utils::ThrowIfNotOk(builder.Reserve(static_cast<int64_t>(cube.rows.size())),
                      context);

  for (auto const &row : cube.rows) {
    // Missing prints like Wildcard, as the legacy report fills every null
    // category with the token
    auto const &value = Get(row.key, dimension);
    if (auto const *text = std::get_if<std::string>(&value)) {
      utils::ThrowIfNotOk(builder.Append(*text), context);
    } else {
      utils::ThrowIfNotOk(builder.Append(m_wildcardToken), context);
    }
  }
  return utils::ValueOrThrow(builder.Finish(), context);
}

std::shared_ptr<arrow::Array>
SchemaReconciler::BuildAggregate(Cube const &cube, ColumnSpec const &column) {
  const auto fieldIndex = cube.FieldIndex(column.name);
  if (column.type == epoch_core::ColumnType::Decimal) {
    return BuildNumeric<arrow::DoubleBuilder, double>(cube, fieldIndex,
                                                      column.name);
  }
  return BuildNumeric<arrow::Int64Builder, int64_t>(cube, fieldIndex,
                                                    column.name);
}

epoch_frame::DataFrame SchemaReconciler::Project(Cube const &cube) const {
  std::vector<std::shared_ptr<arrow::ChunkedArray>> columns;
  std::vector<std::string> names;
  columns.reserve(m_historicalSchema.size());
  names.reserve(m_historicalSchema.size());

  for (auto const &column : m_historicalSchema) {
    auto array = IsDimensionColumn(column.name)
                     ? BuildDimension(cube, DimensionOf(column.name))
                     : BuildAggregate(cube, column);
    if (!IsDimensionColumn(column.name) && cube.FieldIndex(column.name) < 0) {
      SPDLOG_DEBUG("Column '{}' is absent from the summary, filled with 0",
                   column.name);
    }
    columns.push_back(utils::ToChunkedArray(std::move(array)));
    names.push_back(column.name);
  }

  auto index = epoch_frame::factory::index::from_range(
      static_cast<int64_t>(cube.rows.size()));
  return epoch_frame::make_dataframe(index, columns, names);
}

} // namespace topline::transform
