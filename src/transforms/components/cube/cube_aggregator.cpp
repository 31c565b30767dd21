#include "cube_aggregator.h"
#include "../dataframe_utils.h"
#include <topline/core/errors.h>
#include <algorithm>
#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_reduce.h>
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace topline::transform {

namespace {

using PartialCube =
    std::unordered_map<CubeKey, std::vector<AggregateValue>, CubeKeyHash>;

struct CubeInput {
  std::array<std::shared_ptr<arrow::StringArray>, kDimensionCount> dimensions;
  std::vector<std::shared_ptr<arrow::Array>> aggregates;
};

std::shared_ptr<arrow::ChunkedArray> RequireColumn(arrow::Table const &table,
                                                   std::string const &name) {
  auto column = table.GetColumnByName(name);
  if (!column) {
    throw SchemaMismatchError("normalized data has no column '" + name + "'");
  }
  return column;
}

CubeInput MakeCubeInput(arrow::Table const &table,
                        std::vector<AggregateField> const &fields) {
  CubeInput input;
  for (size_t d = 0; d < kDimensionCount; ++d) {
    const std::string name{DIMENSION_COLUMNS[d]};
    input.dimensions[d] = utils::CombineChunks<arrow::StringArray>(
        utils::CastColumn(RequireColumn(table, name), arrow::utf8(), name),
        name);
  }

  input.aggregates.reserve(fields.size());
  for (auto const &field : fields) {
    auto type = field.type == epoch_core::ColumnType::Decimal
                    ? arrow::float64()
                    : arrow::int64();
    input.aggregates.push_back(utils::CombineChunks<arrow::Array>(
        utils::CastColumn(RequireColumn(table, field.name), type, field.name),
        field.name));
  }
  return input;
}

DimensionValue ReadDimension(arrow::StringArray const &column, int64_t row) {
  if (column.IsNull(row)) {
    return Missing{};
  }
  return std::string{column.GetView(row)};
}

AggregateValue ReadAggregate(arrow::Array const &column,
                             epoch_core::ColumnType type, int64_t row) {
  if (column.IsNull(row)) {
    return std::monostate{};
  }
  if (type == epoch_core::ColumnType::Decimal) {
    return static_cast<arrow::DoubleArray const &>(column).Value(row);
  }
  return static_cast<arrow::Int64Array const &>(column).Value(row);
}

void AddGroup(PartialCube &partial, CubeKey key,
              std::vector<AggregateValue> const &values) {
  auto [it, inserted] = partial.try_emplace(std::move(key), values);
  if (!inserted) {
    for (size_t i = 0; i < values.size(); ++i) {
      Accumulate(it->second[i], values[i]);
    }
  }
}

void MergeInto(PartialCube &target, PartialCube const &source) {
  for (auto const &[key, sums] : source) {
    AddGroup(target, key, sums);
  }
}

} // namespace

CubeAggregator::CubeAggregator(std::vector<ColumnSpec> const &aggregateColumns,
                               int64_t partitionSize)
    : m_partitionSize(std::max<int64_t>(partitionSize, 1)) {
  m_fields.reserve(aggregateColumns.size());
  for (auto const &column : aggregateColumns) {
    m_fields.push_back(AggregateField{column.name, column.type});
  }
}

Cube CubeAggregator::Aggregate(epoch_frame::DataFrame const &normalized) const {
  auto table = normalized.table();
  const auto input = MakeCubeInput(*table, m_fields);
  const auto numRows = table->num_rows();
  auto const &date =
      *input.dimensions[static_cast<size_t>(CubeDimension::Date)];

  auto partialCube = oneapi::tbb::parallel_deterministic_reduce(
      oneapi::tbb::blocked_range<int64_t>(0, numRows, m_partitionSize),
      PartialCube{},
      [&](const oneapi::tbb::blocked_range<int64_t> &range,
          PartialCube partial) {
        CubeKey concrete;
        std::vector<AggregateValue> values(m_fields.size());
        for (auto row = range.begin(); row != range.end(); ++row) {
          // cross-date groups are never reported; skip undated rows entirely
          if (date.IsNull(row)) {
            continue;
          }
          for (size_t d = 0; d < kDimensionCount; ++d) {
            concrete[d] = ReadDimension(*input.dimensions[d], row);
          }
          for (size_t f = 0; f < m_fields.size(); ++f) {
            values[f] = ReadAggregate(*input.aggregates[f], m_fields[f].type, row);
          }

          for (uint32_t subset = 0; subset < kSubsetCount; ++subset) {
            CubeKey key; // every dimension starts as Wildcard
            for (size_t d = 0; d < kDimensionCount; ++d) {
              if (subset & (1u << d)) {
                key[d] = concrete[d];
              }
            }
            AddGroup(partial, std::move(key), values);
          }
        }
        return partial;
      },
      [](PartialCube lhs, PartialCube const &rhs) {
        if (lhs.size() < rhs.size()) {
          PartialCube merged = rhs;
          MergeInto(merged, lhs);
          return merged;
        }
        MergeInto(lhs, rhs);
        return lhs;
      });

  Cube cube;
  cube.fields = m_fields;
  cube.rows.reserve(partialCube.size());
  for (auto &[key, sums] : partialCube) {
    cube.rows.push_back(CubeRow{key, std::move(sums)});
  }
  std::ranges::sort(cube.rows, std::less<>{}, &CubeRow::key);

  SPDLOG_DEBUG("Cube of {} rows has {} cells", numRows, cube.rows.size());
  return cube;
}

} // namespace topline::transform
