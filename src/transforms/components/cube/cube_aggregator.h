#pragma once
//
// Power-set ("cube") aggregation over geo x channel x os x date
//
#include "cube.h"
#include <topline/core/report_config.h>
#include <epoch_frame/dataframe.h>
#include <cstdint>
#include <vector>

namespace topline::transform {

/**
 * @brief Grouped sums for every subset of the report dimensions
 *
 * For each of the 16 subsets of {geo, channel, os, date} the normalized rows
 * are grouped by the concrete values of the subset's dimensions, the other
 * dimensions are set to Wildcard, and every aggregate field is summed. The
 * union of the 16 groupings is the cube.
 *
 * Rows with a null date contribute to no group. Null channel / os values form
 * their own Missing group. Null aggregate values are skipped by the sum, and
 * a sum with no contributing value stays null.
 *
 * The rows are reduced in fixed-size partitions with
 * tbb::parallel_deterministic_reduce: partial sums are merged key by key, so
 * decimal sums do not depend on the number of worker threads.
 *
 * Output rows are sorted by key.
 */
class CubeAggregator {
public:
  static constexpr int64_t kDefaultPartitionSize = 16384;

  explicit CubeAggregator(std::vector<ColumnSpec> const &aggregateColumns,
                          int64_t partitionSize = kDefaultPartitionSize);

  [[nodiscard]] Cube Aggregate(epoch_frame::DataFrame const &normalized) const;

  const std::vector<AggregateField> &GetFields() const { return m_fields; }

private:
  std::vector<AggregateField> m_fields;
  int64_t m_partitionSize;
};

} // namespace topline::transform
