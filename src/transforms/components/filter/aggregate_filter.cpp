#include "aggregate_filter.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace topline::transform {

std::optional<double> RowTotal(CubeRow const &row) {
  double total{0};
  for (auto const &sum : row.sums) {
    if (IsNull(sum)) {
      return std::nullopt;
    }
    total += AsDouble(sum);
  }
  return total;
}

bool AggregateFilter::Keep(CubeRow const &row) {
  if (!IsConcrete(Get(row.key, CubeDimension::Date))) {
    return false;
  }
  const auto total = RowTotal(row);
  return total.has_value() && *total > 0;
}

Cube AggregateFilter::Filter(Cube cube) const {
  const auto before = cube.rows.size();
  std::erase_if(cube.rows, [](CubeRow const &row) { return !Keep(row); });
  SPDLOG_DEBUG("Filter kept {} of {} cube rows", cube.rows.size(), before);
  return cube;
}

} // namespace topline::transform
