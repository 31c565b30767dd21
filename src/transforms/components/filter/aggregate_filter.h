#pragma once
//
// Pruning of cube rows that the dashboard never reports
//
#include "../cube/cube.h"
#include <optional>

namespace topline::transform {

// Sum of every aggregate of the row; std::nullopt when any sum is null
std::optional<double> RowTotal(CubeRow const &row);

/**
 * AggregateFilter
 *
 * Keeps a cube row only when
 * - its date is a concrete value (wildcard and missing dates are dropped), and
 * - the total across all aggregate fields is strictly positive.
 *
 * A row with any null sum has no total and is dropped.
 */
class AggregateFilter {
public:
  [[nodiscard]] Cube Filter(Cube cube) const;

  static bool Keep(CubeRow const &row);
};

} // namespace topline::transform
