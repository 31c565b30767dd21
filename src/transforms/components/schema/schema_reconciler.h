#pragma once
//
// Projection of the filtered cube onto the historical dashboard layout
//
#include "../cube/cube.h"
#include <topline/core/report_config.h>
#include <epoch_frame/dataframe.h>

namespace topline::transform {

/**
 * @brief Builds the historical output frame from cube rows
 *
 * Columns follow the historical schema order. Dimension columns render both
 * Wildcard and Missing as the configured wildcard token, so a Missing group
 * can print the same key as its Wildcard sibling. Aggregate
 * columns copy the cube sum converted to the declared column type. Columns
 * the cube does not carry are filled with 0. The result has a range index.
 */
class SchemaReconciler {
public:
  SchemaReconciler(ColumnSpecList historicalSchema, std::string wildcardToken)
      : m_historicalSchema(std::move(historicalSchema)),
        m_wildcardToken(std::move(wildcardToken)) {}

  explicit SchemaReconciler(ReportConfig const &config)
      : SchemaReconciler(config.historical_schema, config.wildcard_token) {}

  [[nodiscard]] epoch_frame::DataFrame Project(Cube const &cube) const;

private:
  std::shared_ptr<arrow::Array> BuildDimension(Cube const &cube,
                                               CubeDimension dimension) const;

  static std::shared_ptr<arrow::Array>
  BuildAggregate(Cube const &cube, ColumnSpec const &column);

  ColumnSpecList m_historicalSchema;
  std::string m_wildcardToken;
};

} // namespace topline::transform
