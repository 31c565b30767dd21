#include <topline/transforms/runtime/reformat_pipeline.h>
#include "../components/cube/cube_aggregator.h"
#include "../components/filter/aggregate_filter.h"
#include "../components/normalize/dimension_normalizer.h"
#include "../components/schema/schema_reconciler.h"
#include <spdlog/spdlog.h>

namespace topline::transform {

ReformatTransform::ReformatTransform(TransformConfiguration const &config)
    : ITransform(config) {}

epoch_frame::DataFrame
ReformatTransform::TransformData(epoch_frame::DataFrame const &summary) const {
  auto const &report = GetReportConfig();

  const DimensionNormalizer normalizer{m_config};
  auto normalized = normalizer.TransformData(summary);
  SPDLOG_DEBUG("{}: normalized {} rows", GetId(), normalized.num_rows());

  const CubeAggregator aggregator{report.AggregateColumns()};
  auto cube = aggregator.Aggregate(normalized);
  SPDLOG_DEBUG("{}: cube has {} rows", GetId(), cube.rows.size());

  cube = AggregateFilter{}.Filter(std::move(cube));
  SPDLOG_DEBUG("{}: {} rows survive the filter", GetId(), cube.rows.size());

  auto output = SchemaReconciler{report}.Project(cube);
  SPDLOG_DEBUG("{}: projected {} rows onto {} columns", GetId(),
               output.num_rows(), output.num_cols());
  return output;
}

epoch_frame::DataFrame ReformatData(epoch_frame::DataFrame const &summary,
                                    ReportConfig const &config) {
  const ReformatTransform transform{
      TransformConfiguration{"topline_dashboard", "reformat", config}};
  return transform.TransformData(summary);
}

} // namespace topline::transform
