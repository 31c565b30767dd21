#pragma once
//
// Region bucketing and report date parsing
//
#include <topline/transforms/core/itransform.h>
#include <arrow/api.h>
#include <optional>
#include <string>
#include <string_view>

namespace topline::transform {

/**
 * @brief Parses a YYYYMMDD token into the historical YYYY-MM-DD form
 *
 * The token must be exactly eight ASCII digits forming a valid Gregorian
 * calendar date. Anything else yields std::nullopt.
 */
std::optional<std::string> ParseReportDate(std::string_view token);

/**
 * DimensionNormalizer
 *
 * - geo: kept when it is in the country allow-list, otherwise replaced by
 *   the catch-all region (null included).
 * - report_start: parsed into a new trailing `date` column; malformed tokens
 *   become null and are dropped later by the cube.
 * - every other declared column passes through untouched, in input schema
 *   order. Columns the input schema does not declare are dropped.
 *
 * The input must carry every column of the configured input schema.
 * Categorical columns must be strings and aggregates numeric, otherwise
 * SchemaMismatchError is thrown.
 */
class DimensionNormalizer final : public ITransform {
public:
  explicit DimensionNormalizer(const TransformConfiguration &config);

  [[nodiscard]] epoch_frame::DataFrame
  TransformData(epoch_frame::DataFrame const &summary) const override;

  // Throws SchemaMismatchError
  void ValidateInputSchema(arrow::Schema const &schema) const;

private:
  std::shared_ptr<arrow::ChunkedArray>
  BucketRegions(std::shared_ptr<arrow::ChunkedArray> const &geo) const;

  static std::shared_ptr<arrow::ChunkedArray>
  ParseDates(std::shared_ptr<arrow::ChunkedArray> const &reportStart);

  std::shared_ptr<arrow::Array> m_countries;
};

} // namespace topline::transform
