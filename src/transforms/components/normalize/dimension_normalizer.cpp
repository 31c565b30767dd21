#include "dimension_normalizer.h"
#include "../dataframe_utils.h"
#include <topline/core/errors.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace topline::transform {

namespace {

int ParseDigits(std::string_view digits) {
  int value{};
  std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return value;
}

bool MatchesDeclaredType(arrow::DataType const &type,
                         epoch_core::ColumnType declared) {
  switch (declared) {
  case epoch_core::ColumnType::String:
    return arrow::is_string(type.id());
  case epoch_core::ColumnType::Integer:
    return arrow::is_integer(type.id());
  case epoch_core::ColumnType::Decimal:
    return arrow::is_integer(type.id()) || arrow::is_floating(type.id());
  default:
    return false;
  }
}

} // namespace

std::optional<std::string> ParseReportDate(std::string_view token) {
  if (token.size() != 8 ||
      !std::ranges::all_of(token, [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }

  const auto year = std::chrono::year{ParseDigits(token.substr(0, 4))};
  const auto month =
      std::chrono::month{static_cast<unsigned>(ParseDigits(token.substr(4, 2)))};
  const auto day =
      std::chrono::day{static_cast<unsigned>(ParseDigits(token.substr(6, 2)))};
  if (!std::chrono::year_month_day{year, month, day}.ok()) {
    return std::nullopt;
  }

  std::string result;
  result.reserve(10);
  result.append(token.substr(0, 4))
      .append(1, '-')
      .append(token.substr(4, 2))
      .append(1, '-')
      .append(token.substr(6, 2));
  return result;
}

DimensionNormalizer::DimensionNormalizer(const TransformConfiguration &config)
    : ITransform(config) {
  arrow::StringBuilder builder;
  auto const &countries = GetReportConfig().countries;
  utils::ThrowIfNotOk(builder.AppendValues(countries),
                      "Failed to build country allow-list");
  m_countries = utils::ValueOrThrow(builder.Finish(),
                                    "Failed to build country allow-list");
}

void DimensionNormalizer::ValidateInputSchema(
    arrow::Schema const &schema) const {
  for (auto const &column : GetReportConfig().input_schema) {
    const auto index = schema.GetFieldIndex(column.name);
    if (index < 0) {
      if (schema.GetAllFieldIndices(column.name).size() > 1) {
        throw SchemaMismatchError("column '" + column.name +
                                  "' appears more than once");
      }
      throw SchemaMismatchError("missing required column '" + column.name +
                                "'");
    }

    auto const &type = *schema.field(index)->type();
    if (!MatchesDeclaredType(type, column.type)) {
      throw SchemaMismatchError(
          "column '" + column.name + "' has type " + type.ToString() +
          ", expected " + epoch_core::ColumnTypeWrapper::ToString(column.type));
    }
  }
}

epoch_frame::DataFrame
DimensionNormalizer::TransformData(epoch_frame::DataFrame const &summary) const {
  auto table = summary.table();
  ValidateInputSchema(*table->schema());

  auto const &inputSchema = GetReportConfig().input_schema;
  std::vector<std::shared_ptr<arrow::ChunkedArray>> columns;
  std::vector<std::string> names;
  columns.reserve(inputSchema.size());
  names.reserve(inputSchema.size());

  // undeclared columns (a stale `date` included) are dropped
  for (auto const &spec : inputSchema) {
    auto const &name = spec.name;
    if (name == REPORT_START) {
      continue;
    }
    auto column = table->GetColumnByName(name);
    if (name == GEO) {
      column = BucketRegions(utils::CastColumn(column, arrow::utf8(), name));
    } else if (name == CHANNEL || name == OS) {
      column = utils::CastColumn(column, arrow::utf8(), name);
    }
    columns.push_back(std::move(column));
    names.push_back(name);
  }

  columns.push_back(ParseDates(utils::CastColumn(
      table->GetColumnByName(REPORT_START), arrow::utf8(), REPORT_START)));
  names.emplace_back(DATE);

  SPDLOG_DEBUG("Normalized {} summary rows", table->num_rows());
  return epoch_frame::make_dataframe(summary.index(), columns, names);
}

std::shared_ptr<arrow::ChunkedArray> DimensionNormalizer::BucketRegions(
    std::shared_ptr<arrow::ChunkedArray> const &geo) const {
  arrow::compute::SetLookupOptions lookup{arrow::Datum{m_countries}};
  auto allowed = utils::ValueOrThrow(
      arrow::compute::IsIn(arrow::Datum{geo}, lookup),
      "Failed to look up regions");

  // a null region is never in the allow-list
  allowed = utils::ValueOrThrow(
      arrow::compute::CallFunction(
          "coalesce", {allowed, arrow::Datum{std::make_shared<arrow::BooleanScalar>(false)}}),
      "Failed to look up regions");

  auto bucketed = utils::ValueOrThrow(
      arrow::compute::CallFunction(
          "if_else",
          {allowed, arrow::Datum{geo},
           arrow::Datum{arrow::MakeScalar(GetReportConfig().other_region)}}),
      "Failed to bucket regions");
  return bucketed.chunked_array();
}

std::shared_ptr<arrow::ChunkedArray> DimensionNormalizer::ParseDates(
    std::shared_ptr<arrow::ChunkedArray> const &reportStart) {
  auto tokens = utils::CombineChunks<arrow::StringArray>(reportStart, REPORT_START);
  const auto length = tokens->length();

  std::vector<std::optional<std::string>> dates(static_cast<size_t>(length));
  oneapi::tbb::parallel_for(
      oneapi::tbb::blocked_range<int64_t>(0, length),
      [&](const oneapi::tbb::blocked_range<int64_t> &range) {
        for (auto i = range.begin(); i != range.end(); ++i) {
          if (tokens->IsValid(i)) {
            dates[static_cast<size_t>(i)] = ParseReportDate(tokens->GetView(i));
          }
        }
      });

  arrow::StringBuilder builder;
  utils::ThrowIfNotOk(builder.Reserve(length), "Failed to reserve dates");
  int64_t malformed{0};
  for (int64_t i = 0; i < length; ++i) {
    auto const &date = dates[static_cast<size_t>(i)];
    if (date) {
      utils::ThrowIfNotOk(builder.Append(*date), "Failed to append date");
    } else {
      malformed += tokens->IsValid(i) ? 1 : 0;
      utils::ThrowIfNotOk(builder.AppendNull(), "Failed to append date");
    }
  }
  if (malformed > 0) {
    SPDLOG_WARN("{} rows carry an unparseable {} and are excluded from the "
                "rollup",
                malformed, REPORT_START);
  }

  return utils::ToChunkedArray(
      utils::ValueOrThrow(builder.Finish(), "Failed to build date column"));
}

} // namespace topline::transform
