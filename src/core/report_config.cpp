//
// Report tables and their YAML / JSON plumbing
//
#include <topline/core/report_config.h>
#include <topline/core/errors.h>
#include <algorithm>
#include <glaze/glaze.hpp>
#include <map>

namespace topline {

namespace {

// Plain mirror of ReportConfig for glaze reflection
struct ColumnSpecJson {
  std::string name;
  std::string type;
};

struct ReportConfigJson {
  std::vector<std::string> countries;
  std::string other_region;
  std::string wildcard_token;
  std::vector<ColumnSpecJson> input_schema;
  std::vector<ColumnSpecJson> historical_schema;
};

std::vector<ColumnSpecJson> ToJson(ColumnSpecList const &columns) {
  std::vector<ColumnSpecJson> result;
  result.reserve(columns.size());
  for (auto const &column : columns) {
    result.push_back(
        {column.name, epoch_core::ColumnTypeWrapper::ToString(column.type)});
  }
  return result;
}

void RequireUniqueNames(ColumnSpecList const &columns,
                        std::string const &schemaName) {
  std::map<std::string, size_t> seen;
  for (auto const &column : columns) {
    if (column.name.empty()) {
      throw ConfigurationError(schemaName + " contains an unnamed column");
    }
    if (++seen[column.name] > 1) {
      throw ConfigurationError(schemaName + " declares column '" +
                               column.name + "' more than once");
    }
  }
}

void RequireStringColumn(ColumnSpecList const &columns, std::string const &name,
                         std::string const &schemaName) {
  auto it = std::ranges::find(columns, name, &ColumnSpec::name);
  if (it == columns.end()) {
    throw ConfigurationError(schemaName + " is missing column '" + name + "'");
  }
  if (it->type != epoch_core::ColumnType::String) {
    throw ConfigurationError(schemaName + " column '" + name +
                             "' must be of type String");
  }
}

} // namespace

void ColumnSpec::decode(YAML::Node const &element) {
  if (element.IsScalar()) {
    name = element.as<std::string>();
    type = epoch_core::ColumnType::Integer;
    return;
  }
  name = element["name"].as<std::string>();
  type = epoch_core::ColumnTypeWrapper::FromString(
      element["type"].as<std::string>("Integer"));
  if (type == epoch_core::ColumnType::Null) {
    throw ConfigurationError("column '" + name + "' has an unknown type");
  }
}

void ReportConfig::decode(YAML::Node const &element) {
  if (auto node = element["countries"]) {
    countries = node.as<std::vector<std::string>>();
  }
  if (auto node = element["other_region"]) {
    other_region = node.as<std::string>();
  }
  if (auto node = element["wildcard_token"]) {
    wildcard_token = node.as<std::string>();
  }
  if (auto node = element["input_schema"]) {
    input_schema = node.as<ColumnSpecList>();
  }
  if (auto node = element["historical_schema"]) {
    historical_schema = node.as<ColumnSpecList>();
  }
}

std::vector<ColumnSpec> ReportConfig::AggregateColumns() const {
  std::vector<ColumnSpec> result;
  for (auto const &column : input_schema) {
    if (IsDimensionColumn(column.name) || column.name == REPORT_START) {
      continue;
    }
    result.push_back(column);
  }
  return result;
}

void ReportConfig::Validate() const {
  if (countries.empty()) {
    throw ConfigurationError("country allow-list is empty");
  }
  if (std::ranges::any_of(countries,
                          [](auto const &code) { return code.empty(); })) {
    throw ConfigurationError("country allow-list contains an empty code");
  }
  if (other_region.empty() || wildcard_token.empty()) {
    throw ConfigurationError("other_region and wildcard_token must be set");
  }

  RequireUniqueNames(input_schema, "input_schema");
  for (auto const &name : {GEO, CHANNEL, OS, REPORT_START}) {
    RequireStringColumn(input_schema, name, "input_schema");
  }
  if (std::ranges::find(input_schema, std::string{DATE}, &ColumnSpec::name) !=
      input_schema.end()) {
    throw ConfigurationError(
        "input_schema must not declare 'date'; it is derived from "
        "'report_start'");
  }

  auto aggregates = AggregateColumns();
  if (aggregates.empty()) {
    throw ConfigurationError("input_schema declares no aggregate column");
  }
  for (auto const &column : aggregates) {
    if (!column.IsNumeric()) {
      throw ConfigurationError("input_schema aggregate '" + column.name +
                               "' must be Integer or Decimal");
    }
  }

  RequireUniqueNames(historical_schema, "historical_schema");
  for (auto const &name : DIMENSION_COLUMNS) {
    RequireStringColumn(historical_schema, std::string{name},
                        "historical_schema");
  }
  for (auto const &column : historical_schema) {
    if (!IsDimensionColumn(column.name) && !column.IsNumeric()) {
      throw ConfigurationError("historical_schema aggregate '" + column.name +
                               "' must be Integer or Decimal");
    }
  }
}

std::string ReportConfig::ToString() const {
  ReportConfigJson json{countries, other_region, wildcard_token,
                        ToJson(input_schema), ToJson(historical_schema)};
  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(json, buffer);
  if (ec) {
    throw std::runtime_error("Failed to serialize ReportConfig to JSON");
  }
  return buffer;
}

ReportConfig DefaultReportConfig() {
  using epoch_core::ColumnType;
  ReportConfig config;
  config.countries = {"US", "CA", "BR", "MX", "FR", "ES", "IT", "PL",
                      "TR", "RU", "DE", "IN", "ID", "CN", "JP", "GB"};

  // topline_summary, as produced by the ToplineSummaryView job
  config.input_schema = {
      {GEO, ColumnType::String},        {CHANNEL, ColumnType::String},
      {OS, ColumnType::String},         {"hours", ColumnType::Decimal},
      {"crashes", ColumnType::Integer}, {"google", ColumnType::Integer},
      {"bing", ColumnType::Integer},    {"yahoo", ColumnType::Integer},
      {"other", ColumnType::Integer},   {"actives", ColumnType::Integer},
      {"new_records", ColumnType::Integer},
      {"default", ColumnType::Integer}, {REPORT_START, ColumnType::String}};

  // v4 dashboard layout; inactives, five_of_seven and total_records have no
  // source in the summary and are always zero
  config.historical_schema = {
      {DATE, ColumnType::String},
      {GEO, ColumnType::String},
      {CHANNEL, ColumnType::String},
      {OS, ColumnType::String},
      {"actives", ColumnType::Integer},
      {"hours", ColumnType::Decimal},
      {"inactives", ColumnType::Integer},
      {"new_records", ColumnType::Integer},
      {"five_of_seven", ColumnType::Integer},
      {"total_records", ColumnType::Integer},
      {"crashes", ColumnType::Integer},
      {"default", ColumnType::Integer},
      {"google", ColumnType::Integer},
      {"bing", ColumnType::Integer},
      {"yahoo", ColumnType::Integer},
      {"other", ColumnType::Integer}};
  return config;
}

ReportConfig LoadReportConfig(FileLoaderInterface const &loader,
                              std::string const &path) {
  auto config = DefaultReportConfig();
  try {
    config.decode(loader(path));
  } catch (YAML::Exception const &exp) {
    throw ConfigurationError("failed to load '" + path + "': " + exp.what());
  }
  config.Validate();
  return config;
}

ReportConfig LoadReportConfigFile(std::filesystem::path const &path) {
  return LoadReportConfig(
      [](std::string const &_path) { return YAML::LoadFile(_path); },
      path.string());
}

} // namespace topline
