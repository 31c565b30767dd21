#pragma once
//
// Report tables: the region allow-list, the wildcard token and the two
// column layouts (summary input, historical output).
//

#include "constants.h"
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace topline {

struct ColumnSpec {
  std::string name;
  epoch_core::ColumnType type{epoch_core::ColumnType::Integer};

  bool IsNumeric() const {
    return type == epoch_core::ColumnType::Integer ||
           type == epoch_core::ColumnType::Decimal;
  }

  bool operator==(ColumnSpec const &) const = default;

  void decode(YAML::Node const &);
};

using ColumnSpecList = std::vector<ColumnSpec>;

struct ReportConfig {
  std::vector<std::string> countries{};
  std::string other_region{OTHER_REGION};
  std::string wildcard_token{WILDCARD_TOKEN};
  ColumnSpecList input_schema{};
  ColumnSpecList historical_schema{};

  // Input columns summed by the cube: everything that is neither a
  // dimension nor the raw date token.
  std::vector<ColumnSpec> AggregateColumns() const;

  std::unordered_set<std::string> CountrySet() const {
    return {countries.begin(), countries.end()};
  }

  // Throws ConfigurationError
  void Validate() const;

  // JSON rendering of the active tables, for logging
  std::string ToString() const;

  // Overrides only the keys present in the node
  void decode(YAML::Node const &);
};

/**
 * @brief Tables of the legacy v4 topline dashboard
 *
 * The sixteen countries of interest, the topline_summary input layout and
 * the historical v4-weekly.csv / v4-monthly.csv column order.
 */
ReportConfig DefaultReportConfig();

/**
 * @brief Loads a YAML override on top of DefaultReportConfig()
 *
 * @throws ConfigurationError if the document cannot be parsed or the
 *         resulting tables fail validation
 */
ReportConfig LoadReportConfig(FileLoaderInterface const &loader,
                              std::string const &path);

ReportConfig LoadReportConfigFile(std::filesystem::path const &path);

} // namespace topline

namespace YAML {
template <> struct convert<topline::ColumnSpec> {
  static bool decode(const Node &node, topline::ColumnSpec &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<topline::ReportConfig> {
  static bool decode(const Node &node, topline::ReportConfig &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
