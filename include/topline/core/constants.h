#pragma once
//
// Column names, tokens and enums shared by the reformatting pipeline
//

#include <array>
#include <functional>
#include <string>
#include <string_view>
#include <epoch_core/enum_wrapper.h>
#include <yaml-cpp/yaml.h>

// Logical type of a report column
CREATE_ENUM(ColumnType,
            String,   // categorical / date text
            Integer,  // 64-bit counts
            Decimal); // double precision durations

// Which partition of the summary dataset a run reads and writes
CREATE_ENUM(ReportMode, weekly, monthly);

namespace topline {

// Input columns
constexpr auto GEO = "geo";
constexpr auto CHANNEL = "channel";
constexpr auto OS = "os";
constexpr auto REPORT_START = "report_start";

// Output column derived from REPORT_START
constexpr auto DATE = "date";

constexpr auto OTHER_REGION = "Other";
constexpr auto WILDCARD_TOKEN = "all";

// Source dataset layout
constexpr auto DEFAULT_INPUT_BUCKET = "telemetry-parquet";
constexpr auto DEFAULT_INPUT_PREFIX = "topline_summary/v1";

// Categorical columns of the report, in the order the cube keys them
inline constexpr std::array<std::string_view, 4> DIMENSION_COLUMNS{GEO, CHANNEL,
                                                                   OS, DATE};

inline bool IsDimensionColumn(std::string_view name) {
  for (auto const &dimension : DIMENSION_COLUMNS) {
    if (dimension == name) {
      return true;
    }
  }
  return false;
}

using FileLoaderInterface = std::function<YAML::Node(std::string const &)>;
} // namespace topline
