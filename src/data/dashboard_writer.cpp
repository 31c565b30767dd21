#include <topline/data/dashboard_writer.h>
#include <topline/data/storage.h>
#include "../transforms/components/dataframe_utils.h"
#include <arrow/csv/api.h>
#include <spdlog/spdlog.h>

namespace topline::data {

using transform::utils::ThrowIfNotOk;
using transform::utils::ValueOrThrow;

void WriteDashboard(epoch_frame::DataFrame const &report,
                    std::string const &bucket, std::string const &key) {
  const auto uri = FormatStorageUri(bucket, key);
  const auto location = ResolveLocation(uri);

  // object stores have no directories to create
  if (location.filesystem->type_name() == "local") {
    if (auto slash = location.path.rfind('/'); slash != std::string::npos &&
                                               slash > 0) {
      ThrowIfNotOk(location.filesystem->CreateDir(location.path.substr(0, slash)),
                   "Failed to create the parent of " + uri);
    }
  }

  auto output = ValueOrThrow(location.filesystem->OpenOutputStream(location.path),
                             "Failed to open " + uri);

  auto options = arrow::csv::WriteOptions::Defaults();
  options.include_header = true;
  options.null_string = "";

  ThrowIfNotOk(arrow::csv::WriteCSV(*report.table(), options, output.get()),
               "Failed to write " + uri);
  ThrowIfNotOk(output->Close(), "Failed to close " + uri);
  SPDLOG_INFO("Wrote {} rows to {}", report.num_rows(), uri);
}

} // namespace topline::data
