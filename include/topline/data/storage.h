#pragma once
//
// Object-store locations of the summary dataset and the dashboard files
//
#include <arrow/filesystem/api.h>
#include <epoch_core/enum_wrapper.h>
#include <topline/core/constants.h>
#include <memory>
#include <string>

namespace topline::data {

/**
 * @brief s3://{bucket}/{prefix}
 *
 * A bucket that already names a scheme (file:///tmp/out, s3://b) is used as
 * the base unchanged, so local directories work everywhere a bucket does.
 */
std::string FormatStorageUri(std::string const &bucket,
                             std::string const &prefix);

// {input_prefix}/mode={mode} under the input bucket
std::string SummaryLocation(std::string const &inputBucket,
                            std::string const &inputPrefix,
                            epoch_core::ReportMode mode);

// {prefix}/topline-{mode}.csv
std::string DashboardKey(std::string const &prefix, epoch_core::ReportMode mode);

struct ResolvedLocation {
  std::shared_ptr<arrow::fs::FileSystem> filesystem;
  std::string path;
};

// Throws std::runtime_error when no filesystem handles the URI
ResolvedLocation ResolveLocation(std::string const &uri);

} // namespace topline::data
