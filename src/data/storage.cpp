#include <topline/data/storage.h>
#include <stdexcept>

namespace topline::data {

std::string FormatStorageUri(std::string const &bucket,
                             std::string const &prefix) {
  if (bucket.find("://") != std::string::npos) {
    auto base = bucket;
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    return base + "/" + prefix;
  }
  return "s3://" + bucket + "/" + prefix;
}

std::string SummaryLocation(std::string const &inputBucket,
                            std::string const &inputPrefix,
                            epoch_core::ReportMode mode) {
  return FormatStorageUri(inputBucket,
                          inputPrefix + "/mode=" +
                              epoch_core::ReportModeWrapper::ToString(mode));
}

std::string DashboardKey(std::string const &prefix,
                         epoch_core::ReportMode mode) {
  return prefix + "/topline-" + epoch_core::ReportModeWrapper::ToString(mode) +
         ".csv";
}

ResolvedLocation ResolveLocation(std::string const &uri) {
  ResolvedLocation location;
  auto filesystem = arrow::fs::FileSystemFromUriOrPath(uri, &location.path);
  if (!filesystem.ok()) {
    throw std::runtime_error("Failed to resolve " + uri + ": " +
                             filesystem.status().ToString());
  }
  location.filesystem = std::move(filesystem).ValueUnsafe();
  return location;
}

} // namespace topline::data
