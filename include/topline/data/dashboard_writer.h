#pragma once
//
// CSV writer for the dashboard files
//
#include <epoch_frame/dataframe.h>
#include <string>

namespace topline::data {

// Writes the columns of `report` (no index) as CSV with a header line to
// {bucket}/{key}, replacing any existing object. Nulls are written as empty
// fields. Throws std::runtime_error on failure.
void WriteDashboard(epoch_frame::DataFrame const &report,
                    std::string const &bucket, std::string const &key);

} // namespace topline::data
