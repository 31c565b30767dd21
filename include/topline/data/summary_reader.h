#pragma once
//
// Parquet reader for the topline summary dataset
//
#include <topline/core/report_config.h>
#include <epoch_frame/dataframe.h>
#include <string>
#include <vector>

namespace topline::data {

/**
 * SummaryReader
 *
 * Reads every *.parquet file below a location, recursively and in sorted
 * path order, skipping names that start with '_' or '.'. Each file is
 * projected onto the declared input schema and cast to the declared types
 * before the tables are concatenated.
 *
 * Missing columns, failed casts, I/O errors and a location without parquet
 * files all throw.
 */
class SummaryReader {
public:
  explicit SummaryReader(ColumnSpecList inputSchema)
      : m_inputSchema(std::move(inputSchema)) {}

  [[nodiscard]] epoch_frame::DataFrame Read(std::string const &uri) const;

  // Parquet files of the dataset, sorted
  static std::vector<std::string> ListParquetFiles(std::string const &uri);

private:
  std::shared_ptr<arrow::Table>
  ApplyInputSchema(std::shared_ptr<arrow::Table> const &table,
                   std::string const &path) const;

  ColumnSpecList m_inputSchema;
};

} // namespace topline::data
