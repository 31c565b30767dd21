#pragma once
//
// Arrow helpers shared by the reformatting stages
//
#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace topline::transform::utils {

inline void ThrowIfNotOk(arrow::Status const &status,
                         std::string const &context) {
  if (!status.ok()) {
    throw std::runtime_error(context + ": " + status.ToString());
  }
}

template <typename T>
T ValueOrThrow(arrow::Result<T> result, std::string const &context) {
  ThrowIfNotOk(result.status(), context);
  return std::move(result).ValueUnsafe();
}

/**
 * @brief Casts a column to the requested type, leaving it untouched when the
 * type already matches
 */
inline std::shared_ptr<arrow::ChunkedArray>
CastColumn(std::shared_ptr<arrow::ChunkedArray> const &column,
           std::shared_ptr<arrow::DataType> const &type,
           std::string const &name) {
  if (column->type()->Equals(*type)) {
    return column;
  }
  auto datum = ValueOrThrow(arrow::compute::Cast(arrow::Datum{column}, type),
                            "Failed to cast column '" + name + "' to " +
                                type->ToString());
  return datum.chunked_array();
}

/**
 * @brief Flattens a chunked column into one contiguous array of type T
 */
template <typename ArrayType>
std::shared_ptr<ArrayType>
CombineChunks(std::shared_ptr<arrow::ChunkedArray> const &column,
              std::string const &name) {
  std::shared_ptr<arrow::Array> combined;
  if (column->num_chunks() == 0) {
    combined = ValueOrThrow(arrow::MakeEmptyArray(column->type()),
                            "Failed to allocate column '" + name + "'");
  } else if (column->num_chunks() == 1) {
    combined = column->chunk(0);
  } else {
    combined = ValueOrThrow(arrow::Concatenate(column->chunks()),
                            "Failed to combine chunks of column '" + name +
                                "'");
  }
  return std::static_pointer_cast<ArrayType>(combined);
}

inline std::shared_ptr<arrow::ChunkedArray>
ToChunkedArray(std::shared_ptr<arrow::Array> array) {
  return std::make_shared<arrow::ChunkedArray>(std::move(array));
}

} // namespace topline::transform::utils
