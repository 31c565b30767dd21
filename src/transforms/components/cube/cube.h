#pragma once
//
// Cube rows: one value per report dimension plus the summed aggregates
//
#include <topline/core/constants.h>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace topline::transform {

// "aggregated over every value of this dimension"
struct Wildcard {
  auto operator<=>(const Wildcard &) const = default;
};

// the input row had no value for this dimension
struct Missing {
  auto operator<=>(const Missing &) const = default;
};

// Ordering: Wildcard < Missing < concrete values (lexicographic)
using DimensionValue = std::variant<Wildcard, Missing, std::string>;

enum class CubeDimension : size_t { Geo = 0, Channel, Os, Date };

inline constexpr size_t kDimensionCount = DIMENSION_COLUMNS.size();
inline constexpr uint32_t kSubsetCount = 1u << kDimensionCount;

// Indexed by CubeDimension
using CubeKey = std::array<DimensionValue, kDimensionCount>;

struct CubeKeyHash {
  size_t operator()(CubeKey const &key) const noexcept {
    size_t seed = 0;
    for (auto const &value : key) {
      size_t h = value.index();
      if (auto const *text = std::get_if<std::string>(&value)) {
        h = std::hash<std::string>{}(*text);
      }
      seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

inline DimensionValue const &Get(CubeKey const &key, CubeDimension dimension) {
  return key[static_cast<size_t>(dimension)];
}

inline bool IsWildcard(DimensionValue const &value) {
  return std::holds_alternative<Wildcard>(value);
}

inline bool IsConcrete(DimensionValue const &value) {
  return std::holds_alternative<std::string>(value);
}

// Integer fields sum as int64_t, Decimal fields as double
struct AggregateField {
  std::string name;
  epoch_core::ColumnType type{epoch_core::ColumnType::Integer};
};

// std::monostate: no contributing row had a value
using AggregateValue = std::variant<std::monostate, int64_t, double>;

inline bool IsNull(AggregateValue const &value) {
  return std::holds_alternative<std::monostate>(value);
}

inline double AsDouble(AggregateValue const &value) {
  if (auto const *integer = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*integer);
  }
  if (auto const *decimal = std::get_if<double>(&value)) {
    return *decimal;
  }
  return 0.0;
}

// Throws std::overflow_error instead of wrapping
inline int64_t CheckedAdd(int64_t lhs, int64_t rhs) {
  if ((rhs > 0 && lhs > std::numeric_limits<int64_t>::max() - rhs) ||
      (rhs < 0 && lhs < std::numeric_limits<int64_t>::min() - rhs)) {
    throw std::overflow_error("integer aggregate overflows int64");
  }
  return lhs + rhs;
}

// Adds rhs into lhs; null is the additive identity
inline void Accumulate(AggregateValue &lhs, AggregateValue const &rhs) {
  if (IsNull(rhs)) {
    return;
  }
  if (IsNull(lhs)) {
    lhs = rhs;
    return;
  }
  if (auto *integer = std::get_if<int64_t>(&lhs)) {
    *integer = CheckedAdd(*integer, std::get<int64_t>(rhs));
  } else {
    std::get<double>(lhs) += std::get<double>(rhs);
  }
}

struct CubeRow {
  CubeKey key;
  std::vector<AggregateValue> sums; // parallel to Cube::fields
};

struct Cube {
  std::vector<AggregateField> fields;
  std::vector<CubeRow> rows;

  std::ptrdiff_t FieldIndex(std::string const &name) const {
    for (size_t i = 0; i < fields.size(); ++i) {
      if (fields[i].name == name) {
        return static_cast<std::ptrdiff_t>(i);
      }
    }
    return -1;
  }
};

} // namespace topline::transform
