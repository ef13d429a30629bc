#pragma once

#include <arrow/array.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace dataguard::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw TableReadError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::TableReadError(result.status().ToString());
  return *result;
}

template <typename T>
T Unwrap(arrow::Result<T>&& result) {
  if (!result.ok()) throw util::TableReadError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::TableReadError(status.ToString());
}

/*
  Render one cell as text.

  Returns nullopt for nulls; string-like cells are returned verbatim,
  everything else goes through the scalar's own formatting.
*/
std::optional<std::string> CellToString(const arrow::Array& array, int64_t index);

} // namespace dataguard::storage::common
