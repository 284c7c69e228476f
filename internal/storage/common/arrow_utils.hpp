#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include "internal/util/errors.hpp"

namespace mediacache::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return result.MoveValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

} // namespace mediacache::storage::common
