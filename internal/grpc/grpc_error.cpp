#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace mediacache::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace mediacache::util;

  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const OriginError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e) || dynamic_cast<const StorageError*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const TimeoutError*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const NetworkError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace mediacache::grpc
