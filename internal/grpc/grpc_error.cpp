#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sealer::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace sealer::util;

  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const SigningKeyUnavailable*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const ChainConflict*>(&e) || dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace sealer::grpc
