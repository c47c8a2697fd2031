#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace cadence::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace cadence::util;

  if (dynamic_cast<const ValidationError*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const CollaboratorError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace cadence::grpc
