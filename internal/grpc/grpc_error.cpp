#include "grpc_error.hpp"

namespace beacon::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace beacon::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const Unauthenticated*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const KeyVersionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const FailedPrecondition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const IntegrityViolation*>(&e) || dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace beacon::grpc
