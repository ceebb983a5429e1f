#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace framecomp::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace framecomp::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  // before ConfigurationError, its base
  if (dynamic_cast<const BoundsError*>(&e)) {
    return {::grpc::StatusCode::OUT_OF_RANGE, e.what()};
  }
  if (dynamic_cast<const ConfigurationError*>(&e) || dynamic_cast<const ValidationError*>(&e) ||
      dynamic_cast<const CompositeError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const FetchError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const FeedError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const AlreadyRunningError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace framecomp::grpc
