#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace soundscribe::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace soundscribe::util;

  if (dynamic_cast<const AlreadyRecording*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const NotRecording*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const FileNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const CaptureBackendError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace soundscribe::grpc
