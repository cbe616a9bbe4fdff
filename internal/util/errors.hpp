#pragma once

#include <stdexcept>
#include <string>

namespace soundscribe::util {

/*
  Central error types.

  The gRPC layer maps these to status codes, the HTTP layer to 404s.
*/

class AlreadyRecording : public std::runtime_error {
 public:
  explicit AlreadyRecording(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotRecording : public std::runtime_error {
 public:
  explicit NotRecording(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FileNotFound : public std::runtime_error {
 public:
  explicit FileNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TokenUnknown : public std::runtime_error {
 public:
  explicit TokenUnknown(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TokenExpired : public std::runtime_error {
 public:
  explicit TokenExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Opaque passthrough of a failure reported by the voice capture backend.
class CaptureBackendError : public std::runtime_error {
 public:
  explicit CaptureBackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TranscodeFailure : public std::runtime_error {
 public:
  TranscodeFailure(int exit_code, std::string stderr_excerpt)
      : std::runtime_error("transcoder exited with code " + std::to_string(exit_code) + ": " + stderr_excerpt),
        exit_code_(exit_code),
        stderr_excerpt_(std::move(stderr_excerpt)) {
  }

  int ExitCode() const {
    return exit_code_;
  }

  const std::string& StderrExcerpt() const {
    return stderr_excerpt_;
  }

 private:
  int         exit_code_;
  std::string stderr_excerpt_;
};

} // namespace soundscribe::util
