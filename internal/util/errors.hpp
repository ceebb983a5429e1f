#pragma once

#include <stdexcept>
#include <string>

namespace framecomp::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Per-item failures inside a bulk run are caught and recorded on the
  Output row instead of propagating.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bad template, bad rectangle, incomplete project. Raised before any I/O.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BoundsError : public ConfigurationError {
 public:
  explicit BoundsError(const std::string& msg) : ConfigurationError(msg) {
  }
};

// URL rejected by the safety policy, or a response with a disallowed
// content type or size.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport failure, timeout or non-2xx status.
class FetchError : public std::runtime_error {
 public:
  explicit FetchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FeedError : public std::runtime_error {
 public:
  explicit FeedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CompositeError : public std::runtime_error {
 public:
  enum class Kind {
    kDecodeFailed,
    kEncodeFailed,
    kUnsupportedDimensions,
  };

  CompositeError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

class AlreadyRunningError : public std::runtime_error {
 public:
  explicit AlreadyRunningError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace framecomp::util
