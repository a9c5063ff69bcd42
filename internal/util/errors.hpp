#pragma once

#include <stdexcept>
#include <string>

namespace edgerun::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed submit request. Raised before any record exists.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Overlay network is not (yet) usable.
class NetworkUninitialized : public std::runtime_error {
 public:
  explicit NetworkUninitialized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectivityFailure : public std::runtime_error {
 public:
  explicit ConnectivityFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A transport could not be run at all (spawn/pipe failure).
class ExecutionFailure : public std::runtime_error {
 public:
  explicit ExecutionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace edgerun::util
