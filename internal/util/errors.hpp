#pragma once

#include <stdexcept>
#include <string>

namespace zreplicate::util {

/*
  Central error types.

  main() translates these into process exit codes.
*/

// Host unreachable, authentication failure, transport could not be started.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A remote primitive ran but the host rejected it.
class RemoteError : public std::runtime_error {
 public:
  explicit RemoteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public RemoteError {
 public:
  explicit NotFound(const std::string& msg) : RemoteError(msg) {
  }
};

class AlreadyExists : public RemoteError {
 public:
  explicit AlreadyExists(const std::string& msg) : RemoteError(msg) {
  }
};

class Busy : public RemoteError {
 public:
  explicit Busy(const std::string& msg) : RemoteError(msg) {
  }
};

// Source and destination histories share no snapshot.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// One or more stages of a send/receive pipeline failed.
class TransferError : public std::runtime_error {
 public:
  explicit TransferError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockUnavailable : public std::runtime_error {
 public:
  explicit LockUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

} // namespace zreplicate::util
