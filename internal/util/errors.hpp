#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ledgersync::util {

/*
  Central error types.

  ValidationError and its subclasses are recoverable and surfaced to the
  caller without mutating state. Remote* errors are raised by remote stores
  and mapped by the sync engine into its report.
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

// Unrecognized enum string, malformed date, fields not matching the kind.
class InvalidValue : public std::runtime_error {
 public:
  explicit InvalidValue(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotDeleted : public ValidationError {
 public:
  explicit NotDeleted(const std::string& msg) : ValidationError(msg) {
  }
};

class NameConflict : public ValidationError {
 public:
  explicit NameConflict(const std::string& msg) : ValidationError(msg) {
  }
};

class DependencyExists : public ValidationError {
 public:
  // (collection, active dependent count)
  using Dependents = std::vector<std::pair<std::string, std::size_t>>;

  DependencyExists(const std::string& msg, Dependents dependents) : ValidationError(msg), dependents_(std::move(dependents)) {
  }

  const Dependents& dependents() const {
    return dependents_;
  }

 private:
  Dependents dependents_;
};

// Connectivity lost; aborts the whole sync run.
class RemoteUnavailable : public std::runtime_error {
 public:
  explicit RemoteUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A single remote request failed; siblings may still succeed.
class RemoteError : public std::runtime_error {
 public:
  explicit RemoteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientSyncError : public std::runtime_error {
 public:
  explicit TransientSyncError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FatalSyncError : public std::runtime_error {
 public:
  explicit FatalSyncError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GenerationError : public std::runtime_error {
 public:
  explicit GenerationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ledgersync::util
