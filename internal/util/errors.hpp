#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace payday::util {

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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another writer advanced the aggregate stream past the expected sequence.
class ConcurrencyConflict : public std::runtime_error {
 public:
  ConcurrencyConflict(const std::string& aggregate_id, uint64_t expected_sequence, const std::string& msg)
      : std::runtime_error(msg), aggregate_id_(aggregate_id), expected_sequence_(expected_sequence) {
  }

  const std::string& aggregate_id() const {
    return aggregate_id_;
  }
  uint64_t expected_sequence() const {
    return expected_sequence_;
  }

 private:
  std::string aggregate_id_;
  uint64_t    expected_sequence_;
};

/*
  An event cannot be applied to the current aggregate state.

  Indicates a modeling bug or out-of-order delivery. Never swallowed.
*/
class InvalidTransition : public std::runtime_error {
 public:
  InvalidTransition(const std::string& aggregate_id, uint64_t sequence, const std::string& event_type, const std::string& msg)
      : std::runtime_error(msg), aggregate_id_(aggregate_id), sequence_(sequence), event_type_(event_type) {
  }

  const std::string& aggregate_id() const {
    return aggregate_id_;
  }
  uint64_t sequence() const {
    return sequence_;
  }
  const std::string& event_type() const {
    return event_type_;
  }

 private:
  std::string aggregate_id_;
  uint64_t    sequence_;
  std::string event_type_;
};

// Backend unavailable, timed out or returned an unexpected failure.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// External node call failed.
class NodeError : public std::runtime_error {
 public:
  explicit NodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bounded retries on ConcurrencyConflict exhausted.
class CommandConflict : public std::runtime_error {
 public:
  explicit CommandConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace payday::util
