#pragma once

#include <stdexcept>
#include <string>

namespace swarm::util {

/*
  Central error types.

  Reservation conflicts are not errors; they are returned as data.
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

// Structural validation failure. Never retried.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string field, const std::string& msg) : std::runtime_error(msg), field_(std::move(field)) {
  }

  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

class CycleDetected : public std::runtime_error {
 public:
  explicit CycleDetected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store busy/locked or collaborator hiccup. Safe to retry.
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RelayError : public std::runtime_error {
 public:
  RelayError(int code, bool retryable, const std::string& msg)
      : std::runtime_error(msg), code_(code), retryable_(retryable) {
  }

  int code() const {
    return code_;
  }
  bool retryable() const {
    return retryable_;
  }

 private:
  int  code_;
  bool retryable_;
};

class RetriesExhausted : public std::runtime_error {
 public:
  RetriesExhausted(int attempts, const std::string& last_cause)
      : std::runtime_error("retries exhausted after " + std::to_string(attempts) + " attempts: " + last_cause),
        attempts_(attempts),
        last_cause_(last_cause) {
  }

  int attempts() const {
    return attempts_;
  }
  const std::string& last_cause() const {
    return last_cause_;
  }

 private:
  int         attempts_;
  std::string last_cause_;
};

class ExportError : public std::runtime_error {
 public:
  explicit ExportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace swarm::util
