#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace x402::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Pure components (address parsing, signature verification, payment origin,
  authorization decisions, probing) never throw these; they return values.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidAddress : public InvalidArgument {
 public:
  explicit InvalidAddress(const std::string& msg) : InvalidArgument(msg) {
  }
};

class UnknownAction : public InvalidArgument {
 public:
  explicit UnknownAction(const std::string& msg) : InvalidArgument(msg) {
  }
};

class EntryNotFound : public std::runtime_error {
 public:
  explicit EntryNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyRegistered : public std::runtime_error {
 public:
  AlreadyRegistered(const std::string& msg, std::string existing_id, std::string existing_owner)
      : std::runtime_error(msg), existing_id_(std::move(existing_id)), existing_owner_(std::move(existing_owner)) {
  }

  const std::string& existing_id() const {
    return existing_id_;
  }
  const std::string& existing_owner() const {
    return existing_owner_;
  }

 private:
  std::string existing_id_;
  std::string existing_owner_;
};

// Carries the denial reason verbatim ("signature invalid", "timestamp expired", ...).
class NotAuthorized : public std::runtime_error {
 public:
  NotAuthorized(const std::string& reason, const std::string& detail)
      : std::runtime_error(detail.empty() ? reason : reason + ": " + detail), reason_(reason) {
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

// A conditional write lost a race twice in a row.
class StorageConflict : public std::runtime_error {
 public:
  explicit StorageConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProbeFailed : public std::runtime_error {
 public:
  explicit ProbeFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace x402::util
