#pragma once

#include <stdexcept>
#include <string>

namespace beacon::util {

/*
  Central error types.

  Thrown by the ingest and state services, translated to gRPC status codes
  in internal/grpc/grpc_error.cpp. Anything else surfaces as INTERNAL.
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

// Structurally invalid request (missing fields, bad timestamp, unknown status).
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Signature or key material failure.
class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Agent signed with a key version other than the cluster's current one.
class KeyVersionConflict : public std::runtime_error {
 public:
  explicit KeyVersionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Request is well formed but not acceptable now (stale clock, old agent).
class FailedPrecondition : public std::runtime_error {
 public:
  explicit FailedPrecondition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// heartbeat_id already recorded under a different server.
class IntegrityViolation : public std::runtime_error {
 public:
  explicit IntegrityViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace beacon::util
