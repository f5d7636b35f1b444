#pragma once

#include <stdexcept>
#include <string>

namespace clusterlink::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Queue topology on the broker disagrees with what we declare.
// Needs operator intervention, never retried.
class TopologyError : public std::runtime_error {
 public:
  explicit TopologyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The broker refused a publish because the claimed user id differs from
// the user the connection authenticated as.
class PublisherIdentityMismatch : public std::runtime_error {
 public:
  explicit PublisherIdentityMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Broker unreachable, login refused or connection dropped.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateWatcher : public std::runtime_error {
 public:
  explicit DuplicateWatcher(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WatcherNotRegistered : public std::runtime_error {
 public:
  explicit WatcherNotRegistered(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidMessage : public std::runtime_error {
 public:
  explicit InvalidMessage(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace clusterlink::util
