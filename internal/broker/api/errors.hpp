#pragma once

#include <stdexcept>
#include <string>

namespace clusterlink::broker {

/*
  Broker-level failures, named after the AMQP reply codes they mirror.

  Channel-level errors close the channel they occurred on. Messaging
  code translates these into clusterlink::util errors.
*/

class BrokerError : public std::runtime_error {
 public:
  explicit BrokerError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// 406 PRECONDITION_FAILED
class PreconditionFailed : public BrokerError {
 public:
  explicit PreconditionFailed(const std::string& msg) : BrokerError(msg) {
  }
};

// 403 ACCESS_REFUSED
class AccessRefused : public BrokerError {
 public:
  explicit AccessRefused(const std::string& msg) : BrokerError(msg) {
  }
};

// 404 NOT_FOUND
class NotFound : public BrokerError {
 public:
  explicit NotFound(const std::string& msg) : BrokerError(msg) {
  }
};

// Operation on a channel or connection that is already closed.
class ChannelClosed : public BrokerError {
 public:
  explicit ChannelClosed(const std::string& msg) : BrokerError(msg) {
  }
};

// TCP-level failure: broker unreachable or went away.
class ConnectionRefused : public BrokerError {
 public:
  explicit ConnectionRefused(const std::string& msg) : BrokerError(msg) {
  }
};

} // namespace clusterlink::broker
