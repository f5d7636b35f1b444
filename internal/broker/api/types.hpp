#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace clusterlink::broker {

struct Credentials {
  std::string username;
  std::string password;
};

struct BrokerEndpoint {
  std::string   host  = "localhost";
  std::uint16_t port  = 5672;
  std::string   vhost = "/";
  Credentials   credentials;
};

enum class ExchangeType { kDirect, kFanout };

enum class DeliveryMode : std::uint8_t { kTransient = 1, kPersistent = 2 };

// x-arguments on queue declare. Values are compared byte-for-byte.
using Arguments = std::map<std::string, std::string>;

struct QueueOptions {
  bool      durable     = true;
  bool      auto_delete = false;
  bool      exclusive   = false;
  Arguments arguments;
};

struct OutgoingMessage {
  std::string  body;
  std::string  content_type;
  DeliveryMode delivery_mode = DeliveryMode::kPersistent;
  // Validated by the broker against the authenticated user when set.
  std::string user_id;
};

const char* ToString(ExchangeType type);

} // namespace clusterlink::broker
