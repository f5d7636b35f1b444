#include "types.hpp"

namespace clusterlink::broker {

const char* ToString(ExchangeType type) {
  switch (type) {
    case ExchangeType::kDirect:
      return "direct";
    case ExchangeType::kFanout:
      return "fanout";
  }
  return "unknown";
}

} // namespace clusterlink::broker
