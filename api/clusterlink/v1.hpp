#pragma once

#include "clusterlink/messaging/v1/messages.pb.h"

namespace clusterlink::v1 {
using namespace ::clusterlink::messaging::v1;
}
