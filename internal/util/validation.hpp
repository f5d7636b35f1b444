#pragma once

#include <string_view>

namespace clusterlink::util {

// ^[0-9A-Za-z-_]+$
bool IsValidClusterName(std::string_view name);

} // namespace clusterlink::util
