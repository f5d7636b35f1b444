#pragma once

#include <string>

#include "liveness.hpp"

namespace clusterlink::health {

struct HealthResponse {
  int         http_status = 200;
  std::string body;
};

inline constexpr const char* kHealthyBody   = R"({"status":"OK"})";
inline constexpr const char* kUnhealthyBody = R"({"detail":"One or more watchers are unhealthy"})";

// 200 {"status":"OK"} or 500 {"detail":"One or more watchers are unhealthy"}.
HealthResponse CheckLiveness(const LivenessEvaluator& evaluator);

} // namespace clusterlink::health
