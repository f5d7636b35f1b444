#include "health_endpoint.hpp"

namespace clusterlink::health {

HealthResponse CheckLiveness(const LivenessEvaluator& evaluator) {
  if (evaluator.AllHealthy()) {
    return HealthResponse{200, kHealthyBody};
  }
  return HealthResponse{500, kUnhealthyBody};
}

} // namespace clusterlink::health
