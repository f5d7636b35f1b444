#include "liveness.hpp"

#include "internal/observability/logging.hpp"

namespace clusterlink::health {

using observability::IntField;
using observability::StringField;

LivenessEvaluator::LivenessEvaluator(const WatcherRegistry& registry, std::chrono::milliseconds threshold)
    : registry_(registry), threshold_(threshold) {
}

bool LivenessEvaluator::AllHealthy() const {
  return AllHealthy(threshold_);
}

bool LivenessEvaluator::AllHealthy(std::chrono::milliseconds threshold) const {
  return UnhealthyWatchers(threshold).empty();
}

std::vector<std::string> LivenessEvaluator::UnhealthyWatchers() const {
  return UnhealthyWatchers(threshold_);
}

std::vector<std::string> LivenessEvaluator::UnhealthyWatchers(std::chrono::milliseconds threshold) const {
  const auto entries = registry_.Snapshot();
  const auto now     = registry_.Now();

  std::vector<std::string> stale;
  for (const auto& entry : entries) {
    const auto age = now - entry.last_attempt;
    if (age > threshold) {
      CLUSTERLINK_LOG_WARN("Watcher is stale",
                           {StringField("watcher", entry.name),
                            IntField("age_ms", std::chrono::duration_cast<std::chrono::milliseconds>(age).count()),
                            IntField("threshold_ms", threshold.count())});
      stale.push_back(entry.name);
    }
  }
  return stale;
}

} // namespace clusterlink::health
