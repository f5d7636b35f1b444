#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "watcher_registry.hpp"

namespace clusterlink::health {

inline constexpr std::chrono::milliseconds kDefaultStalenessThreshold = std::chrono::minutes(5);

/*
  Answers "is every background watcher still making attempts?".

  A watcher is stale when its last attempt is strictly older than the
  threshold. Exactly at the threshold it is still healthy. With no
  watchers registered the process is healthy.
*/
class LivenessEvaluator {
 public:
  explicit LivenessEvaluator(const WatcherRegistry& registry, std::chrono::milliseconds threshold = kDefaultStalenessThreshold);

  bool AllHealthy() const;
  bool AllHealthy(std::chrono::milliseconds threshold) const;

  std::vector<std::string> UnhealthyWatchers() const;
  std::vector<std::string> UnhealthyWatchers(std::chrono::milliseconds threshold) const;

  std::chrono::milliseconds Threshold() const {
    return threshold_;
  }

 private:
  const WatcherRegistry&    registry_;
  std::chrono::milliseconds threshold_;
};

} // namespace clusterlink::health
