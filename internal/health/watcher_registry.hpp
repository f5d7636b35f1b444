#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace clusterlink::health {

struct WatcherEntry {
  std::string              name;
  util::MonotonicTimePoint last_attempt;
};

/*
  Process-wide table of background watchers and when each last attempted
  its work. One instance is created at startup and shared by reference.

  Timestamps never move backwards. All operations hold a single mutex,
  readers get a consistent copy through Snapshot().
*/
class WatcherRegistry {
 public:
  using ClockFn = std::function<util::MonotonicTimePoint()>;

  WatcherRegistry();
  explicit WatcherRegistry(ClockFn clock);

  WatcherRegistry(const WatcherRegistry&)            = delete;
  WatcherRegistry& operator=(const WatcherRegistry&) = delete;

  // Throws util::DuplicateWatcher.
  void Register(const std::string& name);
  // Throws util::WatcherNotRegistered.
  void Touch(const std::string& name);

  bool                      Contains(const std::string& name) const;
  std::vector<WatcherEntry> Snapshot() const;
  std::size_t               Size() const;

  util::MonotonicTimePoint Now() const;

  // Test isolation only.
  void Clear();

 private:
  ClockFn clock_;

  mutable std::mutex                                  mutex_;
  std::map<std::string, util::MonotonicTimePoint> watchers_;
};

} // namespace clusterlink::health
