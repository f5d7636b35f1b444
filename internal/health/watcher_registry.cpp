#include "watcher_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::health {

using observability::StringField;

WatcherRegistry::WatcherRegistry() : WatcherRegistry([] { return util::MonotonicClock::now(); }) {
}

WatcherRegistry::WatcherRegistry(ClockFn clock) : clock_(std::move(clock)) {
}

void WatcherRegistry::Register(const std::string& name) {
  const auto now = clock_();

  std::lock_guard lock(mutex_);
  auto [it, inserted] = watchers_.emplace(name, now);
  if (!inserted) {
    throw util::DuplicateWatcher("watcher '" + name + "' is already registered");
  }

  CLUSTERLINK_LOG_DEBUG("Watcher registered", {StringField("watcher", name)});
}

void WatcherRegistry::Touch(const std::string& name) {
  const auto now = clock_();

  std::lock_guard lock(mutex_);
  auto it = watchers_.find(name);
  if (it == watchers_.end()) {
    throw util::WatcherNotRegistered("watcher '" + name + "' is not registered");
  }
  it->second = std::max(it->second, now);
}

bool WatcherRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return watchers_.count(name) > 0;
}

std::vector<WatcherEntry> WatcherRegistry::Snapshot() const {
  std::lock_guard lock(mutex_);

  std::vector<WatcherEntry> entries;
  entries.reserve(watchers_.size());
  for (const auto& [name, last_attempt] : watchers_) {
    entries.push_back(WatcherEntry{name, last_attempt});
  }
  return entries;
}

std::size_t WatcherRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return watchers_.size();
}

util::MonotonicTimePoint WatcherRegistry::Now() const {
  return clock_();
}

void WatcherRegistry::Clear() {
  std::lock_guard lock(mutex_);
  watchers_.clear();
}

} // namespace clusterlink::health
