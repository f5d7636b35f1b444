#include "polling_watcher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::health {

using observability::IntField;
using observability::StringField;

PollingWatcher::PollingWatcher(std::string name,
                               WatcherRegistry& registry,
                               PollFn poll,
                               std::chrono::milliseconds interval,
                               std::chrono::milliseconds retry_delay)
    : name_(std::move(name)), registry_(registry), poll_(std::move(poll)), interval_(interval), retry_delay_(retry_delay) {
}

PollingWatcher::~PollingWatcher() {
  Stop();
}

void PollingWatcher::Start() {
  if (started_.exchange(true)) {
    throw util::InvalidState("watcher '" + name_ + "' already started");
  }
  if (token_.IsCancelled()) {
    throw util::InvalidState("watcher '" + name_ + "' was stopped and cannot be restarted");
  }

  try {
    registry_.Register(name_);
  } catch (...) {
    started_ = false;
    throw;
  }

  thread_ = std::thread([this] { Run(); });
  CLUSTERLINK_LOG_INFO("Watcher started", {StringField("watcher", name_), IntField("interval_ms", interval_.count())});
}

void PollingWatcher::Stop() {
  token_.Cancel();
  if (thread_.joinable()) {
    thread_.join();
    CLUSTERLINK_LOG_INFO("Watcher stopped", {StringField("watcher", name_)});
  }
}

std::uint64_t PollingWatcher::Attempts() const {
  return attempts_.load();
}

std::uint64_t PollingWatcher::Failures() const {
  return failures_.load();
}

void PollingWatcher::Run() {
  while (!token_.IsCancelled()) {
    bool failed = false;
    try {
      poll_();
    } catch (const std::exception& e) {
      failed = true;
      ++failures_;
      CLUSTERLINK_LOG_ERROR("Watcher attempt failed",
                            {StringField("watcher", name_), StringField("error", e.what()), IntField("retry_delay_ms", retry_delay_.count())});
    } catch (...) {
      failed = true;
      ++failures_;
      CLUSTERLINK_LOG_ERROR("Watcher attempt failed with a non-standard exception",
                            {StringField("watcher", name_), IntField("retry_delay_ms", retry_delay_.count())});
    }

    try {
      registry_.Touch(name_);
    } catch (const util::WatcherNotRegistered& e) {
      // registry was cleared underneath us; nothing sensible left to report to
      CLUSTERLINK_LOG_ERROR("Watcher lost its registration, stopping", {StringField("watcher", name_), StringField("error", e.what())});
      return;
    }
    ++attempts_;

    if (token_.WaitFor(failed ? retry_delay_ : interval_)) return;
  }
}

} // namespace clusterlink::health
