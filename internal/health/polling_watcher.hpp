#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/cancellation.hpp"
#include "watcher_registry.hpp"

namespace clusterlink::health {

inline constexpr std::chrono::milliseconds kDefaultRetryDelay = std::chrono::seconds(5);

/*
  Runs `poll` on a dedicated thread every `interval` and records every
  attempt, successful or not, in the watcher registry.

  A failed attempt is logged and retried after `retry_delay`. Stop()
  takes effect between attempts; an attempt in flight is allowed to
  finish.
*/
class PollingWatcher {
 public:
  using PollFn = std::function<void()>;

  PollingWatcher(std::string name,
                 WatcherRegistry& registry,
                 PollFn poll,
                 std::chrono::milliseconds interval,
                 std::chrono::milliseconds retry_delay = kDefaultRetryDelay);
  ~PollingWatcher();

  PollingWatcher(const PollingWatcher&)            = delete;
  PollingWatcher& operator=(const PollingWatcher&) = delete;

  // Registers the watcher name and starts the loop. Throws
  // util::DuplicateWatcher if the name is taken.
  void Start();
  void Stop();

  const std::string& Name() const {
    return name_;
  }

  std::uint64_t Attempts() const;
  std::uint64_t Failures() const;

 private:
  void Run();

  std::string               name_;
  WatcherRegistry&          registry_;
  PollFn                    poll_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds retry_delay_;

  util::CancellationToken    token_;
  std::thread                thread_;
  std::atomic<bool>          started_{false};
  std::atomic<std::uint64_t> attempts_{0};
  std::atomic<std::uint64_t> failures_{0};
};

} // namespace clusterlink::health
