#include "internal/health/polling_watcher.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include "internal/health/liveness.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/wait.hpp"

namespace {

using clusterlink::health::LivenessEvaluator;
using clusterlink::health::PollingWatcher;
using clusterlink::health::WatcherRegistry;
using clusterlink::testing::WaitUntil;
using namespace std::chrono_literals;

clusterlink::util::MonotonicTimePoint LastAttempt(const WatcherRegistry& registry, const std::string& name) {
  for (const auto& entry : registry.Snapshot()) {
    if (entry.name == name) return entry.last_attempt;
  }
  return {};
}

void TestStartRegistersAndPolls() {
  WatcherRegistry  registry;
  std::atomic<int> polls{0};

  PollingWatcher watcher("w", registry, [&] { ++polls; }, 10ms);
  watcher.Start();

  assert(registry.Contains("w"));
  assert(WaitUntil([&] { return watcher.Attempts() >= 3; }));
  watcher.Stop();

  assert(polls.load() >= 3);
  assert(watcher.Failures() == 0);
}

void TestFailedAttemptsStillTouch() {
  WatcherRegistry registry;

  PollingWatcher watcher("failing", registry, [] { throw std::runtime_error("broker unreachable"); }, 1h, 10ms);
  watcher.Start();
  const auto registered_at = LastAttempt(registry, "failing");

  // the retry delay applies, not the hour-long interval
  assert(WaitUntil([&] { return watcher.Failures() >= 2; }));
  assert(WaitUntil([&] { return LastAttempt(registry, "failing") > registered_at; }));
  watcher.Stop();

  LivenessEvaluator liveness(registry);
  assert(liveness.AllHealthy());
}

void TestNonStandardThrowCountsAsFailure() {
  WatcherRegistry registry;

  PollingWatcher watcher("odd", registry, [] { throw 42; }, 1h, 10ms);
  watcher.Start();

  assert(WaitUntil([&] { return watcher.Failures() >= 2; }));
  watcher.Stop();
  assert(watcher.Attempts() >= 2);
}

void TestStopInterruptsLongWait() {
  WatcherRegistry registry;
  PollingWatcher  watcher("slow", registry, [] {}, 1h);
  watcher.Start();
  assert(WaitUntil([&] { return watcher.Attempts() == 1; }));

  const auto started = std::chrono::steady_clock::now();
  watcher.Stop();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert(watcher.Attempts() == 1);
}

void TestDuplicateNameFailsStart() {
  WatcherRegistry registry;
  registry.Register("taken");

  PollingWatcher watcher("taken", registry, [] {}, 10ms);
  bool           duplicate = false;
  try {
    watcher.Start();
  } catch (const clusterlink::util::DuplicateWatcher&) {
    duplicate = true;
  }
  assert(duplicate);
  assert(watcher.Attempts() == 0);
}

} // namespace

int main() {
  TestStartRegistersAndPolls();
  TestFailedAttemptsStillTouch();
  TestNonStandardThrowCountsAsFailure();
  TestStopInterruptsLongWait();
  TestDuplicateNameFailsStart();

  std::cout << "clusterlink_unit_polling_watcher: pass\n";
  return 0;
}
