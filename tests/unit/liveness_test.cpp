#include "internal/health/liveness.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/health/health_endpoint.hpp"
#include "internal/health/watcher_registry.hpp"

namespace {

using clusterlink::health::CheckLiveness;
using clusterlink::health::LivenessEvaluator;
using clusterlink::health::WatcherRegistry;
using clusterlink::util::MonotonicTimePoint;
using namespace std::chrono_literals;

struct FakeClock {
  MonotonicTimePoint now = MonotonicTimePoint(std::chrono::hours(10));

  WatcherRegistry::ClockFn Fn() {
    return [this] { return now; };
  }
};

void TestEmptyRegistryIsHealthy() {
  WatcherRegistry   registry;
  LivenessEvaluator liveness(registry);

  assert(liveness.AllHealthy());
  assert(liveness.UnhealthyWatchers().empty());
}

void TestDefaultThresholdIsFiveMinutes() {
  WatcherRegistry   registry;
  LivenessEvaluator liveness(registry);
  assert(liveness.Threshold() == std::chrono::minutes(5));
}

void TestExactlyAtThresholdIsHealthy() {
  FakeClock         clock;
  WatcherRegistry   registry(clock.Fn());
  LivenessEvaluator liveness(registry);

  registry.Register("w");
  clock.now += 5min;
  assert(liveness.AllHealthy());

  clock.now += 1ms;
  assert(!liveness.AllHealthy());
}

void TestSixMinuteStaleWatcherIsUnhealthy() {
  FakeClock         clock;
  WatcherRegistry   registry(clock.Fn());
  LivenessEvaluator liveness(registry);

  registry.Register("stale");
  clock.now += 5min;
  registry.Register("fresh");
  clock.now += 1min;

  assert(!liveness.AllHealthy());
  const auto unhealthy = liveness.UnhealthyWatchers();
  assert(unhealthy.size() == 1);
  assert(unhealthy[0] == "stale");

  // one minute ago is fine; a touch brings the stale one back
  registry.Touch("stale");
  assert(liveness.AllHealthy());
}

void TestExplicitThresholdOverridesConfigured() {
  FakeClock         clock;
  WatcherRegistry   registry(clock.Fn());
  LivenessEvaluator liveness(registry, 10s);

  registry.Register("w");
  clock.now += 30s;

  assert(!liveness.AllHealthy());
  assert(liveness.AllHealthy(1min));
}

void TestHealthEndpointResponses() {
  FakeClock         clock;
  WatcherRegistry   registry(clock.Fn());
  LivenessEvaluator liveness(registry);

  auto ok = CheckLiveness(liveness);
  assert(ok.http_status == 200);
  assert(ok.body == R"({"status":"OK"})");

  registry.Register("w");
  clock.now += 6min;

  auto failing = CheckLiveness(liveness);
  assert(failing.http_status == 500);
  assert(failing.body == R"({"detail":"One or more watchers are unhealthy"})");
}

} // namespace

int main() {
  TestEmptyRegistryIsHealthy();
  TestDefaultThresholdIsFiveMinutes();
  TestExactlyAtThresholdIsHealthy();
  TestSixMinuteStaleWatcherIsUnhealthy();
  TestExplicitThresholdOverridesConfigured();
  TestHealthEndpointResponses();

  std::cout << "clusterlink_unit_liveness: pass\n";
  return 0;
}
