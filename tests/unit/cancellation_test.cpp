#include "internal/util/cancellation.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using clusterlink::util::CancellationToken;

void TestWaitForTimesOutWhileNotCancelled() {
  CancellationToken token;
  assert(!token.IsCancelled());
  assert(!token.WaitFor(std::chrono::milliseconds(10)));
}

void TestCancelWakesWaiter() {
  CancellationToken token;
  std::atomic<bool> woke{false};

  std::thread waiter([&] {
    token.Wait();
    woke = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!woke.load());
  token.Cancel();
  waiter.join();

  assert(woke.load());
  assert(token.WaitFor(std::chrono::milliseconds(0)));
}

void TestSubscribeRunsOnceOnCancel() {
  CancellationToken token;
  int               calls = 0;

  auto subscription = token.Subscribe([&] { ++calls; });
  token.Cancel();
  token.Cancel();

  assert(calls == 1);
}

void TestSubscribeAfterCancelRunsImmediately() {
  CancellationToken token;
  token.Cancel();

  bool called       = false;
  auto subscription = token.Subscribe([&] { called = true; });
  assert(called);
}

void TestDroppedSubscriptionIsNotInvoked() {
  CancellationToken token;
  bool              called = false;
  {
    auto subscription = token.Subscribe([&] { called = true; });
  }
  token.Cancel();
  assert(!called);
}

} // namespace

int main() {
  TestWaitForTimesOutWhileNotCancelled();
  TestCancelWakesWaiter();
  TestSubscribeRunsOnceOnCancel();
  TestSubscribeAfterCancelRunsImmediately();
  TestDroppedSubscriptionIsNotInvoked();

  std::cout << "clusterlink_unit_cancellation: pass\n";
  return 0;
}
