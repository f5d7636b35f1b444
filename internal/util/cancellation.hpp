#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace clusterlink::util {

/*
  One-shot cancellation signal shared between a long-running task and
  whoever owns its lifetime.

  Waiters block on a condition variable, so an idle task costs nothing.
  Callbacks let a task fold the signal into its own wait condition.
*/
class CancellationToken {
 public:
  using Callback = std::function<void()>;

  // Unsubscribes on destruction. Must not outlive the token.
  class Subscription {
   public:
    Subscription() = default;
    Subscription(CancellationToken* token, std::uint64_t id) : token_(token), id_(id) {
    }
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

   private:
    CancellationToken* token_ = nullptr;
    std::uint64_t      id_    = 0;
  };

  CancellationToken() = default;

  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  bool IsCancelled() const;

  void Wait();

  // Returns true if cancelled before the timeout elapsed.
  bool WaitFor(std::chrono::milliseconds timeout);

  // Runs `callback` on cancellation, or immediately if already cancelled.
  Subscription Subscribe(Callback callback);

 private:
  void Unsubscribe(std::uint64_t id);

  mutable std::mutex                mutex_;
  std::condition_variable           cv_;
  bool                              cancelled_ = false;
  std::uint64_t                     next_id_   = 1;
  std::map<std::uint64_t, Callback> callbacks_;
};

} // namespace clusterlink::util
