#include "cancellation.hpp"

#include <utility>
#include <vector>

namespace clusterlink::util {

CancellationToken::Subscription::~Subscription() {
  if (token_) token_->Unsubscribe(id_);
}

CancellationToken::Subscription::Subscription(Subscription&& other) noexcept : token_(other.token_), id_(other.id_) {
  other.token_ = nullptr;
}

CancellationToken::Subscription& CancellationToken::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    if (token_) token_->Unsubscribe(id_);
    token_       = other.token_;
    id_          = other.id_;
    other.token_ = nullptr;
  }
  return *this;
}

void CancellationToken::Cancel() {
  std::vector<Callback> to_run;
  {
    std::lock_guard lock(mutex_);
    if (cancelled_) return;
    cancelled_ = true;
    for (auto& [id, callback] : callbacks_) {
      to_run.push_back(std::move(callback));
    }
    callbacks_.clear();
  }
  cv_.notify_all();

  for (auto& callback : to_run) {
    callback();
  }
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

void CancellationToken::Wait() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return cancelled_; });
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return cancelled_; });
}

CancellationToken::Subscription CancellationToken::Subscribe(Callback callback) {
  {
    std::lock_guard lock(mutex_);
    if (!cancelled_) {
      const auto id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return Subscription(this, id);
    }
  }
  callback();
  return {};
}

void CancellationToken::Unsubscribe(std::uint64_t id) {
  std::lock_guard lock(mutex_);
  callbacks_.erase(id);
}

} // namespace clusterlink::util
