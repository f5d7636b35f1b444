#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <google/protobuf/message.h>

#include "internal/broker/api/broker.hpp"

namespace clusterlink::messaging {

/*
  Buffers outbound messages produced by one unit of work and publishes
  them together once the work succeeded.

  All messages of a flush go out over one channel, in enqueue order.
  Messages that were published are dropped from the buffer even when a
  later one fails, so a retried Flush() never duplicates them.

  OnFlushed() callbacks hold local state changes that must only become
  visible once the messages describing them are out.
*/
class MessageSender {
 public:
  MessageSender(std::shared_ptr<broker::Connection> connection, std::string claimed_identity);

  MessageSender(const MessageSender&)            = delete;
  MessageSender& operator=(const MessageSender&) = delete;

  void Enqueue(const std::string& queue_name, const google::protobuf::Message& message);
  void Enqueue(const std::string& queue_name, std::string body);

  // Runs after the next Flush() that publishes everything; dropped by
  // Discard().
  void OnFlushed(std::function<void()> callback);

  // Throws util::PublisherIdentityMismatch or util::ConnectionError.
  void Flush();
  void Discard();

  std::size_t Pending() const;

 private:
  void PublishPendingLocked();

  struct Outbound {
    std::string queue;
    std::string body;
  };

  std::shared_ptr<broker::Connection> connection_;
  std::string                         claimed_identity_;

  mutable std::mutex                 mutex_;
  std::deque<Outbound>               pending_;
  std::vector<std::function<void()>> on_flushed_;
};

/*
  Runs `work` with a fresh sender; flushes if `work` returns, discards if
  it throws.
*/
template <typename Fn>
decltype(auto) SendScoped(std::shared_ptr<broker::Connection> connection, std::string claimed_identity, Fn&& work) {
  MessageSender sender(std::move(connection), std::move(claimed_identity));
  try {
    if constexpr (std::is_void_v<decltype(work(sender))>) {
      work(sender);
      sender.Flush();
    } else {
      auto result = work(sender);
      sender.Flush();
      return result;
    }
  } catch (...) {
    sender.Discard();
    throw;
  }
}

} // namespace clusterlink::messaging
