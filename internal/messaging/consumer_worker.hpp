#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "internal/broker/api/broker.hpp"
#include "internal/util/cancellation.hpp"

namespace clusterlink::messaging {

/*
  Keeps one consumer loop alive on a background thread.

  Whenever RunConsumer exits with an error (connection loss, queue not
  yet declared) the loop is restarted from scratch after `restart_delay`.
  Stop() cancels the running loop and joins.
*/
class ConsumerWorker {
 public:
  ConsumerWorker(std::shared_ptr<broker::ConnectionFactory> factory,
                 broker::BrokerEndpoint endpoint,
                 std::string queue_name,
                 broker::MessageHandler handler,
                 std::chrono::milliseconds restart_delay);
  ~ConsumerWorker();

  ConsumerWorker(const ConsumerWorker&)            = delete;
  ConsumerWorker& operator=(const ConsumerWorker&) = delete;

  void Start();
  void Stop();

  const std::string& QueueName() const {
    return queue_name_;
  }

  bool Running() const;
  // Number of times the loop exited with an error.
  std::uint64_t Failures() const;

 private:
  void Run();

  std::shared_ptr<broker::ConnectionFactory> factory_;
  broker::BrokerEndpoint                     endpoint_;
  std::string                                queue_name_;
  broker::MessageHandler                     handler_;
  std::chrono::milliseconds                  restart_delay_;

  std::unique_ptr<util::CancellationToken> token_;
  std::thread                              thread_;
  std::atomic<bool>                        running_{false};
  std::atomic<std::uint64_t>               failures_{0};
};

} // namespace clusterlink::messaging
