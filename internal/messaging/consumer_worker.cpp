#include "consumer_worker.hpp"

#include "consumer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::IntField;
using observability::StringField;

ConsumerWorker::ConsumerWorker(std::shared_ptr<broker::ConnectionFactory> factory,
                               broker::BrokerEndpoint endpoint,
                               std::string queue_name,
                               broker::MessageHandler handler,
                               std::chrono::milliseconds restart_delay)
    : factory_(std::move(factory)),
      endpoint_(std::move(endpoint)),
      queue_name_(std::move(queue_name)),
      handler_(std::move(handler)),
      restart_delay_(restart_delay) {
}

ConsumerWorker::~ConsumerWorker() {
  Stop();
}

void ConsumerWorker::Start() {
  if (running_.exchange(true)) {
    throw util::InvalidState("consumer for '" + queue_name_ + "' already running");
  }

  token_  = std::make_unique<util::CancellationToken>();
  thread_ = std::thread([this] { Run(); });
}

void ConsumerWorker::Stop() {
  if (!running_.exchange(false)) return;

  token_->Cancel();
  if (thread_.joinable()) thread_.join();
  token_.reset();
}

bool ConsumerWorker::Running() const {
  return running_.load();
}

std::uint64_t ConsumerWorker::Failures() const {
  return failures_.load();
}

void ConsumerWorker::Run() {
  while (!token_->IsCancelled()) {
    try {
      RunConsumer(*factory_, endpoint_, queue_name_, handler_, *token_);
    } catch (const std::exception& e) {
      ++failures_;
      CLUSTERLINK_LOG_ERROR("Consumer loop failed, restarting",
                            {StringField("queue", queue_name_),
                             StringField("error", e.what()),
                             IntField("restart_delay_ms", restart_delay_.count())});
      if (token_->WaitFor(restart_delay_)) break;
    }
  }

  CLUSTERLINK_LOG_INFO("Consumer worker stopped", {StringField("queue", queue_name_)});
}

} // namespace clusterlink::messaging
