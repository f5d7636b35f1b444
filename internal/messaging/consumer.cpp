#include "consumer.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::StringField;

namespace {

constexpr std::uint16_t kConsumerPrefetch = 1;

// Written by the cancellation callback and the broker's lost and closed
// callbacks, all of which may outlive RunConsumer's stack frame.
struct WaitState {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    cancelled      = false;
  bool                    lost           = false;
  bool                    channel_closed = false;
  std::string             reason;
};

/*
  Releases the subscription in reverse order of acquisition. Failures
  while releasing are logged, never thrown, so they cannot mask the
  error that caused the unwind.
*/
class ConsumerResources {
 public:
  explicit ConsumerResources(std::string queue) : queue_(std::move(queue)) {
  }

  ~ConsumerResources() {
    Release();
  }

  ConsumerResources(const ConsumerResources&)            = delete;
  ConsumerResources& operator=(const ConsumerResources&) = delete;

  std::shared_ptr<broker::Connection> connection;
  std::shared_ptr<broker::Channel>    channel;
  std::string                         consumer_tag;

 private:
  void Release() noexcept {
    if (channel) {
      try {
        if (!consumer_tag.empty() && channel->IsOpen()) channel->CancelConsumer(consumer_tag);
      } catch (const std::exception& e) {
        CLUSTERLINK_LOG_WARN("Failed to cancel consumer", {StringField("queue", queue_), StringField("error", e.what())});
      }
      try {
        channel->Close();
      } catch (const std::exception& e) {
        CLUSTERLINK_LOG_WARN("Failed to close consumer channel", {StringField("queue", queue_), StringField("error", e.what())});
      }
      channel.reset();
    }

    if (connection) {
      try {
        connection->Close();
      } catch (const std::exception& e) {
        CLUSTERLINK_LOG_WARN("Failed to close consumer connection", {StringField("queue", queue_), StringField("error", e.what())});
      }
      connection.reset();
    }
  }

  std::string queue_;
};

} // namespace

void RunConsumer(broker::ConnectionFactory& factory,
                 const broker::BrokerEndpoint& endpoint,
                 const std::string& queue_name,
                 broker::MessageHandler handler,
                 util::CancellationToken& token) {
  if (token.IsCancelled()) return;

  auto state = std::make_shared<WaitState>();

  ConsumerResources resources(queue_name);
  try {
    resources.connection = factory.Connect(endpoint);
  } catch (const broker::BrokerError& e) {
    throw util::ConnectionError("failed to connect to " + endpoint.host + ":" + std::to_string(endpoint.port) + ": " + e.what());
  }

  resources.connection->OnConnectionLost([state](const std::string& reason) {
    {
      std::lock_guard lock(state->mutex);
      state->lost   = true;
      state->reason = reason;
    }
    state->cv.notify_all();
  });

  try {
    resources.channel = resources.connection->OpenChannel();
    resources.channel->OnClose([state](const std::string& reason) {
      {
        std::lock_guard lock(state->mutex);
        state->channel_closed = true;
        state->reason         = reason;
      }
      state->cv.notify_all();
    });
    resources.channel->SetPrefetch(kConsumerPrefetch);
    resources.channel->DeclareQueuePassive(queue_name);
    resources.consumer_tag = resources.channel->Consume(queue_name, std::move(handler));
  } catch (const broker::NotFound& e) {
    CLUSTERLINK_LOG_ERROR("Queue does not exist", {StringField("queue", queue_name), StringField("error", e.what())});
    throw util::NotFound("queue '" + queue_name + "' does not exist");
  } catch (const broker::BrokerError& e) {
    throw util::ConnectionError("failed to subscribe to '" + queue_name + "': " + e.what());
  }

  CLUSTERLINK_LOG_INFO("Consumer started", {StringField("queue", queue_name), StringField("consumer_tag", resources.consumer_tag)});

  auto subscription = token.Subscribe([state] {
    {
      std::lock_guard lock(state->mutex);
      state->cancelled = true;
    }
    state->cv.notify_all();
  });

  bool        lost           = false;
  bool        channel_closed = false;
  std::string lost_reason;
  {
    std::unique_lock lock(state->mutex);
    state->cv.wait(lock, [&] { return state->cancelled || state->lost || state->channel_closed; });
    if (!state->cancelled) {
      lost           = state->lost;
      channel_closed = !state->lost;
    }
    lost_reason = state->reason;
  }

  if (lost) {
    CLUSTERLINK_LOG_WARN("Consumer lost broker connection", {StringField("queue", queue_name), StringField("reason", lost_reason)});
    throw util::ConnectionError("connection lost while consuming '" + queue_name + "': " + lost_reason);
  }
  if (channel_closed) {
    CLUSTERLINK_LOG_WARN("Broker closed consumer channel", {StringField("queue", queue_name), StringField("reason", lost_reason)});
    throw util::ConnectionError("channel closed by broker while consuming '" + queue_name + "': " + lost_reason);
  }

  CLUSTERLINK_LOG_INFO("Consumer cancelled", {StringField("queue", queue_name)});
}

} // namespace clusterlink::messaging
