#include "amqp_broker.hpp"

#include <rabbitmq-c/amqp.h>
#include <rabbitmq-c/tcp_socket.h>
#include <sys/time.h>

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/observability/logging.hpp"

namespace clusterlink::broker::amqp {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::uint16_t kMaxChannel = 2047;

timeval ToTimeval(std::chrono::milliseconds duration) {
  timeval tv{};
  tv.tv_sec  = static_cast<decltype(tv.tv_sec)>(duration.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((duration.count() % 1000) * 1000);
  return tv;
}

amqp_bytes_t Bytes(const std::string& value) {
  amqp_bytes_t bytes;
  bytes.len   = value.size();
  bytes.bytes = const_cast<char*>(value.data());
  return bytes;
}

std::string FromBytes(const amqp_bytes_t& bytes) {
  if (bytes.len == 0 || bytes.bytes == nullptr) return {};
  return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

// x-arguments are string valued; the entries point into `arguments`.
class ArgumentTable {
 public:
  explicit ArgumentTable(const Arguments& arguments) {
    entries_.reserve(arguments.size());
    for (const auto& [key, value] : arguments) {
      amqp_table_entry_t entry;
      entry.key               = Bytes(key);
      entry.value.kind        = AMQP_FIELD_KIND_UTF8;
      entry.value.value.bytes = Bytes(value);
      entries_.push_back(entry);
    }
  }

  amqp_table_t Table() {
    amqp_table_t table;
    table.num_entries = static_cast<int>(entries_.size());
    table.entries     = entries_.empty() ? nullptr : entries_.data();
    return table;
  }

 private:
  std::vector<amqp_table_entry_t> entries_;
};

[[noreturn]] void ThrowForReplyCode(int code, const std::string& text) {
  switch (code) {
    case AMQP_PRECONDITION_FAILED:
      throw PreconditionFailed(text);
    case AMQP_NOT_FOUND:
      throw NotFound(text);
    case AMQP_ACCESS_REFUSED:
    case AMQP_NOT_ALLOWED:
      throw AccessRefused(text);
    default:
      throw ChannelClosed(text);
  }
}

struct Delivery {
  std::uint16_t channel = 0;
  std::string   consumer_tag;
  std::uint64_t delivery_tag = 0;
  bool          redelivered  = false;
  std::string   routing_key;
  std::string   body;
  std::string   user_id;
};

std::string UserIdOf(const amqp_basic_properties_t& properties) {
  if ((properties._flags & AMQP_BASIC_USER_ID_FLAG) == 0) return {};
  return FromBytes(properties.user_id);
}

struct ChannelState {
  bool                                 open       = true;
  bool                                 confirming = false;
  std::uint64_t                        published  = 0;
  std::string                          close_reason;
  std::vector<Channel::ClosedCallback> close_callbacks;
};

struct ConsumerEntry {
  std::uint16_t  channel = 0;
  MessageHandler handler;
};

/*
  One AMQP connection and the bookkeeping of its channels. Shared by the
  connection, its channels and in-flight deliveries.

  io_mutex_ serializes all use of state_ and guards the maps below.
  Close and lost listeners run with it held and must only record state.
*/
class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(amqp_connection_state_t state, std::string vhost, std::string user, AmqpOptions options)
      : state_(state), vhost_(std::move(vhost)), user_(std::move(user)), options_(options) {
  }

  ~Session() {
    Close();
    amqp_destroy_connection(state_);
  }

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  const std::string& User() const {
    return user_;
  }

  std::uint16_t OpenChannel() {
    std::lock_guard lock(io_mutex_);
    EnsureOpenLocked();

    const auto id = AllocateChannelLocked();
    amqp_channel_open(state_, id);
    channels_[id] = ChannelState{};
    try {
      CheckReplyLocked(id, amqp_get_rpc_reply(state_), "channel.open");
    } catch (...) {
      channels_.erase(id);
      throw;
    }
    return id;
  }

  void CloseChannel(std::uint16_t id) {
    std::lock_guard lock(io_mutex_);
    auto            it = channels_.find(id);
    if (it == channels_.end()) return;

    const bool was_open = it->second.open;
    channels_.erase(it);
    ForgetConsumersLocked(id);

    if (!was_open || !open_) return;
    const auto reply = amqp_channel_close(state_, id, AMQP_REPLY_SUCCESS);
    if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
      CLUSTERLINK_LOG_WARN("AMQP channel close failed", {StringField("vhost", vhost_), IntField("channel", id)});
    }
  }

  bool ChannelOpen(std::uint16_t id) const {
    std::lock_guard lock(io_mutex_);
    auto            it = channels_.find(id);
    return open_ && it != channels_.end() && it->second.open;
  }

  void OnChannelClose(std::uint16_t id, Channel::ClosedCallback callback) {
    std::lock_guard lock(io_mutex_);
    auto            it = channels_.find(id);
    if (it == channels_.end() || !it->second.open || !open_) {
      const std::string reason = it != channels_.end() && !it->second.close_reason.empty() ? it->second.close_reason
                                                                                         : "channel " + std::to_string(id) + " is closed";
      callback(reason);
      return;
    }
    it->second.close_callbacks.push_back(std::move(callback));
  }

  void DeclareExchange(std::uint16_t id, const std::string& name, ExchangeType type, bool durable) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);
    amqp_exchange_declare(state_, id, Bytes(name), amqp_cstring_bytes(ToString(type)), 0, durable ? 1 : 0, 0, 0, amqp_empty_table);
    CheckReplyLocked(id, amqp_get_rpc_reply(state_), "exchange.declare '" + name + "'");
  }

  void DeclareQueue(std::uint16_t id, const std::string& name, const QueueOptions& options, bool passive) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);

    ArgumentTable arguments(options.arguments);
    amqp_queue_declare(state_,
                       id,
                       Bytes(name),
                       passive ? 1 : 0,
                       options.durable ? 1 : 0,
                       options.exclusive ? 1 : 0,
                       options.auto_delete ? 1 : 0,
                       passive ? amqp_empty_table : arguments.Table());
    CheckReplyLocked(id, amqp_get_rpc_reply(state_), "queue.declare '" + name + "'");
  }

  void BindQueue(std::uint16_t id, const std::string& queue, const std::string& exchange, const std::string& routing_key) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);
    amqp_queue_bind(state_, id, Bytes(queue), Bytes(exchange), Bytes(routing_key), amqp_empty_table);
    CheckReplyLocked(id, amqp_get_rpc_reply(state_), "queue.bind '" + queue + "'");
  }

  void SetPrefetch(std::uint16_t id, std::uint16_t count) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);
    amqp_basic_qos(state_, id, 0, count, 0);
    CheckReplyLocked(id, amqp_get_rpc_reply(state_), "basic.qos");
  }

  void Publish(std::uint16_t id, const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message) {
    std::lock_guard lock(io_mutex_);
    auto&           channel = EnsureChannelLocked(id);

    if (!channel.confirming) {
      amqp_confirm_select(state_, id);
      CheckReplyLocked(id, amqp_get_rpc_reply(state_), "confirm.select");
      channel.confirming = true;
    }

    amqp_basic_properties_t properties{};
    properties._flags        = AMQP_BASIC_DELIVERY_MODE_FLAG;
    properties.delivery_mode = static_cast<std::uint8_t>(message.delivery_mode);
    if (!message.content_type.empty()) {
      properties._flags |= AMQP_BASIC_CONTENT_TYPE_FLAG;
      properties.content_type = Bytes(message.content_type);
    }
    if (!message.user_id.empty()) {
      properties._flags |= AMQP_BASIC_USER_ID_FLAG;
      properties.user_id = Bytes(message.user_id);
    }

    const int status = amqp_basic_publish(state_, id, Bytes(exchange), Bytes(routing_key), 0, 0, &properties, Bytes(message.body));
    if (status != AMQP_STATUS_OK) {
      LoseLocked(std::string("basic.publish failed: ") + amqp_error_string2(status));
      throw ConnectionRefused(std::string("basic.publish failed: ") + amqp_error_string2(status));
    }

    WaitForConfirmLocked(id, ++channel.published);
  }

  std::string Consume(std::uint16_t id, const std::string& queue, MessageHandler handler) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);

    auto* ok = amqp_basic_consume(state_, id, Bytes(queue), amqp_empty_bytes, 0, 0, 0, amqp_empty_table);
    CheckReplyLocked(id, amqp_get_rpc_reply(state_), "basic.consume '" + queue + "'");

    auto tag        = FromBytes(ok->consumer_tag);
    consumers_[tag] = ConsumerEntry{id, std::move(handler)};
    if (!io_thread_.joinable()) {
      io_thread_ = std::thread([self = shared_from_this()] { self->RunIo(); });
    }
    return tag;
  }

  void CancelConsumer(std::uint16_t id, const std::string& tag) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);
    consumers_.erase(tag);
    amqp_basic_cancel(state_, id, Bytes(tag));
    CheckReplyLocked(id, amqp_get_rpc_reply(state_), "basic.cancel '" + tag + "'");
  }

  void Settle(std::uint16_t id, std::uint64_t delivery_tag, bool ack, bool requeue) {
    std::lock_guard lock(io_mutex_);
    EnsureChannelLocked(id);

    const int status = ack ? amqp_basic_ack(state_, id, delivery_tag, 0) : amqp_basic_nack(state_, id, delivery_tag, 0, requeue ? 1 : 0);
    if (status != AMQP_STATUS_OK) {
      LoseLocked(std::string("settle failed: ") + amqp_error_string2(status));
      throw ConnectionRefused(std::string("settle failed: ") + amqp_error_string2(status));
    }
  }

  void OnLost(Connection::LostCallback callback) {
    std::lock_guard lock(io_mutex_);
    lost_callbacks_.push_back(std::move(callback));
  }

  bool IsOpen() const {
    std::lock_guard lock(io_mutex_);
    return open_;
  }

  void Close() {
    stopping_ = true;
    if (io_thread_.joinable()) {
      if (io_thread_.get_id() == std::this_thread::get_id()) {
        io_thread_.detach();
      } else {
        io_thread_.join();
      }
    }

    std::lock_guard lock(io_mutex_);
    if (!open_) return;
    open_ = false;
    lost_callbacks_.clear();
    channels_.clear();
    consumers_.clear();

    const auto reply = amqp_connection_close(state_, AMQP_REPLY_SUCCESS);
    if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
      CLUSTERLINK_LOG_WARN("AMQP connection close failed", {StringField("vhost", vhost_), StringField("user", user_)});
    }
  }

 private:
  void EnsureOpenLocked() const {
    if (!open_) {
      throw ChannelClosed("connection to vhost '" + vhost_ + "' is closed");
    }
  }

  ChannelState& EnsureChannelLocked(std::uint16_t id) {
    EnsureOpenLocked();
    auto it = channels_.find(id);
    if (it == channels_.end()) {
      throw ChannelClosed("channel " + std::to_string(id) + " is closed");
    }
    if (!it->second.open) {
      throw ChannelClosed(it->second.close_reason.empty() ? "channel " + std::to_string(id) + " is closed" : it->second.close_reason);
    }
    return it->second;
  }

  std::uint16_t AllocateChannelLocked() const {
    for (std::uint16_t id = 1; id <= kMaxChannel; ++id) {
      if (channels_.find(id) == channels_.end()) return id;
    }
    throw BrokerError("no free channel on connection to vhost '" + vhost_ + "'");
  }

  void ForgetConsumersLocked(std::uint16_t id) {
    for (auto it = consumers_.begin(); it != consumers_.end();) {
      if (it->second.channel == id) {
        it = consumers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Broker closed `id`: acknowledge, then notify listeners.
  void ChannelClosedByBrokerLocked(std::uint16_t id, const amqp_channel_close_t& close) {
    amqp_channel_close_ok_t close_ok{};
    amqp_send_method(state_, id, AMQP_CHANNEL_CLOSE_OK_METHOD, &close_ok);

    const auto reason = FromBytes(close.reply_text);
    CLUSTERLINK_LOG_WARN("Broker closed AMQP channel",
                         {StringField("vhost", vhost_), IntField("channel", id), IntField("reply_code", close.reply_code), StringField("reason", reason)});

    ForgetConsumersLocked(id);
    auto it = channels_.find(id);
    if (it == channels_.end() || !it->second.open) return;

    it->second.open         = false;
    it->second.close_reason = reason;
    auto callbacks          = std::move(it->second.close_callbacks);
    it->second.close_callbacks.clear();
    for (auto& callback : callbacks) {
      callback(reason);
    }
  }

  void ConnectionClosedByBrokerLocked(const amqp_connection_close_t& close) {
    amqp_connection_close_ok_t close_ok{};
    amqp_send_method(state_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &close_ok);
    LoseLocked(FromBytes(close.reply_text));
  }

  void LoseLocked(const std::string& reason) {
    if (!open_) return;
    open_     = false;
    stopping_ = true;

    CLUSTERLINK_LOG_WARN("AMQP connection lost", {StringField("vhost", vhost_), StringField("user", user_), StringField("reason", reason)});

    for (auto& [id, channel] : channels_) {
      channel.open = false;
      channel.close_callbacks.clear();
    }
    consumers_.clear();

    auto callbacks = std::move(lost_callbacks_);
    lost_callbacks_.clear();
    for (auto& callback : callbacks) {
      callback(reason);
    }
  }

  void CheckReplyLocked(std::uint16_t id, const amqp_rpc_reply_t& reply, const std::string& context) {
    switch (reply.reply_type) {
      case AMQP_RESPONSE_NORMAL:
        return;

      case AMQP_RESPONSE_SERVER_EXCEPTION:
        if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
          const auto* close = static_cast<const amqp_channel_close_t*>(reply.reply.decoded);
          const auto  code  = close->reply_code;
          const auto  text  = FromBytes(close->reply_text);
          ChannelClosedByBrokerLocked(id, *close);
          ThrowForReplyCode(code, text);
        }
        if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
          const auto* close = static_cast<const amqp_connection_close_t*>(reply.reply.decoded);
          const auto  code  = close->reply_code;
          const auto  text  = FromBytes(close->reply_text);
          ConnectionClosedByBrokerLocked(*close);
          ThrowForReplyCode(code, text);
        }
        throw BrokerError(context + ": unexpected server method " + std::to_string(reply.reply.id));

      case AMQP_RESPONSE_LIBRARY_EXCEPTION:
        LoseLocked(context + ": " + amqp_error_string2(reply.library_error));
        throw ConnectionRefused(context + ": " + amqp_error_string2(reply.library_error));

      case AMQP_RESPONSE_NONE:
        break;
    }
    throw BrokerError(context + ": no reply");
  }

  // Reads the content of a delivery whose basic.deliver frame was taken
  // off the wire while waiting for something else.
  void StashDeliveryLocked(const amqp_frame_t& frame) {
    const auto* deliver = static_cast<const amqp_basic_deliver_t*>(frame.payload.method.decoded);

    Delivery delivery;
    delivery.channel      = frame.channel;
    delivery.consumer_tag = FromBytes(deliver->consumer_tag);
    delivery.delivery_tag = deliver->delivery_tag;
    delivery.redelivered  = deliver->redelivered != 0;
    delivery.routing_key  = FromBytes(deliver->routing_key);

    amqp_message_t message;
    const auto     reply = amqp_read_message(state_, frame.channel, &message, 0);
    if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
      LoseLocked("failed to read delivery content");
      throw ConnectionRefused("failed to read delivery content");
    }
    delivery.body    = FromBytes(message.body);
    delivery.user_id = UserIdOf(message.properties);
    amqp_destroy_message(&message);

    stashed_.push_back(std::move(delivery));
  }

  // Handles one method frame that arrived outside an RPC. Returns false
  // for frames that are not handled here.
  bool HandleAsyncMethodLocked(const amqp_frame_t& frame) {
    switch (frame.payload.method.id) {
      case AMQP_CHANNEL_CLOSE_METHOD:
        ChannelClosedByBrokerLocked(frame.channel, *static_cast<const amqp_channel_close_t*>(frame.payload.method.decoded));
        return true;
      case AMQP_CONNECTION_CLOSE_METHOD:
        ConnectionClosedByBrokerLocked(*static_cast<const amqp_connection_close_t*>(frame.payload.method.decoded));
        return true;
      case AMQP_BASIC_DELIVER_METHOD:
        StashDeliveryLocked(frame);
        return true;
      case AMQP_BASIC_CANCEL_METHOD: {
        const auto* cancel = static_cast<const amqp_basic_cancel_t*>(frame.payload.method.decoded);
        const auto  tag    = FromBytes(cancel->consumer_tag);
        consumers_.erase(tag);

        // queue deleted under the consumer; same handling as a closed channel
        auto it = channels_.find(frame.channel);
        if (it != channels_.end()) {
          auto callbacks = std::move(it->second.close_callbacks);
          it->second.close_callbacks.clear();
          for (auto& callback : callbacks) {
            callback("consumer '" + tag + "' cancelled by broker");
          }
        }
        return true;
      }
      default:
        return false;
    }
  }

  void WaitForConfirmLocked(std::uint16_t id, std::uint64_t sequence) {
    const auto deadline = std::chrono::steady_clock::now() + options_.rpc_timeout;

    while (true) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw ChannelClosed("publisher confirm timed out on channel " + std::to_string(id));
      }

      amqp_frame_t frame;
      auto         tv     = ToTimeval(remaining);
      const int    status = amqp_simple_wait_frame_noblock(state_, &frame, &tv);
      if (status == AMQP_STATUS_TIMEOUT) continue;
      if (status != AMQP_STATUS_OK) {
        LoseLocked(std::string("waiting for publisher confirm: ") + amqp_error_string2(status));
        throw ConnectionRefused(std::string("waiting for publisher confirm: ") + amqp_error_string2(status));
      }
      if (frame.frame_type != AMQP_FRAME_METHOD) continue;

      const auto method = frame.payload.method.id;
      if (frame.channel == id && method == AMQP_BASIC_ACK_METHOD) {
        const auto* ack = static_cast<const amqp_basic_ack_t*>(frame.payload.method.decoded);
        if (ack->delivery_tag == sequence || (ack->multiple && ack->delivery_tag >= sequence)) return;
        continue;
      }
      if (frame.channel == id && method == AMQP_BASIC_NACK_METHOD) {
        throw BrokerError("broker nacked message on channel " + std::to_string(id));
      }
      if (frame.channel == id && method == AMQP_CHANNEL_CLOSE_METHOD) {
        const auto* close = static_cast<const amqp_channel_close_t*>(frame.payload.method.decoded);
        const auto  code  = close->reply_code;
        const auto  text  = FromBytes(close->reply_text);
        ChannelClosedByBrokerLocked(id, *close);
        ThrowForReplyCode(code, text);
      }
      if (method == AMQP_CONNECTION_CLOSE_METHOD) {
        const auto* close = static_cast<const amqp_connection_close_t*>(frame.payload.method.decoded);
        const auto  code  = close->reply_code;
        const auto  text  = FromBytes(close->reply_text);
        ConnectionClosedByBrokerLocked(*close);
        ThrowForReplyCode(code, text);
      }
      HandleAsyncMethodLocked(frame);
    }
  }

  void RunIo() {
    const auto poll = ToTimeval(std::chrono::milliseconds(100));

    while (!stopping_) {
      Delivery delivery;
      bool     have_delivery = false;
      {
        std::lock_guard lock(io_mutex_);
        if (!open_) return;

        if (!stashed_.empty()) {
          delivery = std::move(stashed_.front());
          stashed_.pop_front();
          have_delivery = true;
        } else {
          amqp_maybe_release_buffers(state_);

          amqp_envelope_t envelope;
          auto            tv    = poll;
          const auto      reply = amqp_consume_message(state_, &envelope, &tv, 0);

          if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
            delivery.channel      = envelope.channel;
            delivery.consumer_tag = FromBytes(envelope.consumer_tag);
            delivery.delivery_tag = envelope.delivery_tag;
            delivery.redelivered  = envelope.redelivered != 0;
            delivery.routing_key  = FromBytes(envelope.routing_key);
            delivery.body         = FromBytes(envelope.message.body);
            delivery.user_id      = UserIdOf(envelope.message.properties);
            amqp_destroy_envelope(&envelope);
            have_delivery = true;
          } else if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION && reply.library_error == AMQP_STATUS_TIMEOUT) {
            // idle
          } else if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION && reply.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
            amqp_frame_t frame;
            const int    status = amqp_simple_wait_frame(state_, &frame);
            if (status != AMQP_STATUS_OK) {
              LoseLocked(std::string("read failed: ") + amqp_error_string2(status));
              return;
            }
            if (frame.frame_type == AMQP_FRAME_METHOD) {
              try {
                HandleAsyncMethodLocked(frame);
              } catch (const BrokerError&) {
                return;
              }
            }
          } else {
            LoseLocked(reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION ? amqp_error_string2(reply.library_error) : "unexpected reply");
            return;
          }
        }
      }

      if (have_delivery) Dispatch(std::move(delivery));
    }
  }

  void Dispatch(Delivery delivery);

  amqp_connection_state_t state_;
  const std::string       vhost_;
  const std::string       user_;
  const AmqpOptions       options_;

  mutable std::mutex                    io_mutex_;
  bool                                  open_ = true;
  std::map<std::uint16_t, ChannelState> channels_;
  std::map<std::string, ConsumerEntry>  consumers_;
  std::deque<Delivery>                  stashed_;
  std::vector<Connection::LostCallback> lost_callbacks_;
  std::atomic<bool>                     stopping_{false};
  std::thread                           io_thread_;
};

class AmqpDelivery final : public IncomingMessage {
 public:
  AmqpDelivery(std::weak_ptr<Session> session, Delivery delivery) : session_(std::move(session)), delivery_(std::move(delivery)) {
  }

  const std::string& Body() const override {
    return delivery_.body;
  }
  const std::string& UserId() const override {
    return delivery_.user_id;
  }
  const std::string& RoutingKey() const override {
    return delivery_.routing_key;
  }
  std::uint64_t DeliveryTag() const override {
    return delivery_.delivery_tag;
  }
  bool Redelivered() const override {
    return delivery_.redelivered;
  }

  void Ack() override {
    SessionOrThrow()->Settle(delivery_.channel, delivery_.delivery_tag, true, false);
  }

  void Nack(bool requeue) override {
    SessionOrThrow()->Settle(delivery_.channel, delivery_.delivery_tag, false, requeue);
  }

 private:
  std::shared_ptr<Session> SessionOrThrow() const {
    auto session = session_.lock();
    if (!session) {
      throw ChannelClosed("connection closed before delivery " + std::to_string(delivery_.delivery_tag) + " was settled");
    }
    return session;
  }

  std::weak_ptr<Session> session_;
  Delivery               delivery_;
};

void Session::Dispatch(Delivery delivery) {
  MessageHandler handler;
  {
    std::lock_guard lock(io_mutex_);
    auto            it = consumers_.find(delivery.consumer_tag);
    if (it == consumers_.end()) return;  // cancelled; the broker requeues it
    handler = it->second.handler;
  }

  AmqpDelivery message(weak_from_this(), std::move(delivery));
  try {
    handler(message);
  } catch (const std::exception& e) {
    CLUSTERLINK_LOG_ERROR("Consumer callback raised", {IntField("delivery_tag", static_cast<std::int64_t>(message.DeliveryTag())),
                                                       StringField("error", e.what())});
  } catch (...) {
    CLUSTERLINK_LOG_ERROR("Consumer callback raised a non-standard exception",
                          {IntField("delivery_tag", static_cast<std::int64_t>(message.DeliveryTag()))});
  }
}

class AmqpChannel final : public Channel {
 public:
  AmqpChannel(std::shared_ptr<Session> session, std::uint16_t id) : session_(std::move(session)), id_(id) {
  }

  ~AmqpChannel() override {
    Close();
  }

  void DeclareExchange(const std::string& name, ExchangeType type, bool durable) override {
    session_->DeclareExchange(id_, name, type, durable);
  }
  void DeclareQueue(const std::string& name, const QueueOptions& options) override {
    session_->DeclareQueue(id_, name, options, false);
  }
  void DeclareQueuePassive(const std::string& name) override {
    session_->DeclareQueue(id_, name, QueueOptions{}, true);
  }
  void BindQueue(const std::string& queue, const std::string& exchange, const std::string& routing_key) override {
    session_->BindQueue(id_, queue, exchange, routing_key);
  }
  void Publish(const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message) override {
    session_->Publish(id_, exchange, routing_key, message);
  }
  void SetPrefetch(std::uint16_t count) override {
    session_->SetPrefetch(id_, count);
  }
  std::string Consume(const std::string& queue, MessageHandler handler) override {
    return session_->Consume(id_, queue, std::move(handler));
  }
  void CancelConsumer(const std::string& consumer_tag) override {
    session_->CancelConsumer(id_, consumer_tag);
  }
  void OnClose(ClosedCallback callback) override {
    session_->OnChannelClose(id_, std::move(callback));
  }
  void Close() override {
    session_->CloseChannel(id_);
  }
  bool IsOpen() const override {
    return session_->ChannelOpen(id_);
  }

 private:
  std::shared_ptr<Session> session_;
  const std::uint16_t      id_;
};

class AmqpConnection final : public Connection {
 public:
  explicit AmqpConnection(std::shared_ptr<Session> session) : session_(std::move(session)) {
  }

  ~AmqpConnection() override {
    Close();
  }

  std::shared_ptr<Channel> OpenChannel() override {
    return std::make_shared<AmqpChannel>(session_, session_->OpenChannel());
  }
  const std::string& AuthenticatedUser() const override {
    return session_->User();
  }
  void OnConnectionLost(LostCallback callback) override {
    session_->OnLost(std::move(callback));
  }
  void Close() override {
    session_->Close();
  }
  bool IsOpen() const override {
    return session_->IsOpen();
  }

 private:
  std::shared_ptr<Session> session_;
};

} // namespace

AmqpConnectionFactory::AmqpConnectionFactory(AmqpOptions options) : options_(options) {
}

std::shared_ptr<Connection> AmqpConnectionFactory::Connect(const BrokerEndpoint& endpoint) {
  const std::string where = endpoint.host + ":" + std::to_string(endpoint.port);

  amqp_connection_state_t state  = amqp_new_connection();
  amqp_socket_t*          socket = amqp_tcp_socket_new(state);
  if (socket == nullptr) {
    amqp_destroy_connection(state);
    throw ConnectionRefused("cannot create socket for " + where);
  }

  auto      connect_timeout = ToTimeval(options_.connect_timeout);
  const int status          = amqp_socket_open_noblock(socket, endpoint.host.c_str(), endpoint.port, &connect_timeout);
  if (status != AMQP_STATUS_OK) {
    amqp_destroy_connection(state);
    throw ConnectionRefused("cannot connect to " + where + ": " + amqp_error_string2(status));
  }

  auto rpc_timeout = ToTimeval(options_.rpc_timeout);
  amqp_set_rpc_timeout(state, &rpc_timeout);

  const auto reply = amqp_login(state,
                                endpoint.vhost.c_str(),
                                0,
                                AMQP_DEFAULT_FRAME_SIZE,
                                options_.heartbeat_seconds,
                                AMQP_SASL_METHOD_PLAIN,
                                endpoint.credentials.username.c_str(),
                                endpoint.credentials.password.c_str());
  if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
    std::string reason = "login to vhost '" + endpoint.vhost + "' failed";
    int         code   = 0;
    if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION && reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
      const auto* close = static_cast<const amqp_connection_close_t*>(reply.reply.decoded);
      code              = close->reply_code;
      reason += ": " + FromBytes(close->reply_text);
    } else if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
      reason += std::string(": ") + amqp_error_string2(reply.library_error);
    }
    amqp_destroy_connection(state);

    if (code == AMQP_ACCESS_REFUSED || code == AMQP_NOT_ALLOWED) throw AccessRefused(reason);
    throw ConnectionRefused(reason);
  }

  CLUSTERLINK_LOG_INFO("Connected to AMQP broker",
                       {StringField("endpoint", where), StringField("vhost", endpoint.vhost), StringField("user", endpoint.credentials.username)});

  auto session = std::make_shared<Session>(state, endpoint.vhost, endpoint.credentials.username, options_);
  return std::make_shared<AmqpConnection>(std::move(session));
}

} // namespace clusterlink::broker::amqp
