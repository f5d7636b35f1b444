#include "publisher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kDefaultExchange = "";
constexpr const char* kJsonContentType = "application/json";

} // namespace

void Publish(broker::Channel& channel, const std::string& queue_name, const std::string& body, const std::string& claimed_identity) {
  broker::OutgoingMessage message;
  message.body          = body;
  message.content_type  = kJsonContentType;
  message.delivery_mode = broker::DeliveryMode::kPersistent;
  message.user_id       = claimed_identity;

  try {
    channel.Publish(kDefaultExchange, queue_name, message);
  } catch (const broker::PreconditionFailed& e) {
    // basic.publish only fails a precondition on user-id validation
    CLUSTERLINK_LOG_ERROR("Publish rejected: identity mismatch",
                          {StringField("queue", queue_name), StringField("claimed_identity", claimed_identity), StringField("error", e.what())});
    throw util::PublisherIdentityMismatch("broker rejected user id '" + claimed_identity + "': " + e.what());
  } catch (const broker::ChannelClosed& e) {
    throw util::ConnectionError(std::string("publish on closed channel: ") + e.what());
  } catch (const broker::ConnectionRefused& e) {
    throw util::ConnectionError(e.what());
  }

  CLUSTERLINK_LOG_DEBUG("Message published", {StringField("queue", queue_name), IntField("bytes", static_cast<std::int64_t>(body.size()))});
}

void Publish(broker::Connection& connection, const std::string& queue_name, const std::string& body, const std::string& claimed_identity) {
  std::shared_ptr<broker::Channel> channel;
  try {
    channel = connection.OpenChannel();
  } catch (const broker::BrokerError& e) {
    throw util::ConnectionError(std::string("failed to open channel: ") + e.what());
  }

  try {
    Publish(*channel, queue_name, body, claimed_identity);
  } catch (...) {
    channel->Close();
    throw;
  }
  channel->Close();
}

} // namespace clusterlink::messaging
