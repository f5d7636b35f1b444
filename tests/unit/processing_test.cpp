#include "internal/messaging/processing.hpp"

#include <atomic>
#include <functional>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/messaging/consumer.hpp"
#include "internal/messaging/publisher.hpp"
#include "internal/messaging/topology.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/broker_fixture.hpp"
#include "tests/support/wait.hpp"

namespace {

using namespace clusterlink;
using messaging::ProcessOutcome;
using testing::kTestUser;
using testing::kTestVhost;
using testing::MakeBroker;
using testing::MakeEndpoint;
using testing::WaitUntil;

// Settlement calls only; nothing is routed.
class RecordingMessage final : public broker::IncomingMessage {
 public:
  const std::string& Body() const override {
    return body_;
  }
  const std::string& UserId() const override {
    return user_;
  }
  const std::string& RoutingKey() const override {
    return queue_;
  }
  std::uint64_t DeliveryTag() const override {
    return 7;
  }
  bool Redelivered() const override {
    return false;
  }
  void Ack() override {
    ++acks;
    if (on_ack) on_ack();
  }
  void Nack(bool requeue) override {
    nacks.push_back(requeue);
  }

  int                   acks = 0;
  std::vector<bool>     nacks;
  std::function<void()> on_ack;

 private:
  std::string body_  = "{}";
  std::string user_  = "cluster-a";
  std::string queue_ = "airm_common";
};

void TestSuccessAcks() {
  RecordingMessage message;
  const auto       outcome = messaging::ProcessMessage(message, [](const broker::IncomingMessage&) {});

  assert(outcome == ProcessOutcome::kAcked);
  assert(message.acks == 1);
  assert(message.nacks.empty());
}

void TestFailureRequeues() {
  RecordingMessage message;
  const auto outcome = messaging::ProcessMessage(message, [](const broker::IncomingMessage&) { throw std::runtime_error("database down"); });

  assert(outcome == ProcessOutcome::kRequeued);
  assert(message.acks == 0);
  assert(message.nacks.size() == 1 && message.nacks[0]);
}

void TestInvalidMessageIsRejectedWithoutRequeue() {
  RecordingMessage message;
  const auto       outcome =
      messaging::ProcessMessage(message, [](const broker::IncomingMessage&) { throw util::InvalidMessage("bad payload"); });

  assert(outcome == ProcessOutcome::kDeadLettered);
  assert(message.nacks.size() == 1 && !message.nacks[0]);
}

std::shared_ptr<broker::memory::MemoryBroker> BrokerWithMessage(const std::string& body) {
  auto mq         = MakeBroker();
  auto connection = mq->Connect(MakeEndpoint());
  auto channel    = connection->OpenChannel();
  messaging::EnsureTopology(*channel, "airm_common");
  messaging::Publish(*channel, "airm_common", body, kTestUser);
  connection->Close();
  return mq;
}

void TestRejectedMessageLandsInDeadLetterQueue() {
  auto                    mq = BrokerWithMessage("not json");
  util::CancellationToken token;
  std::atomic<int>        attempts{0};

  std::thread runner([&] {
    messaging::RunConsumer(*mq, MakeEndpoint(), "airm_common",
                           [&](broker::IncomingMessage& message) {
                             ++attempts;
                             messaging::ProcessMessage(message, [](const broker::IncomingMessage&) { throw util::InvalidMessage("not json"); });
                           },
                           token);
  });

  assert(WaitUntil([&] { return mq->ReadyCount(kTestVhost, "dlx_queue") == 1; }));
  token.Cancel();
  runner.join();

  assert(attempts.load() == 1);
  assert(mq->ReadyCount(kTestVhost, "airm_common") == 0);
  assert(mq->ReadyBodies(kTestVhost, "dlx_queue")[0] == "not json");
}

void TestRequeuedMessageIsRedelivered() {
  auto                    mq = BrokerWithMessage("{}");
  util::CancellationToken token;

  std::mutex        mutex;
  std::vector<bool> redelivered;

  std::thread runner([&] {
    messaging::RunConsumer(*mq, MakeEndpoint(), "airm_common",
                           [&](broker::IncomingMessage& message) {
                             bool first;
                             {
                               std::lock_guard lock(mutex);
                               redelivered.push_back(message.Redelivered());
                               first = redelivered.size() == 1;
                             }
                             messaging::ProcessMessage(message, [first](const broker::IncomingMessage&) {
                               if (first) throw std::runtime_error("transient");
                             });
                           },
                           token);
  });

  assert(WaitUntil([&] {
    std::lock_guard lock(mutex);
    return redelivered.size() == 2;
  }));
  assert(WaitUntil([&] { return mq->UnackedCount(kTestVhost, "airm_common") == 0; }));
  token.Cancel();
  runner.join();

  assert(!redelivered[0]);
  assert(redelivered[1]);
  assert(mq->ReadyCount(kTestVhost, "airm_common") == 0);
  assert(mq->ReadyCount(kTestVhost, "dlx_queue") == 0);
}

const std::string kReply = R"({"message_type":"reply"})";

// Broker with an empty "replies" queue that outboxes publish into.
std::shared_ptr<broker::memory::MemoryBroker> BrokerWithRepliesQueue() {
  auto mq         = MakeBroker();
  auto connection = mq->Connect(MakeEndpoint());
  auto channel    = connection->OpenChannel();
  messaging::EnsureTopology(*channel, "replies");
  connection->Close();
  return mq;
}

void TestRepliesArePublishedBeforeAck() {
  auto                          mq = BrokerWithRepliesQueue();
  messaging::ConnectionProvider connections(mq, MakeEndpoint());
  RecordingMessage              message;

  std::size_t replies_at_ack = 0;
  message.on_ack             = [&] { replies_at_ack = mq->ReadyCount(kTestVhost, "replies"); };

  const auto outcome = messaging::ProcessMessage(message, connections, kTestUser,
                                                 [](const broker::IncomingMessage&, messaging::MessageSender& outbox) {
                                                   outbox.Enqueue("replies", kReply);
                                                 });

  assert(outcome == ProcessOutcome::kAcked);
  assert(message.acks == 1);
  assert(replies_at_ack == 1);
  assert(mq->ReadyBodies(kTestVhost, "replies")[0] == kReply);
}

void TestRejectedDeliveryDiscardsReplies() {
  auto                          mq = BrokerWithRepliesQueue();
  messaging::ConnectionProvider connections(mq, MakeEndpoint());
  RecordingMessage              message;
  bool                          flushed = false;

  const auto outcome = messaging::ProcessMessage(message, connections, kTestUser,
                                                 [&](const broker::IncomingMessage&, messaging::MessageSender& outbox) {
                                                   outbox.Enqueue("replies", kReply);
                                                   outbox.OnFlushed([&] { flushed = true; });
                                                   throw util::InvalidMessage("bad payload");
                                                 });

  assert(outcome == ProcessOutcome::kDeadLettered);
  assert(message.nacks.size() == 1 && !message.nacks[0]);
  assert(!flushed);
  assert(mq->ReadyCount(kTestVhost, "replies") == 0);
}

void TestFailedReplyPublishRequeues() {
  auto             mq = BrokerWithRepliesQueue();
  RecordingMessage message;

  // the broker refuses a user_id that differs from the login
  messaging::ConnectionProvider connections(mq, MakeEndpoint());
  const auto outcome = messaging::ProcessMessage(message, connections, "someone-else",
                                                 [](const broker::IncomingMessage&, messaging::MessageSender& outbox) {
                                                   outbox.Enqueue("replies", kReply);
                                                 });

  assert(outcome == ProcessOutcome::kRequeued);
  assert(message.acks == 0);
  assert(message.nacks.size() == 1 && message.nacks[0]);
  assert(mq->ReadyCount(kTestVhost, "replies") == 0);
}

void TestUnreachableBrokerRequeuesAndReconnects() {
  auto                          mq = BrokerWithRepliesQueue();
  messaging::ConnectionProvider connections(mq, MakeEndpoint());
  int                           runs = 0;
  auto                          reply = [&](const broker::IncomingMessage&, messaging::MessageSender& outbox) {
    ++runs;
    outbox.Enqueue("replies", kReply);
  };

  mq->SetAvailable(false);
  RecordingMessage first;
  assert(messaging::ProcessMessage(first, connections, kTestUser, reply) == ProcessOutcome::kRequeued);
  assert(runs == 0);

  mq->SetAvailable(true);
  RecordingMessage second;
  assert(messaging::ProcessMessage(second, connections, kTestUser, reply) == ProcessOutcome::kAcked);
  assert(runs == 1);
  assert(mq->ReadyCount(kTestVhost, "replies") == 1);
}

void TestConsumerRepliesThroughOutbox() {
  auto mq = BrokerWithMessage("{}");
  {
    auto connection = mq->Connect(MakeEndpoint());
    auto channel    = connection->OpenChannel();
    messaging::EnsureTopology(*channel, "replies");
    connection->Close();
  }

  messaging::ConnectionProvider connections(mq, MakeEndpoint());
  util::CancellationToken       token;

  std::thread runner([&] {
    messaging::RunConsumer(*mq, MakeEndpoint(), "airm_common",
                           [&](broker::IncomingMessage& message) {
                             messaging::ProcessMessage(message, connections, kTestUser,
                                                       [](const broker::IncomingMessage& m, messaging::MessageSender& outbox) {
                                                         outbox.Enqueue("replies", R"({"echo":)" + m.Body() + "}");
                                                       });
                           },
                           token);
  });

  assert(WaitUntil([&] { return mq->ReadyCount(kTestVhost, "replies") == 1; }));
  assert(WaitUntil([&] { return mq->UnackedCount(kTestVhost, "airm_common") == 0; }));
  token.Cancel();
  runner.join();
  connections.Reset();

  assert(mq->ReadyBodies(kTestVhost, "replies")[0] == R"({"echo":{}})");
  assert(mq->ReadyCount(kTestVhost, "airm_common") == 0);
  assert(mq->ReadyCount(kTestVhost, "dlx_queue") == 0);
  assert(mq->OpenConnectionCount() == 0);
}

} // namespace

int main() {
  TestSuccessAcks();
  TestFailureRequeues();
  TestInvalidMessageIsRejectedWithoutRequeue();
  TestRejectedMessageLandsInDeadLetterQueue();
  TestRequeuedMessageIsRedelivered();
  TestRepliesArePublishedBeforeAck();
  TestRejectedDeliveryDiscardsReplies();
  TestFailedReplyPublishRequeues();
  TestUnreachableBrokerRequeuesAndReconnects();
  TestConsumerRepliesThroughOutbox();

  std::cout << "clusterlink_unit_processing: pass\n";
  return 0;
}
