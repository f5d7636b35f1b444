#include "internal/messaging/consumer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/messaging/consumer_worker.hpp"
#include "internal/messaging/publisher.hpp"
#include "internal/messaging/topology.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/broker_fixture.hpp"
#include "tests/support/wait.hpp"

namespace {

using namespace clusterlink;
using testing::kTestUser;
using testing::kTestVhost;
using testing::MakeBroker;
using testing::MakeEndpoint;
using testing::WaitUntil;
using namespace std::chrono_literals;

/*
  Records the order in which channels and connections are closed by
  wrapping the in-process broker.
*/
struct CloseLog {
  std::mutex               mutex;
  std::vector<std::string> events;

  void Add(const std::string& event) {
    std::lock_guard lock(mutex);
    events.push_back(event);
  }

  std::vector<std::string> Events() {
    std::lock_guard lock(mutex);
    return events;
  }
};

class TrackingChannel final : public broker::Channel {
 public:
  TrackingChannel(std::shared_ptr<broker::Channel> inner, std::shared_ptr<CloseLog> log) : inner_(std::move(inner)), log_(std::move(log)) {
  }

  void DeclareExchange(const std::string& name, broker::ExchangeType type, bool durable) override {
    inner_->DeclareExchange(name, type, durable);
  }
  void DeclareQueue(const std::string& name, const broker::QueueOptions& options) override {
    inner_->DeclareQueue(name, options);
  }
  void DeclareQueuePassive(const std::string& name) override {
    inner_->DeclareQueuePassive(name);
  }
  void BindQueue(const std::string& queue, const std::string& exchange, const std::string& key) override {
    inner_->BindQueue(queue, exchange, key);
  }
  void Publish(const std::string& exchange, const std::string& key, const broker::OutgoingMessage& message) override {
    inner_->Publish(exchange, key, message);
  }
  void SetPrefetch(std::uint16_t count) override {
    prefetch = count;
    inner_->SetPrefetch(count);
  }
  std::string Consume(const std::string& queue, broker::MessageHandler handler) override {
    return inner_->Consume(queue, std::move(handler));
  }
  void CancelConsumer(const std::string& tag) override {
    log_->Add("cancel");
    inner_->CancelConsumer(tag);
  }
  void OnClose(ClosedCallback callback) override {
    inner_->OnClose(std::move(callback));
  }
  void Close() override {
    log_->Add("channel");
    inner_->Close();
  }
  bool IsOpen() const override {
    return inner_->IsOpen();
  }

  std::uint16_t prefetch = 0;

 private:
  std::shared_ptr<broker::Channel> inner_;
  std::shared_ptr<CloseLog>        log_;
};

class TrackingConnection final : public broker::Connection {
 public:
  TrackingConnection(std::shared_ptr<broker::Connection> inner, std::shared_ptr<CloseLog> log)
      : inner_(std::move(inner)), log_(std::move(log)) {
  }

  std::shared_ptr<broker::Channel> OpenChannel() override {
    auto channel = std::make_shared<TrackingChannel>(inner_->OpenChannel(), log_);
    last_channel = channel;
    return channel;
  }
  const std::string& AuthenticatedUser() const override {
    return inner_->AuthenticatedUser();
  }
  void OnConnectionLost(LostCallback callback) override {
    inner_->OnConnectionLost(std::move(callback));
  }
  void Close() override {
    log_->Add("connection");
    inner_->Close();
  }
  bool IsOpen() const override {
    return inner_->IsOpen();
  }

  std::shared_ptr<TrackingChannel> last_channel;

 private:
  std::shared_ptr<broker::Connection> inner_;
  std::shared_ptr<CloseLog>           log_;
};

class TrackingFactory final : public broker::ConnectionFactory {
 public:
  explicit TrackingFactory(std::shared_ptr<broker::ConnectionFactory> inner) : inner_(std::move(inner)) {
  }

  std::shared_ptr<broker::Connection> Connect(const broker::BrokerEndpoint& endpoint) override {
    auto connection = std::make_shared<TrackingConnection>(inner_->Connect(endpoint), log);
    last_connection = connection;
    return connection;
  }

  std::shared_ptr<CloseLog>           log = std::make_shared<CloseLog>();
  std::shared_ptr<TrackingConnection> last_connection;

 private:
  std::shared_ptr<broker::ConnectionFactory> inner_;
};

std::shared_ptr<broker::memory::MemoryBroker> BrokerWithQueue(const std::string& queue) {
  auto mq         = MakeBroker();
  auto connection = mq->Connect(MakeEndpoint());
  auto channel    = connection->OpenChannel();
  messaging::EnsureTopology(*channel, queue);
  connection->Close();
  return mq;
}

void PublishBodies(const std::shared_ptr<broker::memory::MemoryBroker>& mq, const std::string& queue, const std::vector<std::string>& bodies) {
  auto connection = mq->Connect(MakeEndpoint());
  for (const auto& body : bodies) messaging::Publish(*connection, queue, body, kTestUser);
  connection->Close();
}

void TestHandlesMessagesOneAtATime() {
  auto mq = BrokerWithQueue("jobs");
  PublishBodies(mq, "jobs", {"first", "second"});

  TrackingFactory         factory(mq);
  util::CancellationToken token;

  std::mutex               mutex;
  std::vector<std::string> seen;
  std::atomic<int>         active{0};
  std::atomic<int>         max_active{0};

  std::thread runner([&] {
    messaging::RunConsumer(factory, MakeEndpoint(), "jobs",
                           [&](broker::IncomingMessage& message) {
                             const int now_active = ++active;
                             if (now_active > max_active) max_active = now_active;

                             // the second message must still be queued while the first is unacked
                             if (message.Body() == "first") {
                               assert(mq->ReadyCount(kTestVhost, "jobs") == 1);
                               std::this_thread::sleep_for(20ms);
                             }
                             {
                               std::lock_guard lock(mutex);
                               seen.push_back(message.Body());
                             }
                             --active;
                             message.Ack();
                           },
                           token);
  });

  assert(WaitUntil([&] {
    std::lock_guard lock(mutex);
    return seen.size() == 2;
  }));
  token.Cancel();
  runner.join();

  assert(seen[0] == "first" && seen[1] == "second");
  assert(max_active.load() == 1);
  assert(factory.last_connection->last_channel->prefetch == 1);
  assert(mq->ReadyCount(kTestVhost, "jobs") == 0);
}

void TestCancellationReleasesChannelThenConnection() {
  auto                    mq = BrokerWithQueue("jobs");
  TrackingFactory         factory(mq);
  util::CancellationToken token;

  std::thread runner([&] { messaging::RunConsumer(factory, MakeEndpoint(), "jobs", [](broker::IncomingMessage& m) { m.Ack(); }, token); });

  assert(WaitUntil([&] { return mq->ConsumerCount(kTestVhost, "jobs") == 1; }));
  token.Cancel();
  runner.join();

  const auto events = factory.log->Events();
  assert(events.size() == 3);
  assert(events[0] == "cancel");
  assert(events[1] == "channel");
  assert(events[2] == "connection");
  assert(mq->ConsumerCount(kTestVhost, "jobs") == 0);
  assert(mq->OpenConnectionCount() == 0);
}

void TestAlreadyCancelledReturnsImmediately() {
  auto                    mq = BrokerWithQueue("jobs");
  TrackingFactory         factory(mq);
  util::CancellationToken token;
  token.Cancel();

  messaging::RunConsumer(factory, MakeEndpoint(), "jobs", [](broker::IncomingMessage&) {}, token);
  assert(factory.last_connection == nullptr);
}

void TestMissingQueueIsNotFoundAndReleasesResources() {
  auto                    mq = MakeBroker();
  TrackingFactory         factory(mq);
  util::CancellationToken token;

  bool not_found = false;
  try {
    messaging::RunConsumer(factory, MakeEndpoint(), "missing", [](broker::IncomingMessage&) {}, token);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(!mq->HasQueue(kTestVhost, "missing"));

  const auto events = factory.log->Events();
  assert(events.size() == 2);
  assert(events[0] == "channel");
  assert(events[1] == "connection");
  assert(mq->OpenConnectionCount() == 0);
}

void TestConnectFailureIsConnectionError() {
  auto mq = BrokerWithQueue("jobs");
  mq->SetAvailable(false);
  util::CancellationToken token;

  bool failed = false;
  try {
    messaging::RunConsumer(*mq, MakeEndpoint(), "jobs", [](broker::IncomingMessage&) {}, token);
  } catch (const util::ConnectionError&) {
    failed = true;
  }
  assert(failed);
}

void TestConnectionDropIsConnectionError() {
  auto                    mq = BrokerWithQueue("jobs");
  util::CancellationToken token;

  std::atomic<bool> connection_error{false};
  std::thread       runner([&] {
    try {
      messaging::RunConsumer(*mq, MakeEndpoint(), "jobs", [](broker::IncomingMessage& m) { m.Ack(); }, token);
    } catch (const util::ConnectionError&) {
      connection_error = true;
    }
  });

  assert(WaitUntil([&] { return mq->ConsumerCount(kTestVhost, "jobs") == 1; }));
  mq->DropConnections("broker restart");
  runner.join();

  assert(connection_error.load());
  assert(mq->OpenConnectionCount() == 0);
}

void TestWorkerRestartsAfterConnectionLoss() {
  auto mq = BrokerWithQueue("jobs");

  std::atomic<int>           handled{0};
  messaging::ConsumerWorker  worker(mq, MakeEndpoint(), "jobs",
                                   [&](broker::IncomingMessage& m) {
                                     ++handled;
                                     m.Ack();
                                   },
                                   10ms);
  worker.Start();

  assert(WaitUntil([&] { return mq->ConsumerCount(kTestVhost, "jobs") == 1; }));
  mq->DropConnections("broker restart");

  assert(WaitUntil([&] { return worker.Failures() == 1 && mq->ConsumerCount(kTestVhost, "jobs") == 1; }));
  PublishBodies(mq, "jobs", {"after-restart"});
  assert(WaitUntil([&] { return handled.load() == 1; }));

  worker.Stop();
  assert(!worker.Running());
  assert(mq->ConsumerCount(kTestVhost, "jobs") == 0);
}

void AckTwice(broker::IncomingMessage& message) {
  message.Ack();
  // unknown delivery tag: the broker closes the channel
  message.Ack();
}

void TestBrokerClosedChannelIsConnectionError() {
  auto mq = BrokerWithQueue("jobs");
  PublishBodies(mq, "jobs", {"first"});

  TrackingFactory         factory(mq);
  util::CancellationToken token;

  bool failed = false;
  try {
    messaging::RunConsumer(factory, MakeEndpoint(), "jobs", AckTwice, token);
  } catch (const util::ConnectionError& e) {
    failed = std::string(e.what()).find("channel closed by broker") != std::string::npos;
  }
  assert(failed);

  // the closed channel is released, then the connection
  const auto events = factory.log->Events();
  assert(events.size() == 2);
  assert(events[0] == "channel");
  assert(events[1] == "connection");
  assert(mq->ConsumerCount(kTestVhost, "jobs") == 0);
  assert(mq->ReadyCount(kTestVhost, "jobs") == 0);
  assert(mq->OpenConnectionCount() == 0);
}

void TestWorkerResubscribesAfterChannelClose() {
  auto mq = BrokerWithQueue("jobs");

  std::atomic<int>          handled{0};
  messaging::ConsumerWorker worker(mq, MakeEndpoint(), "jobs",
                                   [&](broker::IncomingMessage& m) {
                                     ++handled;
                                     if (m.Body() == "double-ack") {
                                       AckTwice(m);
                                     } else {
                                       m.Ack();
                                     }
                                   },
                                   10ms);
  worker.Start();
  assert(WaitUntil([&] { return mq->ConsumerCount(kTestVhost, "jobs") == 1; }));

  PublishBodies(mq, "jobs", {"double-ack"});
  assert(WaitUntil([&] { return worker.Failures() == 1 && mq->ConsumerCount(kTestVhost, "jobs") == 1; }));

  PublishBodies(mq, "jobs", {"next"});
  assert(WaitUntil([&] { return handled.load() == 2; }));
  assert(WaitUntil([&] { return mq->ReadyCount(kTestVhost, "jobs") == 0 && mq->UnackedCount(kTestVhost, "jobs") == 0; }));

  worker.Stop();
  assert(mq->ConsumerCount(kTestVhost, "jobs") == 0);
}

} // namespace

int main() {
  TestHandlesMessagesOneAtATime();
  TestCancellationReleasesChannelThenConnection();
  TestAlreadyCancelledReturnsImmediately();
  TestMissingQueueIsNotFoundAndReleasesResources();
  TestConnectFailureIsConnectionError();
  TestConnectionDropIsConnectionError();
  TestWorkerRestartsAfterConnectionLoss();
  TestBrokerClosedChannelIsConnectionError();
  TestWorkerResubscribesAfterChannelClose();

  std::cout << "clusterlink_unit_consumer: pass\n";
  return 0;
}
