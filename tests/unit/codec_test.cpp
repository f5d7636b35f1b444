#include "internal/messaging/codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace clusterlink;
using google::protobuf::util::TimeUtil;

template <typename Fn>
bool ThrowsInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const util::InvalidMessage&) {
    return true;
  }
  return false;
}

google::protobuf::Struct ParseObject(const std::string& json) {
  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object);
  assert(status.ok());
  return object;
}

void TestHeartbeatEncodesWireFieldNames() {
  v1::HeartbeatMessage heartbeat;
  heartbeat.set_message_type(messaging::kHeartbeatMessageType);
  *heartbeat.mutable_last_heartbeat_at() = TimeUtil::SecondsToTimestamp(1741608000);
  heartbeat.set_cluster_name("gpu-cluster_01");
  heartbeat.set_organization_name("Acme");

  const auto object = ParseObject(messaging::EncodeMessage(heartbeat));
  const auto& fields = object.fields();

  assert(fields.size() == 4);
  assert(fields.at("message_type").string_value() == "heartbeat");
  assert(fields.at("last_heartbeat_at").string_value() == "2025-03-10T12:00:00Z");
  assert(fields.at("cluster_name").string_value() == "gpu-cluster_01");
  assert(fields.at("organization_name").string_value() == "Acme");
}

void TestDecodeMessageType() {
  assert(messaging::DecodeMessageType(R"({"message_type":"cluster_nodes","extra":1})") == "cluster_nodes");
  assert(ThrowsInvalid([] { messaging::DecodeMessageType("not json"); }));
  assert(ThrowsInvalid([] { messaging::DecodeMessageType(R"({"cluster_name":"x"})"); }));
}

void TestDecodeHeartbeatValidates() {
  const auto heartbeat = messaging::DecodeHeartbeat(
      R"({"message_type":"heartbeat","last_heartbeat_at":"2025-03-10T12:00:00+00:00","cluster_name":"c1","organization_name":"Acme"})");
  assert(heartbeat.cluster_name() == "c1");
  assert(heartbeat.last_heartbeat_at().seconds() == 1741608000);

  assert(ThrowsInvalid([] {
    messaging::DecodeHeartbeat(R"({"message_type":"heartbeat","last_heartbeat_at":"2025-03-10T12:00:00Z","cluster_name":"bad name","organization_name":"Acme"})");
  }));
  assert(ThrowsInvalid([] {
    messaging::DecodeHeartbeat(R"({"message_type":"heartbeat","cluster_name":"c1","organization_name":"Acme"})");
  }));
  assert(ThrowsInvalid([] {
    messaging::DecodeHeartbeat(R"({"message_type":"cluster_nodes","last_heartbeat_at":"2025-03-10T12:00:00Z","cluster_name":"c1","organization_name":"Acme"})");
  }));
}

void TestDecodeClusterNodes() {
  const std::string valid = R"({
    "message_type": "cluster_nodes",
    "updated_at": "2025-03-10T12:00:00Z",
    "cluster_nodes": [{
      "name": "node-1",
      "cpu_milli_cores": 64000,
      "memory_bytes": 549755813888,
      "ephemeral_storage_bytes": 0,
      "gpu_information": {"count": 8, "type": "mi300x", "vendor": "AMD", "vram_bytes_per_device": 206158430208, "product_name": "Instinct MI300X"},
      "status": "Ready",
      "is_ready": false
    }]
  })";

  const auto message = messaging::DecodeClusterNodes(valid);
  assert(message.cluster_nodes_size() == 1);
  assert(message.cluster_nodes(0).gpu_information().count() == 8);
  assert(message.cluster_nodes(0).has_is_ready() && !message.cluster_nodes(0).is_ready());

  // zero and false values survive a round trip through the wire format
  const auto object = ParseObject(messaging::EncodeMessage(message));
  const auto& node  = object.fields().at("cluster_nodes").list_value().values(0).struct_value().fields();
  assert(node.count("ephemeral_storage_bytes") == 1);
  assert(node.count("is_ready") == 1);

  assert(ThrowsInvalid([] {
    messaging::DecodeClusterNodes(R"({"message_type":"cluster_nodes","updated_at":"2025-03-10T12:00:00Z","cluster_nodes":[{"name":"n"}]})");
  }));
  assert(ThrowsInvalid([] {
    messaging::DecodeClusterNodes(R"({"message_type":"cluster_nodes","updated_at":"2025-03-10T12:00:00Z","cluster_nodes":[
      {"name":"n","cpu_milli_cores":1,"memory_bytes":1,"ephemeral_storage_bytes":1,"status":"Ready","is_ready":true,
       "gpu_information":{"count":1,"type":"x","vendor":"Intel","vram_bytes_per_device":1,"product_name":"x"}}]})");
  }));
}

void TestDecodeClusterModels() {
  const auto message = messaging::DecodeClusterModels(R"({
    "message_type": "aim_cluster_models",
    "updated_at": "2025-03-10T12:00:00Z",
    "models": [{"resource_name": "llama", "image_reference": "registry/llama:1", "labels": {"family": "llama"}, "status": "Ready"}]
  })");
  assert(message.models_size() == 1);
  assert(message.models(0).labels().at("family") == "llama");

  assert(ThrowsInvalid([] {
    messaging::DecodeClusterModels(R"({"message_type":"aim_cluster_models","updated_at":"2025-03-10T12:00:00Z","models":[{"status":"Ready"}]})");
  }));
}

} // namespace

int main() {
  TestHeartbeatEncodesWireFieldNames();
  TestDecodeMessageType();
  TestDecodeHeartbeatValidates();
  TestDecodeClusterNodes();
  TestDecodeClusterModels();

  std::cout << "clusterlink_unit_codec: pass\n";
  return 0;
}
