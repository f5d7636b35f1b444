#include "codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/validation.hpp"

namespace clusterlink::messaging {

namespace {

void ParseJson(const std::string& body, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, message, options);
  if (!status.ok()) {
    throw util::InvalidMessage("cannot decode " + message->GetDescriptor()->name() + ": " + std::string(status.message()));
  }
}

void ExpectType(const std::string& actual, const char* expected) {
  if (actual != expected) {
    throw util::InvalidMessage("message_type is '" + actual + "', expected '" + expected + "'");
  }
}

void Require(bool condition, const std::string& what) {
  if (!condition) throw util::InvalidMessage(what);
}

void ValidateNode(const v1::ClusterNode& node, int index) {
  const std::string where = "cluster_nodes[" + std::to_string(index) + "]";

  Require(!node.name().empty(), where + ".name is required");
  Require(node.has_cpu_milli_cores(), where + ".cpu_milli_cores is required");
  Require(node.has_memory_bytes(), where + ".memory_bytes is required");
  Require(node.has_ephemeral_storage_bytes(), where + ".ephemeral_storage_bytes is required");
  Require(!node.status().empty(), where + ".status is required");
  Require(node.has_is_ready(), where + ".is_ready is required");

  if (node.has_gpu_information()) {
    const auto& gpu = node.gpu_information();
    Require(gpu.has_count(), where + ".gpu_information.count is required");
    Require(gpu.has_vram_bytes_per_device(), where + ".gpu_information.vram_bytes_per_device is required");
    Require(gpu.vendor() == "NVIDIA" || gpu.vendor() == "AMD", where + ".gpu_information.vendor must be NVIDIA or AMD");
  }
}

} // namespace

std::string EncodeMessage(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::InvalidMessage("cannot encode " + message.GetDescriptor()->name() + ": " + std::string(status.message()));
  }
  return json;
}

std::string DecodeMessageType(const std::string& body) {
  v1::MessageEnvelope envelope;
  ParseJson(body, &envelope);
  if (envelope.message_type().empty()) {
    throw util::InvalidMessage("message_type is missing");
  }
  return envelope.message_type();
}

void ValidateMessage(const v1::HeartbeatMessage& message) {
  ExpectType(message.message_type(), kHeartbeatMessageType);
  Require(message.has_last_heartbeat_at(), "last_heartbeat_at is required");
  Require(util::IsValidClusterName(message.cluster_name()), "cluster_name must match ^[0-9A-Za-z-_]+$");
  Require(!message.organization_name().empty(), "organization_name is required");
}

void ValidateMessage(const v1::ClusterNodesMessage& message) {
  ExpectType(message.message_type(), kClusterNodesMessageType);
  Require(message.has_updated_at(), "updated_at is required");
  for (int i = 0; i < message.cluster_nodes_size(); ++i) {
    ValidateNode(message.cluster_nodes(i), i);
  }
}

void ValidateMessage(const v1::AIMClusterModelsMessage& message) {
  ExpectType(message.message_type(), kClusterModelsMessageType);
  Require(message.has_updated_at(), "updated_at is required");
  for (int i = 0; i < message.models_size(); ++i) {
    const auto& model = message.models(i);
    Require(!model.resource_name().empty(), "models[" + std::to_string(i) + "].resource_name is required");
    Require(!model.image_reference().empty(), "models[" + std::to_string(i) + "].image_reference is required");
  }
}

void ValidateMessage(const v1::ClusterQuotasAllocationMessage& message) {
  ExpectType(message.message_type(), kQuotasAllocationType);
  Require(message.gpu_vendor().empty() || message.gpu_vendor() == "NVIDIA" || message.gpu_vendor() == "AMD",
          "gpu_vendor must be NVIDIA or AMD");
  for (int i = 0; i < message.quota_allocations_size(); ++i) {
    Require(!message.quota_allocations(i).quota_name().empty(), "quota_allocations[" + std::to_string(i) + "].quota_name is required");
  }
}

v1::HeartbeatMessage DecodeHeartbeat(const std::string& body) {
  v1::HeartbeatMessage message;
  ParseJson(body, &message);
  ValidateMessage(message);
  return message;
}

v1::ClusterNodesMessage DecodeClusterNodes(const std::string& body) {
  v1::ClusterNodesMessage message;
  ParseJson(body, &message);
  ValidateMessage(message);
  return message;
}

v1::AIMClusterModelsMessage DecodeClusterModels(const std::string& body) {
  v1::AIMClusterModelsMessage message;
  ParseJson(body, &message);
  ValidateMessage(message);
  return message;
}

v1::ClusterQuotasAllocationMessage DecodeQuotasAllocation(const std::string& body) {
  v1::ClusterQuotasAllocationMessage message;
  ParseJson(body, &message);
  ValidateMessage(message);
  return message;
}

} // namespace clusterlink::messaging
