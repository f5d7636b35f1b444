#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "api/clusterlink/v1.hpp"

namespace clusterlink::messaging {

inline constexpr const char* kHeartbeatMessageType     = "heartbeat";
inline constexpr const char* kClusterNodesMessageType  = "cluster_nodes";
inline constexpr const char* kClusterModelsMessageType = "aim_cluster_models";
inline constexpr const char* kQuotasAllocationType     = "cluster_quotas_allocation";

// JSON with the proto field names (snake_case) as used on the wire.
std::string EncodeMessage(const google::protobuf::Message& message);

// Reads only the message_type discriminator. Throws util::InvalidMessage
// for malformed JSON or a missing discriminator.
std::string DecodeMessageType(const std::string& body);

/*
  Typed decoders. Unknown JSON fields are ignored so newer agents can add
  fields; missing required fields, a wrong discriminator or values outside
  the schema raise util::InvalidMessage.
*/
v1::HeartbeatMessage        DecodeHeartbeat(const std::string& body);
v1::ClusterNodesMessage     DecodeClusterNodes(const std::string& body);
v1::AIMClusterModelsMessage DecodeClusterModels(const std::string& body);
v1::ClusterQuotasAllocationMessage DecodeQuotasAllocation(const std::string& body);

void ValidateMessage(const v1::HeartbeatMessage& message);
void ValidateMessage(const v1::ClusterNodesMessage& message);
void ValidateMessage(const v1::AIMClusterModelsMessage& message);
void ValidateMessage(const v1::ClusterQuotasAllocationMessage& message);

} // namespace clusterlink::messaging
