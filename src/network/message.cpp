#include "network/message.hpp"
#include "utils/digest.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

namespace cloudsim {
namespace network {

const char* to_string(MessageType type) {
  switch (type) {
    case MessageType::HEARTBEAT:     return "heartbeat";
    case MessageType::HEARTBEAT_ACK: return "heartbeat_ack";
    case MessageType::DATA_TRANSFER: return "data_transfer";
    case MessageType::DATA_ACK:      return "data_ack";
    case MessageType::RPC_REQUEST:   return "rpc_request";
    case MessageType::RPC_RESPONSE:  return "rpc_response";
    case MessageType::DISCOVERY:     return "discovery";
    case MessageType::DISCOVERY_ACK: return "discovery_ack";
    default:                         return "unknown";
  }
}

std::optional<MessageType> message_type_from_string(const std::string& name) {
  static const MessageType all_types[] = {
    MessageType::HEARTBEAT, MessageType::HEARTBEAT_ACK,
    MessageType::DATA_TRANSFER, MessageType::DATA_ACK,
    MessageType::RPC_REQUEST, MessageType::RPC_RESPONSE,
    MessageType::DISCOVERY, MessageType::DISCOVERY_ACK
  };

  for (MessageType type : all_types) {
    if (name == to_string(type)) {
      return type;
    }
  }
  return std::nullopt;
}

double unix_time_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

std::string generate_message_id(const std::string& sender_id) {
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_real_distribution<double> dis(0.0, 1.0);

  std::stringstream seed;
  seed << sender_id << "-" << std::fixed << std::setprecision(6) << unix_time_now()
       << "-" << std::setprecision(17) << dis(gen);
  return utils::md5_hex(seed.str());
}

} // namespace network
} // namespace cloudsim
