#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace cloudsim {
namespace network {

Codec::Codec(std::size_t max_frame_size)
  : max_frame_size_(max_frame_size) {
  BOOST_LOG_TRIVIAL(trace) << "Codec: Initialized with max frame size: " << max_frame_size_;
}


//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::string Codec::encode(const WireMessage& message) const {
  std::string body;
  try {
    body = to_json(message).dump();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Cannot encode " << to_string(message.message_type)
                             << " message " << message.message_id << ": " << e.what();
    throw CodecError(std::string("unencodable message: ") + e.what());
  }
  if (body.size() > max_frame_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Message body of " << body.size()
                             << " bytes exceeds max frame size " << max_frame_size_;
    throw CodecError("frame too large");
  }

  uint32_t network_size = to_network_order(static_cast<uint32_t>(body.size()));

  std::string frame;
  frame.reserve(HEADER_SIZE + body.size());
  frame.append(reinterpret_cast<const char*>(&network_size), sizeof(network_size));
  frame.append(body);
  return frame;
}

std::size_t Codec::decode_header(const std::array<uint8_t, HEADER_SIZE>& header) const {
  uint32_t network_size;
  std::memcpy(&network_size, header.data(), sizeof(network_size));
  std::size_t body_size = from_network_order(network_size);

  if (body_size == 0 || body_size > max_frame_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid frame size: " << body_size;
    throw CodecError("invalid frame size " + std::to_string(body_size));
  }
  return body_size;
}

WireMessage Codec::decode_body(const std::string& body) const {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Malformed frame body: " << e.what();
    throw CodecError("malformed frame body");
  }
  return from_json(document);
}


//==============================================
// JSON MAPPING
//==============================================

nlohmann::json Codec::to_json(const WireMessage& message) {
  return nlohmann::json{
    {"message_id", message.message_id},
    {"message_type", to_string(message.message_type)},
    {"source_ip", message.source_ip},
    {"target_ip", message.target_ip},
    {"payload", message.payload},
    {"timestamp", message.timestamp},
    {"requires_ack", message.requires_ack}
  };
}

WireMessage Codec::from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw CodecError("frame body is not an object");
  }

  try {
    auto type = message_type_from_string(document.at("message_type").get<std::string>());
    if (!type) {
      throw CodecError("unknown message type: " + document.at("message_type").get<std::string>());
    }

    WireMessage message;
    message.message_id = document.at("message_id").get<std::string>();
    message.message_type = *type;
    message.source_ip = document.at("source_ip").get<std::string>();
    message.target_ip = document.at("target_ip").get<std::string>();
    message.payload = document.value("payload", nlohmann::json::object());
    message.timestamp = document.value("timestamp", 0.0);
    message.requires_ack = document.value("requires_ack", false);
    return message;
  } catch (const nlohmann::json::exception& e) {
    throw CodecError(std::string("missing or mistyped field: ") + e.what());
  }
}

} // namespace network
} // namespace cloudsim
