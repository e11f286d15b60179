#ifndef CLOUDSIM_NETWORK_CODEC_HPP
#define CLOUDSIM_NETWORK_CODEC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/message.hpp"
#include "network/network_error.hpp"

namespace cloudsim {
namespace network {

// Frame layout: 4-byte big-endian body length, then the JSON encoded WireMessage
class Codec {
public:
  static constexpr std::size_t HEADER_SIZE = sizeof(uint32_t);
  static constexpr std::size_t DEFAULT_MAX_FRAME_SIZE = 64 * 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Returns the complete frame (header and body) for a message
  std::string encode(const WireMessage& message) const;
  // Validates a received header and returns the body length it announces
  std::size_t decode_header(const std::array<uint8_t, HEADER_SIZE>& header) const;
  // Parses a frame body into a message
  WireMessage decode_body(const std::string& body) const;

  std::size_t get_max_frame_size() const { return max_frame_size_; }

private:
  // ---- PARAMETERS ----
  std::size_t max_frame_size_;


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }


  // ---- JSON MAPPING ----
  static nlohmann::json to_json(const WireMessage& message);
  static WireMessage from_json(const nlohmann::json& document);
};

} // namespace network
} // namespace cloudsim

#endif // CLOUDSIM_NETWORK_CODEC_HPP
