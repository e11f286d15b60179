#ifndef CLOUDSIM_NETWORK_MESSAGE_HPP
#define CLOUDSIM_NETWORK_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cloudsim {
namespace network {

// Message type used to route inbound messages
enum class MessageType : uint8_t {
    HEARTBEAT = 0,
    HEARTBEAT_ACK = 1,
    DATA_TRANSFER = 2,
    DATA_ACK = 3,
    RPC_REQUEST = 4,
    RPC_RESPONSE = 5,
    DISCOVERY = 6,
    DISCOVERY_ACK = 7
};

// Wire name of a message type
const char* to_string(MessageType type);
// Parses a wire name, empty if the name is unknown
std::optional<MessageType> message_type_from_string(const std::string& name);


// Network location of a node
struct NodeAddress {
    std::string host;
    uint16_t port{0};

    std::string to_string() const { return host + ":" + std::to_string(port); }

    bool operator==(const NodeAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const NodeAddress& other) const { return !(*this == other); }
    bool operator<(const NodeAddress& other) const {
        return host < other.host || (host == other.host && port < other.port);
    }
};


// Unit of exchange between two transports. Immutable once sent.
struct WireMessage {
    std::string message_id;
    MessageType message_type{MessageType::HEARTBEAT};
    std::string source_ip;
    std::string target_ip;
    nlohmann::json payload = nlohmann::json::object();
    double timestamp{0.0};
    bool requires_ack{false};
};


// ---- UTILITY METHODS ----
// Seconds since the Unix epoch with sub-second precision
double unix_time_now();
// Builds a globally unique id from the sender id, the current time and a random value
std::string generate_message_id(const std::string& sender_id);

} // namespace network
} // namespace cloudsim

#endif // CLOUDSIM_NETWORK_MESSAGE_HPP
