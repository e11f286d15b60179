#ifndef CLOUDSIM_NETWORK_ERROR_HPP
#define CLOUDSIM_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cloudsim {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    CONNECTION_FAILED,
    CONNECTION_LOST,
    INVALID_MESSAGE,
    TIMEOUT,
    NOT_RUNNING,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CONNECTION_FAILED: return "Connection failed";
        case NetworkError::CONNECTION_LOST: return "Connection lost";
        case NetworkError::INVALID_MESSAGE: return "Invalid message";
        case NetworkError::TIMEOUT: return "Timeout";
        case NetworkError::NOT_RUNNING: return "Transport not running";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

// Raised at node startup when the node cannot take its place in the cluster
// (address in use, duplicate node id). Never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message)
        : std::runtime_error("Codec error: " + message) {}
};

} // namespace network
} // namespace cloudsim

#endif // CLOUDSIM_NETWORK_ERROR_HPP
