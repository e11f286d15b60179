#ifndef CLOUDSIM_RPC_RPC_SERVICE_HPP
#define CLOUDSIM_RPC_RPC_SERVICE_HPP

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "network/transport.hpp"

namespace cloudsim {
namespace rpc {

enum class RpcError {
  SUCCESS,
  SEND_FAILED,
  TIMEOUT,
  REMOTE_ERROR,
  UNKNOWN_NODE
};

const char* rpc_error_to_string(RpcError error);

struct RpcResult {
  bool success{false};
  RpcError code{RpcError::SUCCESS};
  nlohmann::json result;
  std::string error;

  static RpcResult ok(nlohmann::json value) {
    return RpcResult{true, RpcError::SUCCESS, std::move(value), ""};
  }
  static RpcResult failure(RpcError code, const std::string& message) {
    return RpcResult{false, code, nullptr, message};
  }
};

// A locally exposed method. Throwing reports the exception text to the caller.
using RpcMethod = std::function<nlohmann::json(const nlohmann::json& params)>;

// Blocking request/response calls on top of a node's transport, correlated by call id
class RpcService {
public:
  RpcService(const RpcService&) = delete;
  RpcService& operator=(const RpcService&) = delete;

  static constexpr std::chrono::milliseconds DEFAULT_CALL_TIMEOUT{30000};


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Installs the rpc_request and rpc_response handlers on the transport
  RpcService(const std::string& node_id, network::Transport& transport);
  ~RpcService();


  // ---- METHOD REGISTRATION ----
  void register_method(const std::string& name, RpcMethod method);
  bool has_method(const std::string& name) const;


  // ---- REMOTE CALLS ----
  RpcResult call(const network::NodeAddress& target, const std::string& method_name,
                 const nlohmann::json& params = nlohmann::json::object(),
                 std::chrono::milliseconds timeout = DEFAULT_CALL_TIMEOUT);

  std::size_t pending_call_count() const;

private:
  using Clock = std::chrono::steady_clock;

  struct PendingCall {
    std::promise<nlohmann::json> response;
    Clock::time_point sent_at;
  };

  // ---- PARAMETERS ----
  const std::string node_id_;
  network::Transport& transport_;

  std::map<std::string, RpcMethod> methods_;
  mutable std::mutex methods_mutex_;

  std::map<std::string, PendingCall> pending_calls_;
  mutable std::mutex calls_mutex_;


  // ---- MESSAGE HANDLERS ----
  void handle_request(const network::WireMessage& message);
  void handle_response(const network::WireMessage& message);
  nlohmann::json invoke(const std::string& method_name, const nlohmann::json& params,
                        std::string& error) const;

  std::string generate_call_id(const std::string& method_name) const;
};

} // namespace rpc
} // namespace cloudsim

#endif // CLOUDSIM_RPC_RPC_SERVICE_HPP
