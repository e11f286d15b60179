#include "rpc/rpc_service.hpp"
#include "utils/digest.hpp"
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace cloudsim {
namespace rpc {

const char* rpc_error_to_string(RpcError error) {
  switch (error) {
    case RpcError::SUCCESS:      return "Success";
    case RpcError::SEND_FAILED:  return "Send failed";
    case RpcError::TIMEOUT:      return "Timeout";
    case RpcError::REMOTE_ERROR: return "Remote error";
    case RpcError::UNKNOWN_NODE: return "Unknown node";
    default:                     return "Unknown error";
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RpcService::RpcService(const std::string& node_id, network::Transport& transport)
  : node_id_(node_id)
  , transport_(transport) {
  transport_.register_handler(network::MessageType::RPC_REQUEST,
    [this](const network::WireMessage& message) { handle_request(message); });
  transport_.register_handler(network::MessageType::RPC_RESPONSE,
    [this](const network::WireMessage& message) { handle_response(message); });

  BOOST_LOG_TRIVIAL(debug) << "RPC: Service initialized for node " << node_id_;
}

RpcService::~RpcService() {
  transport_.unregister_handler(network::MessageType::RPC_REQUEST);
  transport_.unregister_handler(network::MessageType::RPC_RESPONSE);
}


//==============================================
// METHOD REGISTRATION
//==============================================

void RpcService::register_method(const std::string& name, RpcMethod method) {
  std::lock_guard<std::mutex> lock(methods_mutex_);
  if (methods_.count(name) > 0) {
    BOOST_LOG_TRIVIAL(warning) << "RPC: Replacing method " << name << " on node " << node_id_;
  }
  methods_[name] = std::move(method);
  BOOST_LOG_TRIVIAL(debug) << "RPC: Registered method " << name << " on node " << node_id_;
}

bool RpcService::has_method(const std::string& name) const {
  std::lock_guard<std::mutex> lock(methods_mutex_);
  return methods_.count(name) > 0;
}


//==============================================
// REMOTE CALLS
//==============================================

RpcResult RpcService::call(const network::NodeAddress& target, const std::string& method_name,
                           const nlohmann::json& params, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  const std::string call_id = generate_call_id(method_name);

  std::future<nlohmann::json> response;
  {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    PendingCall& pending = pending_calls_[call_id];
    pending.sent_at = Clock::now();
    response = pending.response.get_future();
  }

  nlohmann::json payload{
    {"call_id", call_id},
    {"method_name", method_name},
    {"params", params},
    {"source_port", transport_.get_address().port}
  };
  network::WireMessage request = transport_.create_message(
    network::MessageType::RPC_REQUEST, target.host, std::move(payload), true);

  BOOST_LOG_TRIVIAL(debug) << "RPC: Node " << node_id_ << " calling " << method_name
                           << " on " << target.to_string() << " (call " << call_id << ")";

  network::NetworkError sent = transport_.send(target, request, timeout);
  if (sent != network::NetworkError::SUCCESS) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    pending_calls_.erase(call_id);
    if (sent == network::NetworkError::TIMEOUT) {
      BOOST_LOG_TRIVIAL(warning) << "RPC: Call " << method_name << " to " << target.to_string()
                                 << " timed out before the request was delivered";
      return RpcResult::failure(RpcError::TIMEOUT, "RPC call to " + target.to_string() + " timed out");
    }
    BOOST_LOG_TRIVIAL(error) << "RPC: Failed to send " << method_name << " to " << target.to_string()
                             << ": " << network::network_error_to_string(sent);
    return RpcResult::failure(RpcError::SEND_FAILED, "Failed to send RPC request");
  }

  if (response.wait_until(deadline) != std::future_status::ready) {
    bool expired = false;
    {
      std::lock_guard<std::mutex> lock(calls_mutex_);
      expired = pending_calls_.erase(call_id) > 0;
    }

    // A response that raced the deadline has already been handed over
    if (expired) {
      BOOST_LOG_TRIVIAL(warning) << "RPC: Call " << method_name << " to " << target.to_string() << " timed out";
      return RpcResult::failure(RpcError::TIMEOUT, "RPC call to " + target.to_string() + " timed out");
    }
  }

  nlohmann::json reply = response.get();
  const nlohmann::json& error = reply["error"];
  if (!error.is_null()) {
    std::string message = error.is_string() ? error.get<std::string>() : error.dump();
    BOOST_LOG_TRIVIAL(warning) << "RPC: Remote error from " << method_name << " on " << target.to_string()
                               << ": " << message;
    return RpcResult::failure(RpcError::REMOTE_ERROR, message);
  }

  return RpcResult::ok(reply["result"]);
}

std::size_t RpcService::pending_call_count() const {
  std::lock_guard<std::mutex> lock(calls_mutex_);
  return pending_calls_.size();
}


//==============================================
// MESSAGE HANDLERS
//==============================================

void RpcService::handle_request(const network::WireMessage& message) {
  const nlohmann::json& payload = message.payload;
  std::string call_id = payload.value("call_id", std::string());
  std::string method_name = payload.value("method_name", std::string());

  if (call_id.empty() || !payload.contains("source_port") || !payload["source_port"].is_number_unsigned()) {
    BOOST_LOG_TRIVIAL(warning) << "RPC: Dropping malformed request from " << message.source_ip;
    return;
  }

  nlohmann::json params = payload.value("params", nlohmann::json::object());
  std::string error;
  nlohmann::json result = invoke(method_name, params, error);

  nlohmann::json response{
    {"call_id", call_id},
    {"result", error.empty() ? result : nlohmann::json(nullptr)},
    {"error", error.empty() ? nlohmann::json(nullptr) : nlohmann::json(error)}
  };

  network::NodeAddress reply_to{message.source_ip, payload["source_port"].get<uint16_t>()};
  network::WireMessage reply = transport_.create_message(
    network::MessageType::RPC_RESPONSE, reply_to.host, std::move(response));

  if (transport_.send(reply_to, reply) != network::NetworkError::SUCCESS) {
    BOOST_LOG_TRIVIAL(error) << "RPC: Node " << node_id_ << " failed to send response for "
                             << method_name << " to " << reply_to.to_string();
  }
}

void RpcService::handle_response(const network::WireMessage& message) {
  std::string call_id = message.payload.value("call_id", std::string());

  std::promise<nlohmann::json> response;
  {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto it = pending_calls_.find(call_id);
    if (it == pending_calls_.end()) {
      BOOST_LOG_TRIVIAL(debug) << "RPC: Dropping response for unknown or expired call " << call_id;
      return;
    }
    response = std::move(it->second.response);
    pending_calls_.erase(it);
  }

  response.set_value(nlohmann::json{
    {"result", message.payload.value("result", nlohmann::json(nullptr))},
    {"error", message.payload.value("error", nlohmann::json(nullptr))}
  });
}

nlohmann::json RpcService::invoke(const std::string& method_name, const nlohmann::json& params,
                                  std::string& error) const {
  RpcMethod method;
  {
    std::lock_guard<std::mutex> lock(methods_mutex_);
    auto it = methods_.find(method_name);
    if (it != methods_.end()) {
      method = it->second;
    }
  }

  if (!method) {
    BOOST_LOG_TRIVIAL(warning) << "RPC: Method " << method_name << " not found on node " << node_id_;
    error = "Method " + method_name + " not found";
    return nullptr;
  }

  try {
    return method(params);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "RPC: Method " << method_name << " failed on node " << node_id_
                             << ": " << e.what();
    error = e.what();
    if (error.empty()) {
      error = "Method " + method_name + " failed";
    }
    return nullptr;
  }
}

std::string RpcService::generate_call_id(const std::string& method_name) const {
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_real_distribution<double> dis(0.0, 1.0);

  std::stringstream seed;
  seed << node_id_ << "-" << method_name << "-" << std::fixed << std::setprecision(6)
       << network::unix_time_now() << "-" << std::setprecision(17) << dis(gen);
  return utils::md5_hex(seed.str());
}

} // namespace rpc
} // namespace cloudsim
