#include "network/cluster_directory.hpp"
#include <boost/log/trivial.hpp>

namespace cloudsim {
namespace network {

nlohmann::json NetworkInfo::to_json() const {
  nlohmann::json addresses = nlohmann::json::object();
  for (const auto& [node_id, address] : node_addresses) {
    addresses[node_id] = address.to_string();
  }

  nlohmann::json status = nlohmann::json::object();
  for (const auto& [node_id, active] : node_status) {
    status[node_id] = active ? "active" : "inactive";
  }

  return nlohmann::json{
    {"total_nodes", total_nodes},
    {"active_nodes", active_nodes},
    {"node_addresses", addresses},
    {"node_status", status}
  };
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ClusterDirectory::ClusterDirectory(const TransportConfig& transport_config, const std::string& host)
  : transport_config_(transport_config)
  , registry_(host) {
  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Initialized on host " << host;
}

ClusterDirectory::~ClusterDirectory() {
  stop();
}


//==============================================
// NODE MANAGEMENT
//==============================================

NodeAddress ClusterDirectory::add_node(const std::string& node_id, uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (nodes_.count(node_id) > 0) {
    BOOST_LOG_TRIVIAL(error) << "Cluster directory: Node " << node_id << " already exists";
    throw ConfigurationError("node " + node_id + " already exists");
  }

  auto address = registry_.allocate(node_id, port);
  if (!address) {
    throw ConfigurationError("port " + std::to_string(port) + " is already allocated");
  }

  auto transport = std::make_shared<Transport>(node_id, *address, transport_config_);
  register_default_handlers(node_id, *transport);

  if (!transport->start_listener()) {
    registry_.release(node_id);
    throw ConfigurationError("cannot listen on " + address->to_string() + " for node " + node_id);
  }

  nodes_[node_id] = transport;
  node_status_[node_id] = true;

  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Added node " << node_id << " at " << address->to_string();
  return *address;
}

bool ClusterDirectory::remove_node(const std::string& node_id) {
  std::shared_ptr<Transport> transport;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
      BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Cannot remove unknown node " << node_id;
      return false;
    }
    transport = it->second;
    nodes_.erase(it);
    node_status_.erase(node_id);
  }

  // Handlers of this transport may call back into the directory, so shut down unlocked
  transport->shutdown();
  registry_.release(node_id);

  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Removed node " << node_id;
  return true;
}


//==============================================
// DISCOVERY AND LIVENESS
//==============================================

std::vector<std::string> ClusterDirectory::discover(const std::string& node_id) {
  std::vector<std::string> discovered;

  auto transport = get_transport(node_id);
  if (!transport) {
    BOOST_LOG_TRIVIAL(error) << "Cluster directory: Discovery from unknown node " << node_id;
    return discovered;
  }

  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Node " << node_id << " starting discovery";

  for (const auto& [peer_id, address] : peers_of(node_id)) {
    WireMessage message = transport->create_message(
      MessageType::DISCOVERY, address.host,
      {{"node_id", node_id}, {"port", transport->get_address().port}}
    );

    if (transport->send(address, message) == NetworkError::SUCCESS) {
      set_status(peer_id, true);
      discovered.push_back(peer_id);
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Node " << node_id << " could not reach " << peer_id;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Node " << node_id << " discovered "
                          << discovered.size() << " nodes";
  return discovered;
}

std::size_t ClusterDirectory::heartbeat(const std::string& node_id) {
  auto transport = get_transport(node_id);
  if (!transport) {
    BOOST_LOG_TRIVIAL(error) << "Cluster directory: Heartbeat from unknown node " << node_id;
    return 0;
  }

  std::size_t delivered = 0;
  for (const auto& [peer_id, address] : peers_of(node_id)) {
    WireMessage message = transport->create_message(
      MessageType::HEARTBEAT, address.host,
      {{"node_id", node_id}, {"timestamp", unix_time_now()}}
    );

    if (transport->send(address, message) == NetworkError::SUCCESS) {
      ++delivered;
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Heartbeat from " << node_id
                                 << " to " << peer_id << " failed, marking inactive";
      set_status(peer_id, false);
    }
  }
  return delivered;
}

void ClusterDirectory::start_heartbeat_loop() {
  std::lock_guard<std::mutex> lock(heartbeat_mutex_);
  if (heartbeat_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Heartbeat loop already running";
    return;
  }
  heartbeat_running_ = true;
  heartbeat_thread_ = std::make_unique<std::thread>(&ClusterDirectory::heartbeat_loop, this);
  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Heartbeat loop started, interval "
                          << heartbeat_interval_.count() << " ms";
}

void ClusterDirectory::stop_heartbeat_loop() {
  {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    if (!heartbeat_running_) {
      return;
    }
    heartbeat_running_ = false;
  }
  heartbeat_cv_.notify_all();

  if (heartbeat_thread_ && heartbeat_thread_->joinable()) {
    heartbeat_thread_->join();
  }
  heartbeat_thread_.reset();
  BOOST_LOG_TRIVIAL(info) << "Cluster directory: Heartbeat loop stopped";
}

void ClusterDirectory::set_heartbeat_interval(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(heartbeat_mutex_);
  heartbeat_interval_ = interval;
}

void ClusterDirectory::heartbeat_loop() {
  std::unique_lock<std::mutex> lock(heartbeat_mutex_);
  while (heartbeat_running_) {
    heartbeat_cv_.wait_for(lock, heartbeat_interval_, [this]() { return !heartbeat_running_; });
    if (!heartbeat_running_) {
      break;
    }

    lock.unlock();
    for (const auto& node_id : node_ids()) {
      heartbeat(node_id);
    }
    lock.lock();
  }
}

void ClusterDirectory::stop() {
  stop_heartbeat_loop();

  std::map<std::string, std::shared_ptr<Transport>> nodes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes.swap(nodes_);
    node_status_.clear();
  }

  for (auto& [node_id, transport] : nodes) {
    transport->shutdown();
    registry_.release(node_id);
  }

  if (!nodes.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Cluster directory: Stopped " << nodes.size() << " nodes";
  }
}


//==============================================
// DEFAULT HANDLERS
//==============================================

void ClusterDirectory::register_default_handlers(const std::string& node_id, Transport& transport) {
  transport.register_handler(MessageType::DISCOVERY,
    [this, node_id](const WireMessage& message) { handle_discovery(node_id, message); });

  transport.register_handler(MessageType::DISCOVERY_ACK,
    [this, node_id](const WireMessage& message) { handle_discovery_ack(node_id, message); });

  transport.register_handler(MessageType::HEARTBEAT_ACK,
    [node_id](const WireMessage& message) {
      BOOST_LOG_TRIVIAL(trace) << "Cluster directory: Node " << node_id << " got heartbeat ack from "
                               << message.payload.value("node_id", std::string("unknown"));
    });
}

void ClusterDirectory::handle_discovery(const std::string& node_id, const WireMessage& message) {
  auto transport = get_transport(node_id);
  if (!transport) {
    return;
  }

  if (!message.payload.contains("port") || !message.payload["port"].is_number_unsigned()) {
    BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Discovery without reply port from " << message.source_ip;
    return;
  }

  NodeAddress reply_to{message.source_ip, message.payload["port"].get<uint16_t>()};
  WireMessage reply = transport->create_message(
    MessageType::DISCOVERY_ACK, reply_to.host,
    {{"node_id", node_id}, {"status", "active"}, {"port", transport->get_address().port}}
  );

  if (transport->send(reply_to, reply) != NetworkError::SUCCESS) {
    BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Node " << node_id
                               << " failed to answer discovery from " << reply_to.to_string();
  }
}

void ClusterDirectory::handle_discovery_ack(const std::string& node_id, const WireMessage& message) {
  std::string announcer = message.payload.value("node_id", std::string());
  if (announcer.empty() || !has_node(announcer)) {
    BOOST_LOG_TRIVIAL(warning) << "Cluster directory: Discovery ack from unknown node on " << node_id;
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Cluster directory: Node " << node_id << " learned that " << announcer << " is active";
  set_status(announcer, true);
}


//==============================================
// QUERY OPERATIONS
//==============================================

NetworkInfo ClusterDirectory::get_info() const {
  NetworkInfo info;
  info.node_addresses = registry_.snapshot();

  std::lock_guard<std::mutex> lock(mutex_);
  info.total_nodes = nodes_.size();
  info.node_status = node_status_;
  for (const auto& [node_id, active] : node_status_) {
    if (active) {
      ++info.active_nodes;
    }
  }
  return info;
}

std::vector<std::string> ClusterDirectory::node_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(nodes_.size());
  for (const auto& entry : nodes_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::optional<NodeAddress> ClusterDirectory::get_address(const std::string& node_id) const {
  return registry_.get_address(node_id);
}

std::shared_ptr<Transport> ClusterDirectory::get_transport(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ClusterDirectory::has_node(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.count(node_id) > 0;
}

bool ClusterDirectory::is_active(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = node_status_.find(node_id);
  return it != node_status_.end() && it->second;
}

std::size_t ClusterDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.size();
}


//==============================================
// UTILITY METHODS
//==============================================

void ClusterDirectory::set_status(const std::string& node_id, bool active) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = node_status_.find(node_id);
  if (it != node_status_.end()) {
    it->second = active;
  }
}

std::vector<std::pair<std::string, NodeAddress>> ClusterDirectory::peers_of(const std::string& node_id) const {
  std::vector<std::pair<std::string, NodeAddress>> peers;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : nodes_) {
    if (entry.first == node_id) {
      continue;
    }
    peers.emplace_back(entry.first, entry.second->get_address());
  }
  return peers;
}

} // namespace network
} // namespace cloudsim
