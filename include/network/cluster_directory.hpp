#ifndef CLOUDSIM_NETWORK_CLUSTER_DIRECTORY_HPP
#define CLOUDSIM_NETWORK_CLUSTER_DIRECTORY_HPP

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "network/address_registry.hpp"
#include "network/transport.hpp"

namespace cloudsim {
namespace network {

// Monitoring view of the cluster
struct NetworkInfo {
  std::size_t total_nodes{0};
  std::size_t active_nodes{0};
  std::map<std::string, NodeAddress> node_addresses;
  std::map<std::string, bool> node_status;

  nlohmann::json to_json() const;
};

// Owns one Transport per simulated node, all sharing a single address registry.
// Provides discovery and heartbeat based liveness tracking.
class ClusterDirectory {
public:
  ClusterDirectory(const ClusterDirectory&) = delete;
  ClusterDirectory& operator=(const ClusterDirectory&) = delete;

  static constexpr std::chrono::milliseconds DEFAULT_HEARTBEAT_INTERVAL{10000};


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ClusterDirectory(const TransportConfig& transport_config = TransportConfig(),
                            const std::string& host = "127.0.0.1");
  ~ClusterDirectory();


  // ---- NODE MANAGEMENT ----
  // Allocates an address, starts a listening transport and marks the node active.
  // Throws ConfigurationError on a duplicate id, a taken address or a bind failure.
  NodeAddress add_node(const std::string& node_id, uint16_t port);
  // Stops the node's transport and releases its address
  bool remove_node(const std::string& node_id);


  // ---- DISCOVERY AND LIVENESS ----
  // Sends a discovery message to every other node, returns the nodes reached
  std::vector<std::string> discover(const std::string& node_id);
  // Sends a heartbeat to every other node, returns the number of successful sends
  std::size_t heartbeat(const std::string& node_id);
  void start_heartbeat_loop();
  void stop_heartbeat_loop();
  void set_heartbeat_interval(std::chrono::milliseconds interval);
  // Stops the heartbeat loop and every owned transport
  void stop();


  // ---- QUERY OPERATIONS ----
  NetworkInfo get_info() const;
  std::vector<std::string> node_ids() const;
  std::optional<NodeAddress> get_address(const std::string& node_id) const;
  std::shared_ptr<Transport> get_transport(const std::string& node_id) const;
  bool has_node(const std::string& node_id) const;
  bool is_active(const std::string& node_id) const;
  std::size_t size() const;
  const AddressRegistry& get_registry() const { return registry_; }

private:
  // ---- PARAMETERS ----
  const TransportConfig transport_config_;
  AddressRegistry registry_;

  // Node transports, local status table and access mutex
  std::map<std::string, std::shared_ptr<Transport>> nodes_;
  std::map<std::string, bool> node_status_;
  mutable std::mutex mutex_;

  // Heartbeat loop state
  std::unique_ptr<std::thread> heartbeat_thread_;
  std::chrono::milliseconds heartbeat_interval_{DEFAULT_HEARTBEAT_INTERVAL};
  bool heartbeat_running_{false};
  std::mutex heartbeat_mutex_;
  std::condition_variable heartbeat_cv_;


  // ---- DEFAULT HANDLERS ----
  void register_default_handlers(const std::string& node_id, Transport& transport);
  void handle_discovery(const std::string& node_id, const WireMessage& message);
  void handle_discovery_ack(const std::string& node_id, const WireMessage& message);


  // ---- UTILITY METHODS ----
  void set_status(const std::string& node_id, bool active);
  // Snapshot of every node other than node_id with its address
  std::vector<std::pair<std::string, NodeAddress>> peers_of(const std::string& node_id) const;
  void heartbeat_loop();
};

} // namespace network
} // namespace cloudsim

#endif // CLOUDSIM_NETWORK_CLUSTER_DIRECTORY_HPP
