#ifndef CLOUDSIM_NODE_VIRTUAL_NODE_HPP
#define CLOUDSIM_NODE_VIRTUAL_NODE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "network/cluster_directory.hpp"
#include "node/file_distributor.hpp"
#include "rpc/rpc_service.hpp"
#include "store/block_store.hpp"

namespace cloudsim {
namespace node {

struct NodeConfig {
  store::BlockStoreConfig store;
  DistributorConfig distributor;
  std::chrono::milliseconds call_timeout{rpc::RpcService::DEFAULT_CALL_TIMEOUT};
};

// One simulated storage node: a transport registered in the directory, a block
// store and the RPC methods other nodes use to place and fetch chunks.
// The directory must outlive the node.
class VirtualNode {
public:
  VirtualNode(const VirtualNode&) = delete;
  VirtualNode& operator=(const VirtualNode&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws network::ConfigurationError if the node cannot join the directory
  // and store::StoreError if its disk cannot be opened
  VirtualNode(const std::string& node_id, uint16_t port, network::ClusterDirectory& directory,
              const NodeConfig& config = NodeConfig());
  ~VirtualNode();


  // ---- CLUSTER OPERATIONS ----
  std::vector<std::string> discover();
  rpc::RpcResult call(const std::string& target_node_id, const std::string& method_name,
                      const nlohmann::json& params = nlohmann::json::object());
  DistributionResult distribute_file(const std::string& path, std::size_t replication_factor = 2);
  DistributionResult distribute_data(const std::string& filename, const std::vector<uint8_t>& content,
                                     std::size_t replication_factor = 2);
  RetrievalResult retrieve_file(const std::string& file_id);
  nlohmann::json get_stats() const;
  // Leaves the directory and stops the transport; later calls are no-ops
  void shutdown();


  // ---- GETTERS ----
  const std::string& get_node_id() const { return node_id_; }
  const network::NodeAddress& get_address() const { return address_; }
  bool is_running() const { return !shut_down_; }
  double uptime() const;
  store::BlockStore& get_store() { return *store_; }
  rpc::RpcService& get_rpc() { return *rpc_; }

private:
  // ---- PARAMETERS ----
  const std::string node_id_;
  const NodeConfig config_;
  network::ClusterDirectory& directory_;
  network::NodeAddress address_;
  std::shared_ptr<network::Transport> transport_;
  const std::chrono::steady_clock::time_point started_at_;
  std::atomic<bool> shut_down_{false};

  // Components
  std::unique_ptr<store::BlockStore> store_;
  std::unique_ptr<rpc::RpcService> rpc_;
  std::unique_ptr<FileDistributor> distributor_;

  // Performance counters
  std::atomic<uint64_t> chunks_uploaded_{0};
  std::atomic<uint64_t> chunks_downloaded_{0};
  std::atomic<uint64_t> chunks_stored_{0};
  std::atomic<uint64_t> chunks_served_{0};
  std::atomic<uint64_t> bytes_transferred_{0};


  // ---- RPC METHODS ----
  void register_methods();
  nlohmann::json ping(const nlohmann::json& params);
  nlohmann::json store_file_chunk(const nlohmann::json& params);
  nlohmann::json retrieve_file_chunk(const nlohmann::json& params);
};

} // namespace node
} // namespace cloudsim

#endif // CLOUDSIM_NODE_VIRTUAL_NODE_HPP
