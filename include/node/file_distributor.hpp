#ifndef CLOUDSIM_NODE_FILE_DISTRIBUTOR_HPP
#define CLOUDSIM_NODE_FILE_DISTRIBUTOR_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "network/cluster_directory.hpp"
#include "rpc/rpc_service.hpp"
#include "store/block_store.hpp"

namespace cloudsim {
namespace node {

struct DistributorConfig {
  std::size_t chunk_size{1024 * 1024};
  std::chrono::milliseconds rpc_timeout{30000};
};

// Where every chunk of a distributed file lives. Written once by the initiator.
struct ChunkPlacementMap {
  std::string file_id;
  std::string filename;
  uint64_t file_size{0};
  std::vector<std::string> chunk_ids;
  std::vector<std::string> chunk_checksums;
  std::map<std::string, std::string> placement;
  double created_at{0.0};

  nlohmann::json to_json() const;
  // Throws nlohmann::json::exception on a malformed document
  static ChunkPlacementMap from_json(const nlohmann::json& document);
};

struct DistributionResult {
  bool success{false};
  std::string error;
  std::string file_id;
  std::string filename;
  uint64_t file_size{0};
  std::size_t chunk_count{0};
  std::size_t chunks_distributed{0};
  uint64_t bytes_distributed{0};
  // Informational only, each chunk is stored on exactly one node
  std::size_t replication_factor{0};
  std::map<std::string, std::string> placement;

  nlohmann::json to_json() const;
};

struct RetrievalResult {
  bool success{false};
  std::string error;
  std::vector<uint8_t> data;
  std::size_t chunks_retrieved{0};
};

// Splits content into chunks and places them round-robin on the other nodes
class FileDistributor {
public:
  FileDistributor(const FileDistributor&) = delete;
  FileDistributor& operator=(const FileDistributor&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileDistributor(const std::string& node_id, network::ClusterDirectory& directory,
                  rpc::RpcService& rpc, store::BlockStore& store,
                  const DistributorConfig& config = DistributorConfig());
  ~FileDistributor() = default;


  // ---- DISTRIBUTION ----
  DistributionResult distribute_file(const std::string& path, std::size_t replication_factor = 2);
  DistributionResult distribute_data(const std::string& filename, const std::vector<uint8_t>& content,
                                     std::size_t replication_factor = 2);


  // ---- RETRIEVAL ----
  // Reads the placement map persisted by an earlier distribution from this node
  std::optional<ChunkPlacementMap> load_placement(const std::string& file_id) const;
  // Fetches every chunk from its node, verifies it and reassembles the content
  RetrievalResult retrieve_file(const std::string& file_id);


  // ---- UTILITY METHODS ----
  static std::string chunk_id(const std::string& file_id, std::size_t index);
  static std::string placement_file_id(const std::string& file_id);

private:
  // ---- PARAMETERS ----
  const std::string node_id_;
  network::ClusterDirectory& directory_;
  rpc::RpcService& rpc_;
  store::BlockStore& store_;
  const DistributorConfig config_;

  std::vector<std::string> candidate_nodes() const;
  bool store_chunk(const std::string& target, const std::string& chunk_id,
                   const uint8_t* data, std::size_t size, const std::string& checksum);
  bool save_placement(const ChunkPlacementMap& map);
};

} // namespace node
} // namespace cloudsim

#endif // CLOUDSIM_NODE_FILE_DISTRIBUTOR_HPP
