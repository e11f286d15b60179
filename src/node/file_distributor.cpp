#include "node/file_distributor.hpp"
#include "utils/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

namespace cloudsim {
namespace node {

//==============================================
// PLACEMENT MAP
//==============================================

nlohmann::json ChunkPlacementMap::to_json() const {
  return nlohmann::json{
    {"file_id", file_id},
    {"filename", filename},
    {"file_size", file_size},
    {"chunk_ids", chunk_ids},
    {"chunk_checksums", chunk_checksums},
    {"placement", placement},
    {"created_at", created_at}
  };
}

ChunkPlacementMap ChunkPlacementMap::from_json(const nlohmann::json& document) {
  ChunkPlacementMap map;
  map.file_id = document.at("file_id").get<std::string>();
  map.filename = document.at("filename").get<std::string>();
  map.file_size = document.at("file_size").get<uint64_t>();
  map.chunk_ids = document.at("chunk_ids").get<std::vector<std::string>>();
  map.chunk_checksums = document.at("chunk_checksums").get<std::vector<std::string>>();
  map.placement = document.at("placement").get<std::map<std::string, std::string>>();
  map.created_at = document.value("created_at", 0.0);
  return map;
}

nlohmann::json DistributionResult::to_json() const {
  return nlohmann::json{
    {"success", success},
    {"error", error.empty() ? nlohmann::json(nullptr) : nlohmann::json(error)},
    {"file_id", file_id},
    {"filename", filename},
    {"file_size", file_size},
    {"chunk_count", chunk_count},
    {"chunks_distributed", chunks_distributed},
    {"replication_factor", replication_factor},
    {"placement", placement}
  };
}


//==============================================
// CONSTRUCTOR
//==============================================

FileDistributor::FileDistributor(const std::string& node_id, network::ClusterDirectory& directory,
                                 rpc::RpcService& rpc, store::BlockStore& store,
                                 const DistributorConfig& config)
  : node_id_(node_id)
  , directory_(directory)
  , rpc_(rpc)
  , store_(store)
  , config_(config) {
}


//==============================================
// DISTRIBUTION
//==============================================

DistributionResult FileDistributor::distribute_file(const std::string& path, std::size_t replication_factor) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Distributor: Cannot open file " << path;
    DistributionResult result;
    result.filename = path;
    result.error = "Cannot read file " + path;
    return result;
  }

  std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  std::string filename = std::filesystem::path(path).filename().string();
  return distribute_data(filename, content, replication_factor);
}

DistributionResult FileDistributor::distribute_data(const std::string& filename, const std::vector<uint8_t>& content,
                                                    std::size_t replication_factor) {
  DistributionResult result;
  result.filename = filename;
  result.file_size = content.size();
  result.file_id = utils::md5_hex(content);

  std::vector<std::string> candidates = candidate_nodes();
  if (candidates.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Distributor: No other nodes available to distribute " << filename;
    result.error = "No other nodes available for distribution";
    return result;
  }

  result.replication_factor = std::min(replication_factor, candidates.size());
  result.chunk_count = (content.size() + config_.chunk_size - 1) / config_.chunk_size;

  BOOST_LOG_TRIVIAL(info) << "Distributor: Node " << node_id_ << " distributing " << filename << " ("
                          << content.size() << " bytes, " << result.chunk_count << " chunks) over "
                          << candidates.size() << " nodes";

  ChunkPlacementMap map;
  map.file_id = result.file_id;
  map.filename = filename;
  map.file_size = content.size();
  map.created_at = network::unix_time_now();

  for (std::size_t index = 0; index < result.chunk_count; ++index) {
    std::size_t offset = index * config_.chunk_size;
    std::size_t size = std::min(config_.chunk_size, content.size() - offset);
    const uint8_t* data = content.data() + offset;

    std::string id = chunk_id(result.file_id, index);
    std::string checksum = utils::md5_hex(data, size);
    const std::string& target = candidates[index % candidates.size()];

    map.chunk_ids.push_back(id);
    map.chunk_checksums.push_back(checksum);

    if (!store_chunk(target, id, data, size, checksum)) {
      continue;
    }

    map.placement[id] = target;
    ++result.chunks_distributed;
    result.bytes_distributed += size;
    BOOST_LOG_TRIVIAL(info) << "Distributor: Placed chunk " << index << " of " << filename << " on " << target;
  }

  result.placement = map.placement;
  if (!save_placement(map)) {
    BOOST_LOG_TRIVIAL(warning) << "Distributor: Placement map of " << filename << " was not persisted";
  }

  // A partial placement still succeeds, chunks_distributed tells how much landed
  result.success = true;
  if (result.chunks_distributed < result.chunk_count) {
    BOOST_LOG_TRIVIAL(warning) << "Distributor: Partial distribution of " << filename << ": placed "
                               << result.chunks_distributed << " of " << result.chunk_count << " chunks";
  }
  return result;
}

bool FileDistributor::store_chunk(const std::string& target, const std::string& chunk_id,
                                  const uint8_t* data, std::size_t size, const std::string& checksum) {
  auto address = directory_.get_address(target);
  if (!address) {
    BOOST_LOG_TRIVIAL(error) << "Distributor: Node " << target << " left before chunk " << chunk_id << " was sent";
    return false;
  }

  nlohmann::json params{
    {"file_id", chunk_id},
    {"chunk_data", utils::to_hex(data, size)},
    {"chunk_hash", checksum}
  };

  rpc::RpcResult reply = rpc_.call(*address, "store_file_chunk", params, config_.rpc_timeout);
  if (!reply.success) {
    BOOST_LOG_TRIVIAL(error) << "Distributor: Failed to store chunk " << chunk_id << " on " << target
                             << ": " << reply.error;
    return false;
  }

  if (!reply.result.is_object() || !reply.result.value("success", false)) {
    std::string error = reply.result.is_object() ? reply.result.value("error", std::string("unknown error"))
                                                 : std::string("malformed reply");
    BOOST_LOG_TRIVIAL(error) << "Distributor: Node " << target << " rejected chunk " << chunk_id << ": " << error;
    return false;
  }
  return true;
}


//==============================================
// RETRIEVAL
//==============================================

std::optional<ChunkPlacementMap> FileDistributor::load_placement(const std::string& file_id) const {
  std::string id = placement_file_id(file_id);
  auto file = store_.get_file(id);
  if (!file) {
    return std::nullopt;
  }

  auto bytes = store_.read(id, file->size);
  if (!bytes) {
    return std::nullopt;
  }

  try {
    return ChunkPlacementMap::from_json(nlohmann::json::parse(bytes->begin(), bytes->end()));
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Distributor: Corrupt placement map for " << file_id << ": " << e.what();
    return std::nullopt;
  }
}

RetrievalResult FileDistributor::retrieve_file(const std::string& file_id) {
  RetrievalResult result;

  auto map = load_placement(file_id);
  if (!map) {
    result.error = "No placement map for file " + file_id;
    BOOST_LOG_TRIVIAL(error) << "Distributor: " << result.error;
    return result;
  }

  result.data.reserve(map->file_size);
  for (std::size_t index = 0; index < map->chunk_ids.size(); ++index) {
    const std::string& id = map->chunk_ids[index];

    auto placed = map->placement.find(id);
    if (placed == map->placement.end()) {
      result.error = "Chunk " + id + " was never placed";
      BOOST_LOG_TRIVIAL(error) << "Distributor: " << result.error;
      return result;
    }

    auto address = directory_.get_address(placed->second);
    if (!address) {
      result.error = "Node " + placed->second + " holding chunk " + id + " is gone";
      BOOST_LOG_TRIVIAL(error) << "Distributor: " << result.error;
      return result;
    }

    rpc::RpcResult reply = rpc_.call(*address, "retrieve_file_chunk",
                                      nlohmann::json{{"file_id", id}}, config_.rpc_timeout);
    if (!reply.success || !reply.result.is_object() || !reply.result.value("success", false)) {
      result.error = "Failed to retrieve chunk " + id + " from " + placed->second;
      BOOST_LOG_TRIVIAL(error) << "Distributor: " << result.error;
      return result;
    }

    auto chunk = utils::from_hex(reply.result.value("chunk_data", std::string()));
    if (!chunk || utils::md5_hex(*chunk) != map->chunk_checksums[index]) {
      result.error = "Checksum mismatch for chunk " + id;
      BOOST_LOG_TRIVIAL(error) << "Distributor: " << result.error;
      return result;
    }

    result.data.insert(result.data.end(), chunk->begin(), chunk->end());
    ++result.chunks_retrieved;
  }

  if (result.data.size() != map->file_size) {
    result.error = "Reassembled " + std::to_string(result.data.size()) + " of " +
                   std::to_string(map->file_size) + " bytes";
    BOOST_LOG_TRIVIAL(error) << "Distributor: " << result.error;
    return result;
  }

  result.success = true;
  BOOST_LOG_TRIVIAL(info) << "Distributor: Node " << node_id_ << " reassembled " << map->filename
                          << " from " << result.chunks_retrieved << " chunks";
  return result;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string FileDistributor::chunk_id(const std::string& file_id, std::size_t index) {
  return file_id + "_chunk_" + std::to_string(index);
}

std::string FileDistributor::placement_file_id(const std::string& file_id) {
  return file_id + "_metadata";
}

std::vector<std::string> FileDistributor::candidate_nodes() const {
  std::vector<std::string> candidates = directory_.node_ids();
  candidates.erase(std::remove(candidates.begin(), candidates.end(), node_id_), candidates.end());
  return candidates;
}

bool FileDistributor::save_placement(const ChunkPlacementMap& map) {
  std::string id = placement_file_id(map.file_id);
  std::string document = map.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::vector<uint8_t> bytes(document.begin(), document.end());

  return store_.put_file(id, map.filename + ".metadata", bytes) == store::BlockStore::PutStatus::STORED;
}

} // namespace node
} // namespace cloudsim
