#include "node/virtual_node.hpp"
#include "utils/digest.hpp"
#include <boost/log/trivial.hpp>

namespace cloudsim {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

VirtualNode::VirtualNode(const std::string& node_id, uint16_t port, network::ClusterDirectory& directory,
                         const NodeConfig& config)
  : node_id_(node_id)
  , config_(config)
  , directory_(directory)
  , address_(directory.add_node(node_id, port))
  , transport_(directory.get_transport(node_id))
  , started_at_(std::chrono::steady_clock::now()) {
  BOOST_LOG_TRIVIAL(info) << "Virtual node: Initializing node " << node_id_ << " at " << address_.to_string();

  try {
    store_ = std::make_unique<store::BlockStore>(node_id_, config_.store);
    rpc_ = std::make_unique<rpc::RpcService>(node_id_, *transport_);
    distributor_ = std::make_unique<FileDistributor>(node_id_, directory_, *rpc_, *store_, config_.distributor);
    register_methods();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Virtual node: Failed to initialize components of " << node_id_ << ": " << e.what();
    directory_.remove_node(node_id_);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Virtual node: Node " << node_id_ << " ready";
}

VirtualNode::~VirtualNode() {
  shutdown();
}

void VirtualNode::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Virtual node: Shutting down node " << node_id_;
  directory_.remove_node(node_id_);
}


//==============================================
// CLUSTER OPERATIONS
//==============================================

std::vector<std::string> VirtualNode::discover() {
  return directory_.discover(node_id_);
}

rpc::RpcResult VirtualNode::call(const std::string& target_node_id, const std::string& method_name,
                                 const nlohmann::json& params) {
  auto target = directory_.get_address(target_node_id);
  if (!target) {
    BOOST_LOG_TRIVIAL(error) << "Virtual node: Cannot call " << method_name << " on unknown node " << target_node_id;
    return rpc::RpcResult::failure(rpc::RpcError::UNKNOWN_NODE, "Node " + target_node_id + " not found");
  }
  return rpc_->call(*target, method_name, params, config_.call_timeout);
}

DistributionResult VirtualNode::distribute_file(const std::string& path, std::size_t replication_factor) {
  DistributionResult result = distributor_->distribute_file(path, replication_factor);
  chunks_uploaded_ += result.chunks_distributed;
  bytes_transferred_ += result.bytes_distributed;
  return result;
}

DistributionResult VirtualNode::distribute_data(const std::string& filename, const std::vector<uint8_t>& content,
                                                std::size_t replication_factor) {
  DistributionResult result = distributor_->distribute_data(filename, content, replication_factor);
  chunks_uploaded_ += result.chunks_distributed;
  bytes_transferred_ += result.bytes_distributed;
  return result;
}

RetrievalResult VirtualNode::retrieve_file(const std::string& file_id) {
  RetrievalResult result = distributor_->retrieve_file(file_id);
  chunks_downloaded_ += result.chunks_retrieved;
  if (result.success) {
    bytes_transferred_ += result.data.size();
  }
  return result;
}

double VirtualNode::uptime() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}

nlohmann::json VirtualNode::get_stats() const {
  return nlohmann::json{
    {"node_id", node_id_},
    {"address", address_.to_string()},
    {"uptime", uptime()},
    {"is_active", !shut_down_ && directory_.is_active(node_id_)},
    {"storage", store_->get_storage_info().to_json()},
    {"performance", {
      {"chunks_uploaded", chunks_uploaded_.load()},
      {"chunks_downloaded", chunks_downloaded_.load()},
      {"chunks_stored", chunks_stored_.load()},
      {"chunks_served", chunks_served_.load()},
      {"bytes_transferred", bytes_transferred_.load()}
    }}
  };
}


//==============================================
// RPC METHODS
//==============================================

void VirtualNode::register_methods() {
  rpc_->register_method("ping", [this](const nlohmann::json& params) { return ping(params); });

  rpc_->register_method("get_storage_info", [this](const nlohmann::json&) {
    return store_->get_storage_info().to_json();
  });

  rpc_->register_method("list_files", [this](const nlohmann::json&) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : store_->list_files()) {
      files.push_back(file.to_json());
    }
    return nlohmann::json{{"success", true}, {"files", files}};
  });

  rpc_->register_method("store_file_chunk", [this](const nlohmann::json& params) {
    return store_file_chunk(params);
  });

  rpc_->register_method("retrieve_file_chunk", [this](const nlohmann::json& params) {
    return retrieve_file_chunk(params);
  });
}

nlohmann::json VirtualNode::ping(const nlohmann::json&) {
  return nlohmann::json{
    {"success", true},
    {"node_id", node_id_},
    {"timestamp", network::unix_time_now()},
    {"uptime", uptime()}
  };
}

nlohmann::json VirtualNode::store_file_chunk(const nlohmann::json& params) {
  std::string file_id = params.at("file_id").get<std::string>();
  std::string claimed_hash = params.at("chunk_hash").get<std::string>();

  auto data = utils::from_hex(params.at("chunk_data").get<std::string>());
  if (!data) {
    BOOST_LOG_TRIVIAL(warning) << "Virtual node: Chunk " << file_id << " carries malformed data";
    return nlohmann::json{{"success", false}, {"error", "Malformed chunk data"}};
  }

  if (utils::md5_hex(*data) != claimed_hash) {
    BOOST_LOG_TRIVIAL(warning) << "Virtual node: Hash mismatch for chunk " << file_id << " on " << node_id_;
    return nlohmann::json{{"success", false}, {"error", "Hash mismatch"}};
  }

  // A chunk stored again under the same id replaces the old copy
  std::vector<uint32_t> blocks;
  switch (store_->put_file(file_id, file_id, *data, &blocks)) {
  case store::BlockStore::PutStatus::STORED:
    break;
  case store::BlockStore::PutStatus::INSUFFICIENT_STORAGE:
    return nlohmann::json{{"success", false}, {"error", "Insufficient storage"}};
  case store::BlockStore::PutStatus::WRITE_FAILED:
    return nlohmann::json{{"success", false}, {"error", "Failed to write chunk"}};
  }

  ++chunks_stored_;
  bytes_transferred_ += data->size();
  BOOST_LOG_TRIVIAL(info) << "Virtual node: Stored chunk " << file_id << " (" << data->size()
                          << " bytes) on " << node_id_;
  return nlohmann::json{{"success", true}, {"blocks", blocks}};
}

nlohmann::json VirtualNode::retrieve_file_chunk(const nlohmann::json& params) {
  std::string file_id = params.at("file_id").get<std::string>();

  auto file = store_->get_file(file_id);
  if (!file) {
    return nlohmann::json{{"success", false}, {"error", "Chunk not found"}};
  }

  auto data = store_->read(file_id, file->size);
  if (!data) {
    return nlohmann::json{{"success", false}, {"error", "Chunk not found"}};
  }

  ++chunks_served_;
  bytes_transferred_ += data->size();
  return nlohmann::json{
    {"success", true},
    {"chunk_data", utils::to_hex(*data)},
    {"chunk_hash", utils::md5_hex(*data)},
    {"size", data->size()}
  };
}

} // namespace node
} // namespace cloudsim
