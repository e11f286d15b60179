#include "cli/options.hpp"
#include "logger/logger.hpp"
#include "node/virtual_node.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

bool run_cluster(const cloudsim::cli::ProgramOptions& options) {
  cloudsim::network::ClusterDirectory directory;
  std::vector<std::unique_ptr<cloudsim::node::VirtualNode>> nodes;

  cloudsim::node::NodeConfig config;
  config.store.storage_root = options.storage_root;

  try {
    for (std::size_t i = 0; i < options.nodes; ++i) {
      std::string node_id = "node_" + std::to_string(i);
      uint16_t port = static_cast<uint16_t>(options.base_port + i);
      nodes.push_back(std::make_unique<cloudsim::node::VirtualNode>(node_id, port, directory, config));
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start cluster: " << e.what() << '\n';
    return false;
  }

  for (auto& node : nodes) {
    node->discover();
  }
  directory.start_heartbeat_loop();
  std::cout << "Cluster: " << directory.get_info().to_json().dump(2) << '\n';

  auto& initiator = *nodes.front();
  for (std::size_t i = 1; i < nodes.size(); ++i) {
    auto reply = initiator.call(nodes[i]->get_node_id(), "ping");
    if (reply.success) {
      std::cout << "Ping " << nodes[i]->get_node_id() << ": " << reply.result.dump() << '\n';
    } else {
      std::cout << "Ping " << nodes[i]->get_node_id() << " failed: " << reply.error << '\n';
    }
  }

  bool ok = true;
  if (!options.file.empty()) {
    auto result = initiator.distribute_file(options.file, options.replication);
    std::cout << "Distribution: " << result.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    ok = result.success && result.chunks_distributed == result.chunk_count;

    if (result.chunks_distributed > 0) {
      auto retrieved = initiator.retrieve_file(result.file_id);
      if (retrieved.success) {
        std::cout << "Retrieved " << retrieved.data.size() << " bytes in "
                  << retrieved.chunks_retrieved << " chunks\n";
      } else {
        std::cout << "Retrieval failed: " << retrieved.error << '\n';
        ok = false;
      }
    }
  }

  for (const auto& node : nodes) {
    std::cout << node->get_stats().dump(2) << '\n';
  }

  directory.stop_heartbeat_loop();
  for (auto& node : nodes) {
    node->shutdown();
  }
  nodes.clear();
  directory.stop();
  return ok;
}

int main(int argc, char* argv[]) {
  const auto options = cloudsim::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    cloudsim::logging::init_logging(options.log_file);
  } catch (const std::exception&) {
    return 1;
  }

  return run_cluster(options) ? 0 : 1;
}
