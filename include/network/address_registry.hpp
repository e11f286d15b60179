#ifndef CLOUDSIM_NETWORK_ADDRESS_REGISTRY_HPP
#define CLOUDSIM_NETWORK_ADDRESS_REGISTRY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "network/message.hpp"

namespace cloudsim {
namespace network {

// Maps node ids to network addresses. Pure bookkeeping, no I/O.
class AddressRegistry {
public:
  AddressRegistry(const AddressRegistry&) = delete;
  AddressRegistry& operator=(const AddressRegistry&) = delete;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AddressRegistry(const std::string& default_host = "127.0.0.1");
  ~AddressRegistry() = default;


  // ---- ALLOCATION ----
  // Assigns (default host, port) to a node. Returns the existing address if the
  // node already holds one, empty if the pair belongs to another node.
  std::optional<NodeAddress> allocate(const std::string& node_id, uint16_t port);
  std::optional<NodeAddress> allocate(const std::string& node_id, const std::string& host, uint16_t port);
  // Releases the address of a node, false if it held none
  bool release(const std::string& node_id);


  // ---- QUERY OPERATIONS ----
  std::optional<NodeAddress> get_address(const std::string& node_id) const;
  std::optional<std::string> get_node_for_address(const NodeAddress& address) const;
  std::map<std::string, NodeAddress> snapshot() const;
  std::size_t size() const;

private:
  // ---- PARAMETERS ----
  std::string default_host_;
  std::map<std::string, NodeAddress> addresses_;
  std::map<NodeAddress, std::string> owners_;
  mutable std::mutex mutex_;
};

} // namespace network
} // namespace cloudsim

#endif // CLOUDSIM_NETWORK_ADDRESS_REGISTRY_HPP
