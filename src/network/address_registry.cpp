#include "network/address_registry.hpp"
#include <boost/log/trivial.hpp>

namespace cloudsim {
namespace network {

AddressRegistry::AddressRegistry(const std::string& default_host)
  : default_host_(default_host) {
}

std::optional<NodeAddress> AddressRegistry::allocate(const std::string& node_id, uint16_t port) {
  return allocate(node_id, default_host_, port);
}

std::optional<NodeAddress> AddressRegistry::allocate(const std::string& node_id,
                                                     const std::string& host, uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = addresses_.find(node_id);
  if (existing != addresses_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Address registry: Node " << node_id
                             << " already holds " << existing->second.to_string();
    return existing->second;
  }

  NodeAddress address{host, port};
  auto owner = owners_.find(address);
  if (owner != owners_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Address registry: " << address.to_string()
                             << " already allocated to node " << owner->second;
    return std::nullopt;
  }

  addresses_[node_id] = address;
  owners_[address] = node_id;
  BOOST_LOG_TRIVIAL(info) << "Address registry: Allocated " << address.to_string() << " to node " << node_id;
  return address;
}

bool AddressRegistry::release(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = addresses_.find(node_id);
  if (it == addresses_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Address registry: No address to release for node " << node_id;
    return false;
  }

  owners_.erase(it->second);
  BOOST_LOG_TRIVIAL(info) << "Address registry: Released " << it->second.to_string() << " from node " << node_id;
  addresses_.erase(it);
  return true;
}

std::optional<NodeAddress> AddressRegistry::get_address(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = addresses_.find(node_id);
  if (it == addresses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> AddressRegistry::get_node_for_address(const NodeAddress& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = owners_.find(address);
  if (it == owners_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, NodeAddress> AddressRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return addresses_;
}

std::size_t AddressRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return addresses_.size();
}

} // namespace network
} // namespace cloudsim
