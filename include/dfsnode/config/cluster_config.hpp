#ifndef DFSNODE_CONFIG_CLUSTER_CONFIG_HPP
#define DFSNODE_CONFIG_CLUSTER_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>
#include "dfsnode/node/node_identity.hpp"

namespace dfsnode {
namespace config {

constexpr const char* DEFAULT_CONFIG_FILE = "machines.cfg";

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config error: " + message) {}
};

// Cluster layout read from an INI file:
//
//   [default]        database, log_dir, storage_root, transfer_timeout_ms
//   [storage_nodes]  machine_list = host:port,host:port,...
//
// Other sections, such as [master], belong to other tools and are ignored.
struct ClusterConfig {
  std::string database = "dfs.db";
  std::string log_dir = "logs";
  std::filesystem::path storage_root = ".";
  std::chrono::milliseconds transfer_timeout{0};
  std::vector<node::NodeIdentity> storage_nodes;

  // Throws ConfigError if the file is missing or malformed
  static ClusterConfig load(const std::filesystem::path& config_file);
  static ClusterConfig parse(std::istream& input);

  // Throws ConfigError on an out-of-range index
  const node::NodeIdentity& storage_node(std::size_t index) const;
};

} // namespace config
} // namespace dfsnode

#endif // DFSNODE_CONFIG_CLUSTER_CONFIG_HPP
