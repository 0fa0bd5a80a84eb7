#include "dfsnode/config/cluster_config.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/algorithm/string.hpp>
#include <fstream>
#include <stdexcept>

namespace dfsnode {
namespace config {

namespace {

std::vector<node::NodeIdentity> parse_node_list(const std::string& machine_list) {
  std::vector<std::string> entries;
  boost::split(entries, machine_list, boost::is_any_of(","));

  std::vector<node::NodeIdentity> nodes;
  for (auto& entry : entries) {
    boost::trim(entry);
    if (entry.empty()) {
      continue;
    }
    try {
      nodes.push_back(node::parse_endpoint(entry));
    } catch (const InvalidIdentifier& e) {
      throw ConfigError("storage node '" + entry + "': " + e.what());
    }
  }
  return nodes;
}

std::chrono::milliseconds parse_timeout(const std::string& raw) {
  std::string value = boost::trim_copy(raw);
  if (value.empty() || !boost::all(value, boost::is_digit())) {
    throw ConfigError("transfer_timeout_ms '" + raw + "' is not a non-negative integer");
  }
  try {
    return std::chrono::milliseconds(std::stoll(value));
  } catch (const std::out_of_range&) {
    throw ConfigError("transfer_timeout_ms '" + raw + "' is out of range");
  }
}

} // namespace

//==============================================
// LOADING
//==============================================

ClusterConfig ClusterConfig::load(const std::filesystem::path& config_file) {
  std::ifstream input(config_file);
  if (!input) {
    throw ConfigError("cannot open " + config_file.string());
  }
  return parse(input);
}

ClusterConfig ClusterConfig::parse(std::istream& input) {
  namespace pt = boost::property_tree;

  pt::ptree tree;
  try {
    pt::read_ini(input, tree);
  } catch (const pt::ini_parser_error& e) {
    throw ConfigError(e.what());
  }

  ClusterConfig config;
  try {
    config.database = tree.get<std::string>("default.database", config.database);
    config.log_dir = tree.get<std::string>("default.log_dir", config.log_dir);
    config.storage_root = tree.get<std::string>("default.storage_root", config.storage_root.string());

    auto timeout = tree.get_optional<std::string>("default.transfer_timeout_ms");
    if (timeout) {
      config.transfer_timeout = parse_timeout(*timeout);
    }

    // Older layouts name the list after the deployment target
    auto machine_list = tree.get_optional<std::string>("storage_nodes.machine_list");
    if (!machine_list) {
      machine_list = tree.get_optional<std::string>("storage_nodes.machine_list_docker");
    }
    if (!machine_list) {
      throw ConfigError("missing [storage_nodes] machine_list");
    }
    config.storage_nodes = parse_node_list(*machine_list);
    if (config.storage_nodes.empty()) {
      throw ConfigError("[storage_nodes] machine_list is empty");
    }
  } catch (const pt::ptree_error& e) {
    throw ConfigError(e.what());
  } catch (const InvalidIdentifier& e) {
    throw ConfigError(e.what());
  }

  return config;
}


//==============================================
// QUERIES
//==============================================

const node::NodeIdentity& ClusterConfig::storage_node(std::size_t index) const {
  if (index >= storage_nodes.size()) {
    throw ConfigError("storage node index " + std::to_string(index) + " out of range (" +
                      std::to_string(storage_nodes.size()) + " nodes configured)");
  }
  return storage_nodes[index];
}

} // namespace config
} // namespace dfsnode
