#ifndef DFSNODE_NODE_IDENTITY_HPP
#define DFSNODE_NODE_IDENTITY_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "dfsnode/common/error.hpp"

namespace dfsnode {
namespace node {

// Prefix and field separator of registry table names: sn__<host>__<port>
constexpr const char* REGISTRY_TABLE_PREFIX = "sn";
constexpr const char* REGISTRY_FIELD_SEPARATOR = "__";

struct NodeIdentity {
  std::string host;
  uint16_t port{0};

  // storage_<host>_<port>
  std::filesystem::path storage_dir() const;
  // sn__<host with dots as underscores>__<port>
  std::string registry_table() const;
  // <host>:<port>
  std::string endpoint() const;

  bool operator==(const NodeIdentity& other) const {
    return host == other.host && port == other.port;
  }
  bool operator!=(const NodeIdentity& other) const { return !(*this == other); }
};

// ---- LAYOUT DERIVATIONS ----
std::string storage_dir_name(const std::string& host, uint16_t port);
// Throws InvalidIdentifier if host is not well-formed
std::string registry_table(const std::string& host, uint16_t port);


// ---- INVERSE DERIVATIONS ----
// sn__0_0_0_0__5000 -> {0.0.0.0, 5000}
NodeIdentity parse_registry_table(const std::string& table_name);
// sn__0_0_0_0__5000 -> "0.0.0.0:5000"
std::string table_name_to_endpoint(const std::string& table_name);
// "0.0.0.0:5000" -> {0.0.0.0, 5000}
NodeIdentity parse_endpoint(const std::string& endpoint);


// ---- VALIDATION ----
// Hosts are non-empty, limited to letters, digits, '.' and '-', and have no
// empty dot-separated labels
bool is_valid_host(const std::string& host);
// Parses a decimal port in 0..65535, throws InvalidIdentifier otherwise
uint16_t parse_port(const std::string& port_str);

} // namespace node
} // namespace dfsnode

#endif // DFSNODE_NODE_IDENTITY_HPP
