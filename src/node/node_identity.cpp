#include "dfsnode/node/node_identity.hpp"
#include <algorithm>
#include <cctype>

namespace dfsnode {
namespace node {

//==============================================
// NODE IDENTITY
//==============================================

std::filesystem::path NodeIdentity::storage_dir() const {
  return std::filesystem::path(storage_dir_name(host, port));
}

std::string NodeIdentity::registry_table() const {
  return node::registry_table(host, port);
}

std::string NodeIdentity::endpoint() const {
  return host + ":" + std::to_string(port);
}


//==============================================
// LAYOUT DERIVATIONS
//==============================================

std::string storage_dir_name(const std::string& host, uint16_t port) {
  return "storage_" + host + "_" + std::to_string(port);
}

std::string registry_table(const std::string& host, uint16_t port) {
  if (!is_valid_host(host)) {
    throw InvalidIdentifier("host '" + host + "'");
  }

  std::string table_host = host;
  std::replace(table_host.begin(), table_host.end(), '.', '_');

  return std::string(REGISTRY_TABLE_PREFIX) + REGISTRY_FIELD_SEPARATOR + table_host +
         REGISTRY_FIELD_SEPARATOR + std::to_string(port);
}


//==============================================
// INVERSE DERIVATIONS
//==============================================

NodeIdentity parse_registry_table(const std::string& table_name) {
  const std::string separator(REGISTRY_FIELD_SEPARATOR);
  const std::string prefix = std::string(REGISTRY_TABLE_PREFIX) + separator;

  if (table_name.compare(0, prefix.size(), prefix) != 0) {
    throw InvalidIdentifier("table name '" + table_name + "' lacks the '" + prefix + "' prefix");
  }

  // Exactly one more separator between host and port
  std::size_t host_begin = prefix.size();
  std::size_t port_sep = table_name.find(separator, host_begin);
  if (port_sep == std::string::npos ||
      table_name.find(separator, port_sep + separator.size()) != std::string::npos) {
    throw InvalidIdentifier("table name '" + table_name + "' must have two field separators");
  }

  std::string host = table_name.substr(host_begin, port_sep - host_begin);
  std::replace(host.begin(), host.end(), '_', '.');
  if (!is_valid_host(host)) {
    throw InvalidIdentifier("table name '" + table_name + "' has a malformed host");
  }

  NodeIdentity identity;
  identity.host = host;
  identity.port = parse_port(table_name.substr(port_sep + separator.size()));
  return identity;
}

std::string table_name_to_endpoint(const std::string& table_name) {
  return parse_registry_table(table_name).endpoint();
}

NodeIdentity parse_endpoint(const std::string& endpoint) {
  std::size_t colon_pos = endpoint.rfind(':');
  if (colon_pos == std::string::npos) {
    throw InvalidIdentifier("endpoint '" + endpoint + "' is not in host:port form");
  }

  NodeIdentity identity;
  identity.host = endpoint.substr(0, colon_pos);
  if (!is_valid_host(identity.host)) {
    throw InvalidIdentifier("endpoint '" + endpoint + "' has a malformed host");
  }
  identity.port = parse_port(endpoint.substr(colon_pos + 1));
  return identity;
}


//==============================================
// VALIDATION
//==============================================

bool is_valid_host(const std::string& host) {
  if (host.empty()) {
    return false;
  }
  // Empty labels would collide with the table field separator
  if (host.front() == '.' || host.back() == '.' || host.find("..") != std::string::npos) {
    return false;
  }
  return std::all_of(host.begin(), host.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '-';
  });
}

uint16_t parse_port(const std::string& port_str) {
  if (port_str.empty() || port_str.size() > 5 ||
      !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw InvalidIdentifier("port '" + port_str + "'");
  }

  unsigned long port = std::stoul(port_str);
  if (port > 65535) {
    throw InvalidIdentifier("port '" + port_str + "' out of range");
  }
  return static_cast<uint16_t>(port);
}

} // namespace node
} // namespace dfsnode
