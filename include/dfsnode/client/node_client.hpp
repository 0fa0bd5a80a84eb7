#ifndef DFSNODE_CLIENT_NODE_CLIENT_HPP
#define DFSNODE_CLIENT_NODE_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "dfsnode/logger/logger.hpp"
#include "dfsnode/network/connection.hpp"
#include "dfsnode/transfer/transfer_engine.hpp"

namespace dfsnode {
namespace client {

// What the initiating side learns from one request
struct Response {
  bool success = false;
  std::string message;
};

// Talks to one storage node. Every call opens its own connection since the
// node serves exactly one request per connection.
class NodeClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  NodeClient(const std::string& host, uint16_t port, logging::Logger& logger,
             network::Connection::Duration timeout = network::Connection::Duration::zero());


  // ---- REQUESTS ----
  // Succeeds when the node answers with its availability code
  Response status();
  // Uploads src_path. With want_response the node's verdict decides success,
  // otherwise success means every byte was sent.
  Response put_file(const std::filesystem::path& src_path, bool want_response = true);
  // Downloads filename from the node into dest_path
  Response get_file(const std::string& filename, const std::filesystem::path& dest_path);

private:
  // ---- PARAMETERS ----
  std::string host_;
  uint16_t port_;
  network::Connection::Duration timeout_;
  logging::Logger& logger_;
  transfer::TransferEngine engine_;
};

} // namespace client
} // namespace dfsnode

#endif // DFSNODE_CLIENT_NODE_CLIENT_HPP
