#ifndef DFSNODE_PROTOCOL_DISPATCHER_HPP
#define DFSNODE_PROTOCOL_DISPATCHER_HPP

#include <optional>
#include <string>
#include <vector>
#include "dfsnode/logger/logger.hpp"
#include "dfsnode/network/connection.hpp"
#include "dfsnode/network/dispatcher_state.hpp"
#include "dfsnode/network/protocol.hpp"
#include "dfsnode/store/node_store.hpp"
#include "dfsnode/transfer/transfer_engine.hpp"

namespace dfsnode {
namespace network {

// Serves one request per connection: reads the request frame, routes it and
// writes the single response. Stateless between connections, so one
// instance is shared by every connection worker.
class ProtocolDispatcher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ProtocolDispatcher(store::NodeStore& store, transfer::TransferEngine& engine, logging::Logger& logger);


  // ---- REQUEST HANDLING ----
  // Never throws; every failure becomes a response to the peer. Returns the
  // final state, which is always CLOSED.
  DispatcherState::State handle(Connection& connection);

private:
  // ---- PARAMETERS ----
  store::NodeStore& store_;
  transfer::TransferEngine& engine_;
  logging::Logger& logger_;


  // ---- REQUEST HANDLERS ----
  // Receives the file and returns the response string
  std::string do_put_handler(const std::vector<std::string>& args, Connection& connection);
  // Returns a failure notice, or nullopt when the file itself was the response
  std::optional<std::string> do_get_handler(const std::vector<std::string>& args, Connection& connection);


  // ---- RESPONSE AND STATE ----
  void respond(Connection& connection, const std::string& response, DispatcherState& state);
  // Applies the transition, logging a warning when the state machine rejects it
  bool advance(DispatcherState& state, DispatcherState::State next);
};

} // namespace network
} // namespace dfsnode

#endif // DFSNODE_PROTOCOL_DISPATCHER_HPP
