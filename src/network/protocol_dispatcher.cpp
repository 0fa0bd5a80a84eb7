#include "dfsnode/network/protocol_dispatcher.hpp"

namespace dfsnode {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProtocolDispatcher::ProtocolDispatcher(store::NodeStore& store, transfer::TransferEngine& engine,
                                       logging::Logger& logger)
  : store_(store)
  , engine_(engine)
  , logger_(logger) {
}


//==============================================
// REQUEST HANDLING
//==============================================

DispatcherState::State ProtocolDispatcher::handle(Connection& connection) {
  DispatcherState state;
  std::optional<std::string> response = std::string("Operation failed.");
  const std::string peer = connection.remote_endpoint();

  try {
    Request request = parse_request(connection.read_frame());

    switch (request.type) {
      case RequestType::STATUS:
        DFSNODE_LOG_DEBUG(logger_) << "Dispatcher: Received status request from " << peer;
        response = std::string(SERVER_AVAILABLE_CODE);
        break;

      case RequestType::PUT:
        DFSNODE_LOG_DEBUG(logger_) << "Dispatcher: Received put request from " << peer;
        advance(state, DispatcherState::State::DISPATCHED);
        response = do_put_handler(request.args, connection);
        break;

      case RequestType::GET:
        DFSNODE_LOG_DEBUG(logger_) << "Dispatcher: Received get request from " << peer;
        advance(state, DispatcherState::State::DISPATCHED);
        response = do_get_handler(request.args, connection);
        break;

      default:
        DFSNODE_LOG_WARN(logger_) << "Dispatcher: Unsupported request type '" << request.type_token
                                  << "' from " << peer;
        response = std::string(UNSUPPORTED_REQUEST_MESSAGE);
        break;
    }
  }
  catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "Dispatcher: Request from " << peer << " failed: " << e.what();
    response = std::string(e.what());
  }

  if (response) {
    respond(connection, *response, state);
  }

  advance(state, DispatcherState::State::CLOSED);
  return state.get_state();
}


//==============================================
// REQUEST HANDLERS
//==============================================

std::string ProtocolDispatcher::do_put_handler(const std::vector<std::string>& args, Connection& connection) {
  FileHeader header = parse_file_header(args);
  std::filesystem::path storage_filepath = store_.resolve(header.filename);
  store_.ensure_directory();

  Outcome outcome = engine_.receive(connection, storage_filepath, header.file_size, header.file_hash);
  if (!outcome.ok()) {
    DFSNODE_LOG_ERROR(logger_) << "Dispatcher: Put of " << storage_filepath.string() << " failed ("
                               << error_kind_to_string(outcome.kind) << "): " << outcome.message;
    return outcome.message;
  }

  DFSNODE_LOG_INFO(logger_) << "Dispatcher: Stored " << storage_filepath.string() << " ("
                            << outcome.bytes_transferred << " bytes)";
  return TRANSFER_SUCCESSFUL_CODE;
}

std::optional<std::string> ProtocolDispatcher::do_get_handler(const std::vector<std::string>& args,
                                                              Connection& connection) {
  if (args.size() != 1) {
    DFSNODE_LOG_WARN(logger_) << "Dispatcher: Get with " << args.size() << " arguments rejected";
    return make_failure_notice("get expects exactly one filename");
  }

  std::string filename;
  try {
    filename = store::NodeStore::sanitize_filename(args[0]);
  }
  catch (const InvalidIdentifier& e) {
    DFSNODE_LOG_WARN(logger_) << "Dispatcher: Rejected get of '" << args[0] << "': " << e.what();
    return make_failure_notice(e.what());
  }

  if (!store_.has(filename)) {
    DFSNODE_LOG_WARN(logger_) << "Dispatcher: Requested file not found: " << filename;
    return make_failure_notice("File not found: " + filename);
  }

  // Open and hash before the header goes out, so a vanished or unreadable
  // file can still be reported
  transfer::SourceFile source;
  try {
    source = engine_.open_source(store_.resolve(filename));
  }
  catch (const NodeError& e) {
    DFSNODE_LOG_ERROR(logger_) << "Dispatcher: Cannot serve " << filename << ": " << e.what();
    return make_failure_notice(e.what());
  }

  Outcome outcome = engine_.send(connection, source);
  if (!outcome.ok()) {
    // The stream is already partly written; the peer sees a short transfer
    DFSNODE_LOG_ERROR(logger_) << "Dispatcher: Serving " << filename << " failed ("
                               << error_kind_to_string(outcome.kind) << "): " << outcome.message;
    return std::nullopt;
  }

  DFSNODE_LOG_INFO(logger_) << "Dispatcher: Served " << filename << " (" << outcome.bytes_transferred << " bytes)";
  return std::nullopt;
}


//==============================================
// RESPONSE AND STATE
//==============================================

bool ProtocolDispatcher::advance(DispatcherState& state, DispatcherState::State next) {
  if (!state.transition_to(next)) {
    DFSNODE_LOG_WARN(logger_) << "Dispatcher: Invalid state transition " << state.get_state_string()
                              << " -> " << DispatcherState::state_to_string(next);
    return false;
  }
  return true;
}

void ProtocolDispatcher::respond(Connection& connection, const std::string& response, DispatcherState& state) {
  advance(state, DispatcherState::State::RESPONDING);
  try {
    connection.write_frame(response);
  }
  catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "Dispatcher: Failed to send response to " << connection.remote_endpoint()
                               << ": " << e.what();
  }
}

} // namespace network
} // namespace dfsnode
