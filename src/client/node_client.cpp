#include "dfsnode/client/node_client.hpp"
#include "dfsnode/network/protocol.hpp"

namespace dfsnode {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeClient::NodeClient(const std::string& host, uint16_t port, logging::Logger& logger,
                       network::Connection::Duration timeout)
  : host_(host)
  , port_(port)
  , timeout_(timeout)
  , logger_(logger)
  , engine_(logger) {
}


//==============================================
// REQUESTS
//==============================================

Response NodeClient::status() {
  try {
    network::Connection connection(timeout_);
    connection.connect(host_, port_);
    connection.write_frame(network::make_status_request());

    std::string reply = connection.read_frame();
    bool available = reply == network::SERVER_AVAILABLE_CODE;
    DFSNODE_LOG_DEBUG(logger_) << "Client: Status of " << host_ << ":" << port_ << " is " << reply;
    return Response{available, reply};
  }
  catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "Client: Status request to " << host_ << ":" << port_ << " failed: " << e.what();
    return Response{false, e.what()};
  }
}

Response NodeClient::put_file(const std::filesystem::path& src_path, bool want_response) {
  try {
    network::Connection connection(timeout_);
    connection.connect(host_, port_);

    Outcome outcome = engine_.send(connection, src_path);
    if (!outcome.ok()) {
      return Response{false, outcome.message};
    }

    if (!want_response) {
      return Response{true, outcome.message};
    }

    // The node's verdict after its integrity check
    std::string reply = connection.read_frame();
    bool stored = reply == network::TRANSFER_SUCCESSFUL_CODE;
    if (stored) {
      DFSNODE_LOG_INFO(logger_) << "Client: Stored " << src_path.string() << " on " << host_ << ":" << port_;
    } else {
      DFSNODE_LOG_ERROR(logger_) << "Client: Node " << host_ << ":" << port_ << " rejected "
                                 << src_path.string() << ": " << reply;
    }
    return Response{stored, reply};
  }
  catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "Client: Put of " << src_path.string() << " failed: " << e.what();
    return Response{false, e.what()};
  }
}

Response NodeClient::get_file(const std::string& filename, const std::filesystem::path& dest_path) {
  try {
    network::Connection connection(timeout_);
    connection.connect(host_, port_);

    std::string remote_name = std::filesystem::path(filename).filename().string();
    connection.write_frame(network::make_get_request(remote_name));

    network::Request reply = network::parse_request(connection.read_frame());

    if (reply.type_token == network::NOTIFY_FAILURE) {
      std::string message = reply.args.empty() ? "Operation failed!" : reply.args.front();
      DFSNODE_LOG_WARN(logger_) << "Client: Node refused get of " << remote_name << ": " << message;
      return Response{false, message};
    }

    if (reply.type != network::RequestType::PUT) {
      return Response{false, "Operation not supported"};
    }

    network::FileHeader header = network::parse_file_header(reply.args);
    Outcome outcome = engine_.receive(connection, dest_path, header.file_size, header.file_hash);
    if (!outcome.ok()) {
      return Response{false, outcome.message};
    }

    std::string message = dest_path.string() + " saved successfully on " + connection.local_endpoint() +
                          ". Integrity check passed.";
    DFSNODE_LOG_DEBUG(logger_) << "Client: " << message;
    return Response{true, message};
  }
  catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "Client: Get of " << filename << " failed: " << e.what();
    return Response{false, e.what()};
  }
}

} // namespace client
} // namespace dfsnode
