#include "dfsnode/cli/cli.hpp"
#include "dfsnode/node/node_identity.hpp"
#include <sstream>

namespace dfsnode {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(logging::Logger& logger, const std::filesystem::path& received_dir,
         std::istream& input, std::ostream& output)
  : running_(false)
  , received_dir_(received_dir)
  , input_(input)
  , output_(output)
  , logger_(logger) {
  DFSNODE_LOG_INFO(logger_) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  DFSNODE_LOG_INFO(logger_) << "Starting CLI loop";
  output_ << "DFS_Node> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "DFS_Node> " << std::flush;
    }
  }

  DFSNODE_LOG_INFO(logger_) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument;
  iss >> command;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  if (command == "status" || command == "help") {
    process_command(command, "");
  } else if (iss >> argument) {
    process_command(command, argument);
  } else {
    output_ << "Invalid input. Usage: <command> [argument]" << std::endl;
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  DFSNODE_LOG_DEBUG(logger_) << "Processing command: " << command << " with argument: " << argument;

  if (command == "connect") {
    handle_connect_command(argument);
  }
  else if (command == "status") {
    handle_status_command();
  }
  else if (command == "put") {
    handle_put_command(argument);
  }
  else if (command == "get") {
    handle_get_command(argument);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_connect_command(const std::string& connection_string) {
  try {
    node::NodeIdentity target = node::parse_endpoint(connection_string);
    client_ = std::make_unique<client::NodeClient>(target.host, target.port, logger_);
    output_ << "Using storage node " << target.endpoint() << std::endl;
  } catch (const std::exception& e) {
    output_ << "Invalid format. Usage: connect ip:port (e.g., connect 127.0.0.1:5000)" << std::endl;
    DFSNODE_LOG_WARN(logger_) << "Rejected endpoint " << connection_string << ": " << e.what();
  }
}

void CLI::handle_status_command() {
  if (!require_connection()) {
    return;
  }
  display_response("Status", client_->status());
}

void CLI::handle_put_command(const std::string& filename) {
  if (!require_connection()) {
    return;
  }
  display_response("Put", client_->put_file(filename));
}

void CLI::handle_get_command(const std::string& filename) {
  if (!require_connection()) {
    return;
  }
  std::filesystem::path dest_path = received_dir_ / std::filesystem::path(filename).filename();
  display_response("Get", client_->get_file(filename, dest_path));
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help              Display this help message" << std::endl;
  output_ << "  connect <ip:port> Use the storage node at <ip:port>" << std::endl;
  output_ << "  status            Check that the node is available" << std::endl;
  output_ << "  put <file>        Upload local <file> to the node" << std::endl;
  output_ << "  get <file>        Download <file> into " << received_dir_.string() << std::endl;
  output_ << "  quit              Exit the shell" << std::endl << std::endl;
}

void CLI::display_response(const std::string& action, const client::Response& response) {
  if (!response.success) {
    DFSNODE_LOG_ERROR(logger_) << action << " failed: " << response.message;
  }
  output_ << action << (response.success ? " succeeded: " : " failed: ") << response.message << std::endl;
}

bool CLI::require_connection() {
  if (!client_) {
    output_ << "Not connected. Use: connect ip:port" << std::endl;
    return false;
  }
  return true;
}

} // namespace cli
} // namespace dfsnode
