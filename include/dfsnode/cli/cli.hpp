#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include "dfsnode/client/node_client.hpp"
#include "dfsnode/logger/logger.hpp"

namespace dfsnode {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(logging::Logger& logger, const std::filesystem::path& received_dir,
        std::istream& input, std::ostream& output);


    // ---- STARTUP ----
    void run();
    // Executes one command line, returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    std::filesystem::path received_dir_;
    std::istream& input_;
    std::ostream& output_;
    // System components
    logging::Logger& logger_;
    std::unique_ptr<client::NodeClient> client_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_connect_command(const std::string& connection_string);
    void handle_status_command();
    void handle_put_command(const std::string& filename);
    void handle_get_command(const std::string& filename);
    void handle_help_command();
    void display_response(const std::string& action, const client::Response& response);
    bool require_connection();
};

} // namespace cli
} // namespace dfsnode
