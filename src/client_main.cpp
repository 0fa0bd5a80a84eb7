#include "dfsnode/cli/cli.hpp"
#include "dfsnode/cleanup/cleaner.hpp"
#include "dfsnode/logger/logger.hpp"
#include <iostream>
#include <string>

namespace {

constexpr const char* LOG_DIR = "logs";
constexpr const char* LOG_FILE = "client.log";

} // namespace

int main(int argc, char* argv[]) {
  try {
    dfsnode::logging::init_logging(LOG_DIR, LOG_FILE);
    auto logger = dfsnode::logging::make_logger("client");

    dfsnode::cli::CLI cli(logger, dfsnode::cleanup::RECEIVED_FILES_DIR, std::cin, std::cout);

    // Optional initial target: dfsnode_client <host:port>
    if (argc > 1) {
      cli.execute("connect " + std::string(argv[1]));
    }

    cli.run();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
