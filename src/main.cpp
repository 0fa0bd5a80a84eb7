#include "dfsnode/config/cluster_config.hpp"
#include "dfsnode/logger/logger.hpp"
#include "dfsnode/network/protocol_dispatcher.hpp"
#include "dfsnode/network/tcp_server.hpp"
#include "dfsnode/node/node_identity.hpp"
#include "dfsnode/store/node_store.hpp"
#include "dfsnode/transfer/transfer_engine.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

namespace {

constexpr const char* LOG_DIR = "logs";

struct ProgramOptions {
  std::string config_file = dfsnode::config::DEFAULT_CONFIG_FILE;
  std::optional<std::size_t> node_index;
  std::string host;
  uint16_t port{0};
  std::string storage_root;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -n <index> [-c <config>]\n"
            << "       " << program_name << " -h <host> -p <port> [-s <storage_root>]\n"
            << "Arguments:\n"
            << "  -c, --config        Cluster configuration file (default: machines.cfg)\n"
            << "  -n, --node          Index of this node in [storage_nodes] machine_list\n"
            << "  -h, --host          Host address to bind\n"
            << "  -p, --port          Port number to bind\n"
            << "  -s, --storage-root  Directory holding storage_<host>_<port>\n"
            << "Example: " << program_name << " -n 0 -c machines.cfg\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-c", "--config", "-n", "--node", "-h", "--host", "-p", "--port", "-s", "--storage-root"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every argument needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-c" || flag == "--config") {
        options.config_file = value;
      } else if (flag == "-n" || flag == "--node") {
        options.node_index = static_cast<std::size_t>(std::stoul(value));
      } else if (flag == "-h" || flag == "--host") {
        options.host = value;
      } else if (flag == "-p" || flag == "--port") {
        options.port = dfsnode::node::parse_port(value);
      } else if (flag == "-s" || flag == "--storage-root") {
        options.storage_root = value;
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (!options.node_index && (options.host.empty() || options.port == 0)) {
    std::cerr << "Error: Either a node index or both host and port are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

// Resolves identity and cluster settings from the options and the config file
bool resolve_node(const ProgramOptions& options, dfsnode::node::NodeIdentity& identity,
                  dfsnode::config::ClusterConfig& config) {
  try {
    if (options.node_index) {
      config = dfsnode::config::ClusterConfig::load(options.config_file);
      identity = config.storage_node(*options.node_index);
    } else {
      identity.host = options.host;
      identity.port = options.port;
    }
    if (!options.storage_root.empty()) {
      config.storage_root = options.storage_root;
    }
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

bool run_node(const dfsnode::node::NodeIdentity& identity, const dfsnode::config::ClusterConfig& config) {
  const std::string log_file = "node_" + identity.host + "_" + std::to_string(identity.port) + ".log";

  try {
    dfsnode::logging::init_logging(config.log_dir.empty() ? LOG_DIR : config.log_dir, log_file);
    auto logger = dfsnode::logging::make_logger("node " + identity.endpoint());

    dfsnode::store::NodeStore store(config.storage_root / identity.storage_dir(), logger);
    dfsnode::transfer::TransferEngine engine(logger);
    dfsnode::network::ProtocolDispatcher dispatcher(store, engine, logger);
    dfsnode::network::TCP_Server server(identity.host, identity.port, dispatcher, logger,
                                        config.transfer_timeout);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start node on " << identity.endpoint() << '\n';
      return false;
    }
    DFSNODE_LOG_INFO(logger) << "Starting server on " << identity.endpoint();

    // Serve until interrupted
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        DFSNODE_LOG_INFO(logger) << "Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Storage node failed: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  dfsnode::node::NodeIdentity identity;
  dfsnode::config::ClusterConfig config;
  if (!resolve_node(options, identity, config)) {
    return 1;
  }

  return run_node(identity, config) ? 0 : 1;
}
