#include "dfsnode/cleanup/cleaner.hpp"
#include "dfsnode/config/cluster_config.hpp"
#include "dfsnode/logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace {

struct ProgramOptions {
  std::string config_file = dfsnode::config::DEFAULT_CONFIG_FILE;
  bool all{false};
  bool logs{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [--all | --logs] [-c <config>]\n"
            << "  --all          Clean logs, storage, intermediate files and the registry\n"
            << "  --logs         Clean only logs\n"
            << "  -c, --config   Cluster configuration file (default: machines.cfg)\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag == "--all") {
      options.all = true;
    } else if (flag == "--logs") {
      options.logs = true;
    } else if ((flag == "-c" || flag == "--config") && i + 1 < argc) {
      options.config_file = argv[++i];
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  if (!options.all && !options.logs) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    dfsnode::config::ClusterConfig config = dfsnode::config::ClusterConfig::load(options.config_file);

    // Log to the console only; the logs directory may be about to disappear
    dfsnode::logging::init_console_logging(dfsnode::logging::severity_level::info);
    auto logger = dfsnode::logging::make_logger("cleanup");

    dfsnode::cleanup::Cleaner cleaner(std::filesystem::current_path(), logger);
    if (options.all) {
      cleaner.clean_all(config);
    } else {
      cleaner.clean_logs(config.log_dir);
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
