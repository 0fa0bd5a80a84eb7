#ifndef DFSNODE_CLEANUP_CLEANER_HPP
#define DFSNODE_CLEANUP_CLEANER_HPP

#include <filesystem>
#include <vector>
#include "dfsnode/config/cluster_config.hpp"
#include "dfsnode/logger/logger.hpp"
#include "dfsnode/node/node_identity.hpp"

namespace dfsnode {
namespace cleanup {

constexpr const char* RECEIVED_FILES_DIR = "received_files";
constexpr const char* MASTER_INTERMEDIATE_DIR = "master_interm";

// Resets the on-disk state of a deployment rooted at project_root. Every
// clean_* call returns whether something was actually removed or emptied.
class Cleaner {
public:
  Cleaner(const std::filesystem::path& project_root, logging::Logger& logger);

  bool clean_logs(const std::filesystem::path& log_dir);
  // Removes storage_<host>_<port> of every node under storage_root
  bool clean_storage(const std::filesystem::path& storage_root, const std::vector<node::NodeIdentity>& nodes);
  bool clean_master_intermediate();
  bool clean_received_files();
  // Deletes every row of every table in the SQLite registry. Tables are kept,
  // and a missing database is not an error.
  bool clean_registry(const std::filesystem::path& database);
  // Everything above, driven by the cluster configuration
  bool clean_all(const config::ClusterConfig& config);

private:
  std::filesystem::path project_root_;
  logging::Logger& logger_;

  // Missing directories are not an error
  bool silent_dir_delete(const std::filesystem::path& dir_path);
  std::filesystem::path absolute(const std::filesystem::path& path) const;
};

} // namespace cleanup
} // namespace dfsnode

#endif // DFSNODE_CLEANUP_CLEANER_HPP
