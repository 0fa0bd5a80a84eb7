#include "dfsnode/cleanup/cleaner.hpp"
#include "dfsnode/common/error.hpp"
#include <sqlite3.h>
#include <iostream>
#include <string>

namespace dfsnode {
namespace cleanup {

namespace {

// Owns one open registry database handle
class RegistryConnection {
public:
  explicit RegistryConnection(const std::filesystem::path& database) {
    int rc = sqlite3_open_v2(database.string().c_str(), &db_, SQLITE_OPEN_READWRITE, nullptr);
    if (rc != SQLITE_OK) {
      std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
      sqlite3_close(db_);
      throw IOFailure("cannot open registry " + database.string() + ": " + message);
    }
  }

  ~RegistryConnection() {
    sqlite3_close(db_);
  }

  RegistryConnection(const RegistryConnection&) = delete;
  RegistryConnection& operator=(const RegistryConnection&) = delete;

  std::vector<std::string> table_names() {
    sqlite3_stmt* statement = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT name FROM sqlite_master WHERE type='table'", -1, &statement, nullptr)
        != SQLITE_OK) {
      throw IOFailure(std::string("cannot list registry tables: ") + sqlite3_errmsg(db_));
    }

    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(statement)) == SQLITE_ROW) {
      names.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(statement, 0)));
    }
    sqlite3_finalize(statement);

    if (rc != SQLITE_DONE) {
      throw IOFailure(std::string("cannot list registry tables: ") + sqlite3_errmsg(db_));
    }
    return names;
  }

  void execute(const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
      std::string message = error ? error : sqlite3_errmsg(db_);
      sqlite3_free(error);
      throw IOFailure("registry statement '" + sql + "' failed: " + message);
    }
  }

private:
  sqlite3* db_ = nullptr;
};

std::string quote_identifier(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  return quoted + "\"";
}

} // namespace

Cleaner::Cleaner(const std::filesystem::path& project_root, logging::Logger& logger)
  : project_root_(project_root)
  , logger_(logger) {
}

bool Cleaner::clean_logs(const std::filesystem::path& log_dir) {
  return silent_dir_delete(absolute(log_dir));
}

bool Cleaner::clean_storage(const std::filesystem::path& storage_root,
                            const std::vector<node::NodeIdentity>& nodes) {
  bool removed = false;
  for (const auto& node : nodes) {
    removed |= silent_dir_delete(absolute(storage_root / node.storage_dir()));
  }
  return removed;
}

bool Cleaner::clean_master_intermediate() {
  return silent_dir_delete(absolute(MASTER_INTERMEDIATE_DIR));
}

bool Cleaner::clean_received_files() {
  return silent_dir_delete(absolute(RECEIVED_FILES_DIR));
}

bool Cleaner::clean_registry(const std::filesystem::path& database) {
  const std::filesystem::path db_path = absolute(database);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(db_path, ec)) {
    DFSNODE_LOG_DEBUG(logger_) << "Cleanup: No registry database at " << db_path.string();
    return false;
  }

  try {
    RegistryConnection registry(db_path);
    std::vector<std::string> tables = registry.table_names();

    registry.execute("BEGIN");
    try {
      for (const auto& table : tables) {
        std::cout << "Deleting table: " << table << std::endl;
        registry.execute("DELETE FROM " + quote_identifier(table));
      }
      registry.execute("COMMIT");
    } catch (const NodeError&) {
      registry.execute("ROLLBACK");
      throw;
    }

    DFSNODE_LOG_DEBUG(logger_) << "Cleanup: Emptied " << tables.size() << " tables in " << db_path.string();
    return !tables.empty();
  } catch (const NodeError& e) {
    DFSNODE_LOG_WARN(logger_) << "Cleanup: Could not reset registry: " << e.what();
    return false;
  }
}

bool Cleaner::clean_all(const config::ClusterConfig& config) {
  DFSNODE_LOG_INFO(logger_) << "Cleanup: Resetting node filesystems and registry " << config.database;

  bool removed = clean_logs(config.log_dir);
  removed |= clean_storage(config.storage_root, config.storage_nodes);
  removed |= clean_master_intermediate();
  removed |= clean_received_files();
  removed |= clean_registry(config.database);
  return removed;
}

bool Cleaner::silent_dir_delete(const std::filesystem::path& dir_path) {
  std::cout << "Deleting dir: " << dir_path.string() << std::endl;

  std::error_code ec;
  std::uintmax_t removed = std::filesystem::remove_all(dir_path, ec);
  if (ec) {
    DFSNODE_LOG_WARN(logger_) << "Cleanup: Could not delete " << dir_path.string() << ": " << ec.message();
    return false;
  }

  DFSNODE_LOG_DEBUG(logger_) << "Cleanup: Removed " << removed << " entries under " << dir_path.string();
  return removed > 0;
}

std::filesystem::path Cleaner::absolute(const std::filesystem::path& path) const {
  return path.is_absolute() ? path : project_root_ / path;
}

} // namespace cleanup
} // namespace dfsnode
