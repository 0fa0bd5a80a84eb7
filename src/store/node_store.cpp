#include "dfsnode/store/node_store.hpp"

namespace dfsnode {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeStore::NodeStore(const std::filesystem::path& base_path, logging::Logger& logger)
  : base_path_(base_path)
  , logger_(logger) {
  DFSNODE_LOG_INFO(logger_) << "Store: Using storage directory: " << base_path_.string();
}


//==============================================
// PATH RESOLUTION
//==============================================

std::string NodeStore::sanitize_filename(const std::string& filename) {
  // Remove absolute or relative directory parts if there are any
  std::string base_name = std::filesystem::path(filename).filename().string();

  if (base_name.empty() || base_name == "." || base_name == "..") {
    throw InvalidIdentifier("filename '" + filename + "'");
  }
  return base_name;
}

std::filesystem::path NodeStore::resolve(const std::string& filename) const {
  std::filesystem::path file_path = base_path_ / sanitize_filename(filename);
  DFSNODE_LOG_TRACE(logger_) << "Store: Resolved " << filename << " to " << file_path.string();
  return file_path;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool NodeStore::has(const std::string& filename) const {
  std::filesystem::path file_path = resolve(filename);
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(file_path, ec);

  DFSNODE_LOG_DEBUG(logger_) << "Store: " << filename << (exists ? " exists" : " not found")
                             << " at path: " << file_path.string();
  return exists;
}

std::uintmax_t NodeStore::get_file_size(const std::string& filename) const {
  std::filesystem::path file_path = resolve(filename);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    DFSNODE_LOG_ERROR(logger_) << "Store: File not found: " << file_path.string();
    throw NodeError(ErrorKind::FILE_NOT_FOUND, "File not found: " + filename);
  }

  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw IOFailure("cannot stat " + file_path.string() + ": " + ec.message());
  }
  return size;
}


//==============================================
// MAINTENANCE
//==============================================

void NodeStore::ensure_directory() const {
  std::error_code ec;
  // create_directories is a no-op for an existing directory
  std::filesystem::create_directories(base_path_, ec);
  if (ec) {
    DFSNODE_LOG_ERROR(logger_) << "Store: Failed to create " << base_path_.string() << ": " << ec.message();
    throw IOFailure("cannot create directory " + base_path_.string() + ": " + ec.message());
  }
}

void NodeStore::clear() {
  DFSNODE_LOG_INFO(logger_) << "Store: Clearing entire store at: " << base_path_.string();

  std::error_code ec;
  std::filesystem::remove_all(base_path_, ec);
  if (ec) {
    throw IOFailure("cannot clear " + base_path_.string() + ": " + ec.message());
  }
  ensure_directory();
  DFSNODE_LOG_INFO(logger_) << "Store: Store cleared successfully";
}

} // namespace store
} // namespace dfsnode
