#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "dfsnode/common/error.hpp"
#include "dfsnode/logger/logger.hpp"

namespace dfsnode {
namespace store {

// Flat directory holding one storage node's files
class NodeStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The directory itself is created lazily on the first write
  NodeStore(const std::filesystem::path& base_path, logging::Logger& logger);


  // ---- PATH RESOLUTION ----
  // Strips any directory part from filename; throws InvalidIdentifier when
  // nothing usable is left ("", ".", "..")
  static std::string sanitize_filename(const std::string& filename);
  // Path of the sanitized filename inside the store
  std::filesystem::path resolve(const std::string& filename) const;


  // ---- QUERY OPERATIONS ----
  // Checks if a regular file exists under the given name
  bool has(const std::string& filename) const;
  // Returns the size of the stored file in bytes, throws FILE_NOT_FOUND
  std::uintmax_t get_file_size(const std::string& filename) const;
  const std::filesystem::path& base_path() const { return base_path_; }


  // ---- MAINTENANCE ----
  // Creates the store directory if it does not exist yet
  void ensure_directory() const;
  // Removes every stored file and recreates the empty directory
  void clear();

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;
  logging::Logger& logger_;
};

} // namespace store
} // namespace dfsnode
