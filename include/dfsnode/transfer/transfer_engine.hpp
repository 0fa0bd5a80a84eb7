#ifndef DFSNODE_TRANSFER_ENGINE_HPP
#define DFSNODE_TRANSFER_ENGINE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include "dfsnode/common/error.hpp"
#include "dfsnode/logger/logger.hpp"
#include "dfsnode/network/connection.hpp"
#include "dfsnode/network/protocol.hpp"

namespace dfsnode {
namespace transfer {

// A file opened for sending, with the header that announces it
struct SourceFile {
  std::filesystem::path path;
  network::FileHeader header;
  std::ifstream stream;
};

class TransferEngine {
public:
  // Invoked after every chunk with (bytes moved so far, total bytes)
  using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TransferEngine(logging::Logger& logger, std::size_t chunk_size = network::BUFFER_SIZE);


  // ---- TRANSFER OPERATIONS ----
  // Copies declared_size bytes from the connection into dest_path and
  // verifies them against expected_hash.
  //   TRANSFER_TRUNCATED - peer closed early, partial file removed
  //   TRANSFER_TIMEOUT   - peer stalled, partial file removed
  //   INTEGRITY_MISMATCH - all bytes arrived but the digest differs, file kept
  //   IO_FAILURE         - the destination could not be created or written
  Outcome receive(network::Connection& connection, const std::filesystem::path& dest_path,
                  uint64_t declared_size, const std::string& expected_hash);

  // Takes size and digest of src_path and opens it. Nothing is written, so a
  // caller can still answer the peer if this throws IOFailure.
  SourceFile open_source(const std::filesystem::path& src_path);

  // Writes the <type><>filename<>size<>hash header followed by the file
  // contents. Reads no acknowledgment.
  Outcome send(network::Connection& connection, const std::filesystem::path& src_path,
               const std::string& header_type = network::PUT_REQUEST);
  Outcome send(network::Connection& connection, SourceFile& source,
               const std::string& header_type = network::PUT_REQUEST);


  // ---- GETTERS AND SETTERS ----
  void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
  std::size_t get_chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  logging::Logger& logger_;
  std::size_t chunk_size_;
  ProgressCallback progress_callback_;


  // ---- PROGRESS ACCOUNTING ----
  void report_progress(const std::string& label, uint64_t bytes_done, uint64_t total_bytes);
  // Removes a partially received file, logging instead of throwing
  void discard_partial(const std::filesystem::path& dest_path);
};

} // namespace transfer
} // namespace dfsnode

#endif // DFSNODE_TRANSFER_ENGINE_HPP
