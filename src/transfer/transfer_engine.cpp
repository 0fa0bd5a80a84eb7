#include "dfsnode/transfer/transfer_engine.hpp"
#include "dfsnode/integrity/digest.hpp"
#include <algorithm>
#include <fstream>
#include <vector>

namespace dfsnode {
namespace transfer {

namespace {

// Progress is logged once per this many bytes
constexpr uint64_t PROGRESS_LOG_INTERVAL = 1024 * 1024;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferEngine::TransferEngine(logging::Logger& logger, std::size_t chunk_size)
  : logger_(logger)
  , chunk_size_(chunk_size == 0 ? network::BUFFER_SIZE : chunk_size) {
  DFSNODE_LOG_DEBUG(logger_) << "Transfer engine: Using chunk size " << chunk_size_;
}


//==============================================
// RECEIVING
//==============================================

Outcome TransferEngine::receive(network::Connection& connection, const std::filesystem::path& dest_path,
                                uint64_t declared_size, const std::string& expected_hash) {
  const std::string filename = dest_path.filename().string();
  uint64_t total_bytes_read = 0;

  DFSNODE_LOG_DEBUG(logger_) << "Transfer engine: Initiating file transfer from " << connection.remote_endpoint()
                             << " to " << connection.local_endpoint() << " (" << declared_size << " bytes)";

  try {
    // Create the destination directory if it does not exist yet
    std::filesystem::path storage_dir = dest_path.parent_path();
    if (!storage_dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(storage_dir, ec);
      if (ec) {
        throw IOFailure("cannot create directory " + storage_dir.string() + ": " + ec.message());
      }
    }

    {
      std::ofstream file(dest_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw IOFailure("cannot open " + dest_path.string() + " for writing");
      }

      std::vector<char> buffer(chunk_size_);

      // Never read past the declared size; whatever follows belongs to the peer
      while (total_bytes_read < declared_size) {
        std::size_t bytes_wanted = static_cast<std::size_t>(
          std::min<uint64_t>(chunk_size_, declared_size - total_bytes_read));

        std::size_t bytes_read = connection.read_some(buffer.data(), bytes_wanted);
        if (bytes_read == 0) {
          // Peer closed the stream
          break;
        }

        file.write(buffer.data(), static_cast<std::streamsize>(bytes_read));
        if (!file) {
          throw IOFailure("failed writing to " + dest_path.string());
        }

        total_bytes_read += bytes_read;
        report_progress("Receiving " + filename, total_bytes_read, declared_size);
      }

      file.close();
      if (!file) {
        throw IOFailure("failed to flush " + dest_path.string());
      }
    }

    if (total_bytes_read != declared_size) {
      discard_partial(dest_path);
      std::string message = "Transfer truncated: received " + std::to_string(total_bytes_read) +
                            " of " + std::to_string(declared_size) + " bytes for " + filename;
      DFSNODE_LOG_ERROR(logger_) << "Transfer engine: " << message;
      return Outcome::failure(ErrorKind::TRANSFER_TRUNCATED, message, total_bytes_read);
    }

    integrity::verify(dest_path, expected_hash);

    std::string message = dest_path.string() + " saved successfully. Integrity check passed.";
    DFSNODE_LOG_DEBUG(logger_) << "Transfer engine: " << message;
    return Outcome::success(total_bytes_read, message);
  }
  catch (const IntegrityMismatch& e) {
    // The complete file stays on disk for inspection
    DFSNODE_LOG_ERROR(logger_) << "Transfer engine: " << e.what();
    return Outcome::failure(ErrorKind::INTEGRITY_MISMATCH, e.what(), total_bytes_read);
  }
  catch (const NodeError& e) {
    discard_partial(dest_path);
    DFSNODE_LOG_ERROR(logger_) << "Transfer engine: Receiving " << filename << " failed: " << e.what();
    return Outcome::failure(e.kind(), e.what(), total_bytes_read);
  }
  catch (const std::exception& e) {
    discard_partial(dest_path);
    DFSNODE_LOG_ERROR(logger_) << "Transfer engine: Receiving " << filename << " failed: " << e.what();
    return Outcome::failure(ErrorKind::IO_FAILURE, e.what(), total_bytes_read);
  }
}


//==============================================
// SENDING
//==============================================

SourceFile TransferEngine::open_source(const std::filesystem::path& src_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(src_path, ec)) {
    throw IOFailure("File not valid: " + src_path.string());
  }

  SourceFile source;
  source.path = src_path;

  // Size for the receiver's loop bound, hash for its integrity check
  source.header.filename = src_path.filename().string();
  source.header.file_size = std::filesystem::file_size(src_path, ec);
  if (ec) {
    throw IOFailure("cannot stat " + src_path.string() + ": " + ec.message());
  }
  source.header.file_hash = integrity::digest(src_path);

  source.stream.open(src_path, std::ios::binary);
  if (!source.stream) {
    throw IOFailure("cannot open " + src_path.string() + " for reading");
  }
  return source;
}

Outcome TransferEngine::send(network::Connection& connection, const std::filesystem::path& src_path,
                             const std::string& header_type) {
  SourceFile source;
  try {
    source = open_source(src_path);
  }
  catch (const NodeError& e) {
    DFSNODE_LOG_ERROR(logger_) << "Transfer engine: Sending " << src_path.string() << " failed: " << e.what();
    return Outcome::failure(e.kind(), e.what());
  }
  return send(connection, source, header_type);
}

Outcome TransferEngine::send(network::Connection& connection, SourceFile& source,
                             const std::string& header_type) {
  const std::string label = source.path.string();
  const uint64_t file_size = source.header.file_size;
  uint64_t total_bytes_sent = 0;

  try {
    DFSNODE_LOG_DEBUG(logger_) << "Transfer engine: Sending " << label << " (" << file_size
                               << " bytes, md5 " << source.header.file_hash << ") to " << connection.remote_endpoint();
    connection.write_frame(network::make_file_header(source.header, header_type));

    std::vector<char> buffer(chunk_size_);
    while (total_bytes_sent < file_size) {
      std::size_t bytes_wanted = static_cast<std::size_t>(
        std::min<uint64_t>(chunk_size_, file_size - total_bytes_sent));

      source.stream.read(buffer.data(), static_cast<std::streamsize>(bytes_wanted));
      std::size_t bytes_read = static_cast<std::size_t>(source.stream.gcount());
      if (bytes_read == 0) {
        // File shrank after its size was taken
        break;
      }

      connection.write_all(buffer.data(), bytes_read);
      total_bytes_sent += bytes_read;
      report_progress("Sending " + label, total_bytes_sent, file_size);
    }

    if (total_bytes_sent != file_size) {
      std::string message = "Transfer truncated: sent " + std::to_string(total_bytes_sent) + " of " +
                            std::to_string(file_size) + " bytes of " + label;
      DFSNODE_LOG_ERROR(logger_) << "Transfer engine: " << message;
      return Outcome::failure(ErrorKind::TRANSFER_TRUNCATED, message, total_bytes_sent);
    }

    return Outcome::success(total_bytes_sent, "File " + label + " sent.");
  }
  catch (const NodeError& e) {
    DFSNODE_LOG_ERROR(logger_) << "Transfer engine: Sending " << label << " failed: " << e.what();
    return Outcome::failure(e.kind(), e.what(), total_bytes_sent);
  }
  catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "Transfer engine: Sending " << label << " failed: " << e.what();
    return Outcome::failure(ErrorKind::IO_FAILURE, e.what(), total_bytes_sent);
  }
}


//==============================================
// PROGRESS ACCOUNTING
//==============================================

void TransferEngine::report_progress(const std::string& label, uint64_t bytes_done, uint64_t total_bytes) {
  if (progress_callback_) {
    progress_callback_(bytes_done, total_bytes);
  }

  // Log on crossing each interval boundary and on completion
  uint64_t previous = bytes_done > chunk_size_ ? bytes_done - chunk_size_ : 0;
  if (bytes_done == total_bytes || previous / PROGRESS_LOG_INTERVAL != bytes_done / PROGRESS_LOG_INTERVAL) {
    DFSNODE_LOG_TRACE(logger_) << "Transfer engine: " << label << ": " << bytes_done << " / " << total_bytes << " bytes";
  }
}

void TransferEngine::discard_partial(const std::filesystem::path& dest_path) {
  std::error_code ec;
  if (std::filesystem::remove(dest_path, ec)) {
    DFSNODE_LOG_DEBUG(logger_) << "Transfer engine: Removed partial file " << dest_path.string();
  } else if (ec) {
    DFSNODE_LOG_WARN(logger_) << "Transfer engine: Could not remove partial file " << dest_path.string()
                              << ": " << ec.message();
  }
}

} // namespace transfer
} // namespace dfsnode
