#include "dfsnode/network/connection.hpp"
#include "dfsnode/network/protocol.hpp"
#include <vector>

namespace dfsnode {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection(Duration timeout)
  : socket_(std::make_unique<boost::asio::ip::tcp::socket>(io_context_))
  , timeout_(timeout) {
}

// Cleanup connection on destruction
Connection::~Connection() {
  close();
}


//==============================================
// CONNECTION SETUP AND TEARDOWN
//==============================================

void Connection::connect(const std::string& remote_address, uint16_t remote_port) {
  try {
    // Resolve remote address to endpoints
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(remote_address, std::to_string(remote_port));

    // Connect to the first available endpoint
    boost::asio::connect(*socket_, endpoints);
  }
  catch (const boost::system::system_error& e) {
    throw ConnectionFailed(remote_address + ":" + std::to_string(remote_port) + ": " + e.what());
  }
}

void Connection::shutdown_send() {
  boost::system::error_code ec;
  socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    throw ConnectionFailed("shutdown failed: " + ec.message());
  }
}

void Connection::close() {
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;

    // Shutdown both send and receive operations, then release the socket.
    // Errors are expected here when the peer already went away.
    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_->close(ec);
  }
}

void Connection::stop() {
  boost::asio::post(io_context_, [this]() { close(); });
}

bool Connection::is_open() const {
  return socket_ && socket_->is_open();
}


//==============================================
// RAW BYTE I/O
//==============================================

std::size_t Connection::run_operation(const std::function<void(IoHandler)>& start,
                                      boost::system::error_code& ec, const char* what) {
  bool completed = false;
  std::size_t bytes_transferred = 0;

  start([&](const boost::system::error_code& error, std::size_t bytes) {
    completed = true;
    ec = error;
    bytes_transferred = bytes;
  });

  io_context_.restart();
  if (timeout_ > Duration::zero()) {
    io_context_.run_for(timeout_);
  } else {
    io_context_.run();
  }

  if (!completed) {
    // Abort the stalled operation and let its handler run before returning
    boost::system::error_code ignored;
    socket_->cancel(ignored);
    io_context_.restart();
    io_context_.run();
    throw TransferTimeout(std::string(what) + " made no progress for " +
                          std::to_string(timeout_.count()) + " ms");
  }

  return bytes_transferred;
}

std::size_t Connection::read_some(void* data, std::size_t size) {
  if (size == 0) {
    return 0;
  }

  boost::system::error_code ec;
  std::size_t bytes_read = run_operation(
    [this, data, size](IoHandler handler) {
      socket_->async_read_some(boost::asio::buffer(data, size), handler);
    },
    ec, "read");

  if (ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset) {
    // Nothing more will arrive
    return bytes_read;
  }
  if (ec) {
    throw ConnectionFailed("read failed: " + ec.message());
  }
  return bytes_read;
}

void Connection::read_exact(void* data, std::size_t size) {
  std::size_t total_bytes_read = 0;
  auto* bytes = static_cast<uint8_t*>(data);

  while (total_bytes_read < size) {
    std::size_t bytes_read = read_some(bytes + total_bytes_read, size - total_bytes_read);
    if (bytes_read == 0) {
      throw TransferTruncated("peer closed after " + std::to_string(total_bytes_read) +
                              " of " + std::to_string(size) + " bytes");
    }
    total_bytes_read += bytes_read;
  }
}

void Connection::write_all(const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }

  boost::system::error_code ec;
  std::size_t bytes_written = run_operation(
    [this, data, size](IoHandler handler) {
      boost::asio::async_write(*socket_, boost::asio::buffer(data, size), handler);
    },
    ec, "write");

  if (ec || bytes_written != size) {
    throw ConnectionFailed("write failed after " + std::to_string(bytes_written) +
                           " of " + std::to_string(size) + " bytes: " + ec.message());
  }
}


//==============================================
// CONTROL FRAMES
//==============================================

std::string Connection::read_frame() {
  uint8_t prefix[sizeof(uint32_t)];
  read_exact(prefix, sizeof(prefix));

  uint32_t length = decode_frame_length(prefix);
  if (length > MAX_FRAME_SIZE) {
    throw MalformedRequest("frame of " + std::to_string(length) + " bytes exceeds the " +
                           std::to_string(MAX_FRAME_SIZE) + " byte limit");
  }

  std::string body(length, '\0');
  if (length > 0) {
    read_exact(&body[0], length);
  }
  return body;
}

void Connection::write_frame(const std::string& body) {
  if (body.size() > MAX_FRAME_SIZE) {
    throw MalformedRequest("frame of " + std::to_string(body.size()) + " bytes exceeds the limit");
  }

  // Prefix and body go out in one write
  std::vector<uint8_t> frame = encode_frame_length(static_cast<uint32_t>(body.size()));
  frame.insert(frame.end(), body.begin(), body.end());
  write_all(frame.data(), frame.size());
}


//==============================================
// GETTERS AND SETTERS
//==============================================

std::string Connection::remote_endpoint() const {
  boost::system::error_code ec;
  auto endpoint = socket_->remote_endpoint(ec);
  if (ec) {
    return "<disconnected>";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

std::string Connection::local_endpoint() const {
  boost::system::error_code ec;
  auto endpoint = socket_->local_endpoint(ec);
  if (ec) {
    return "<disconnected>";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace network
} // namespace dfsnode
