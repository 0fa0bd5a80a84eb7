#ifndef DFSNODE_NETWORK_CONNECTION_HPP
#define DFSNODE_NETWORK_CONNECTION_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "dfsnode/common/error.hpp"

namespace dfsnode {
namespace network {

// A single TCP socket driven by its own io_context. All operations block the
// calling thread; when a timeout is set each operation fails with
// TransferTimeout once it has made no progress for that long.
class Connection {
public:
  using Duration = std::chrono::milliseconds;

  // Delete copy operations to prevent socket duplication
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // A zero timeout waits forever
  explicit Connection(Duration timeout = Duration::zero());
  ~Connection();


  // ---- CONNECTION SETUP AND TEARDOWN ----
  // Resolves and connects to the remote node, throws ConnectionFailed
  void connect(const std::string& remote_address, uint16_t remote_port);
  // Signals end of outgoing data while keeping the read side open
  void shutdown_send();
  void close();
  // Closes the socket from any thread; pending operations fail
  void stop();
  bool is_open() const;


  // ---- RAW BYTE I/O ----
  // Reads at most size bytes, returns 0 once the peer has closed the stream
  std::size_t read_some(void* data, std::size_t size);
  // Reads exactly size bytes, throws TransferTruncated on early close
  void read_exact(void* data, std::size_t size);
  void write_all(const void* data, std::size_t size);


  // ---- CONTROL FRAMES ----
  // Length-prefixed text message
  std::string read_frame();
  void write_frame(const std::string& body);


  // ---- GETTERS AND SETTERS ----
  boost::asio::ip::tcp::socket& get_socket() { return *socket_; }
  std::string remote_endpoint() const;
  std::string local_endpoint() const;
  void set_timeout(Duration timeout) { timeout_ = timeout; }

private:
  using IoHandler = std::function<void(const boost::system::error_code&, std::size_t)>;

  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  Duration timeout_;


  // Starts one asynchronous operation and runs the io_context until it
  // completes or the timeout expires
  std::size_t run_operation(const std::function<void(IoHandler)>& start,
                            boost::system::error_code& ec, const char* what);
};

} // namespace network
} // namespace dfsnode

#endif // DFSNODE_NETWORK_CONNECTION_HPP
