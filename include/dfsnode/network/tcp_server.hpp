#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "dfsnode/logger/logger.hpp"
#include "dfsnode/network/connection.hpp"
#include "dfsnode/network/protocol_dispatcher.hpp"

namespace dfsnode {
namespace network {

class TCP_Server {
public:

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see get_port()
  TCP_Server(const std::string& address, uint16_t port, ProtocolDispatcher& dispatcher,
             logging::Logger& logger, Connection::Duration transfer_timeout = Connection::Duration::zero());
  ~TCP_Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Bound port, valid once the listener started
  uint16_t get_port() const { return bound_port_; }
  std::size_t active_connections();

private:
  // One accepted connection and the thread serving it
  struct Session {
    std::shared_ptr<Connection> connection;
    std::thread worker;
    bool finished = false;
  };

  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  std::atomic<uint16_t> bound_port_{0};
  const Connection::Duration transfer_timeout_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Live connections
  std::mutex sessions_mutex_;
  std::map<uint64_t, Session> sessions_;
  uint64_t next_session_id_ = 0;

  // System components
  ProtocolDispatcher& dispatcher_;
  logging::Logger& logger_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Starts a worker thread for an accepted connection
  void spawn_session(std::shared_ptr<Connection> connection);
  // Worker body: one request, then close
  void run_session(uint64_t session_id, std::shared_ptr<Connection> connection);
  // Joins workers that have finished; caller holds sessions_mutex_
  void reap_finished_sessions();
};

} // namespace network
} // namespace dfsnode
