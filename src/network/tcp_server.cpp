#include "dfsnode/network/tcp_server.hpp"
#include <vector>

namespace dfsnode {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const std::string& address, uint16_t port, ProtocolDispatcher& dispatcher,
                       logging::Logger& logger, Connection::Duration transfer_timeout)
  : address_(address)
  , port_(port)
  , transfer_timeout_(transfer_timeout)
  , dispatcher_(dispatcher)
  , logger_(logger) {
  DFSNODE_LOG_INFO(logger_) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    DFSNODE_LOG_WARN(logger_) << "TCP server: Server already running";
    return false;
  }

  try {
    // Resolve the bind address, which may be a host name from the config
    boost::asio::ip::tcp::resolver resolver(io_context_);
    boost::asio::ip::tcp::endpoint endpoint =
      resolver.resolve(address_, std::to_string(port_))->endpoint();

    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    // Start accepting connections
    DFSNODE_LOG_DEBUG(logger_) << "TCP server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_context_.restart();
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        DFSNODE_LOG_ERROR(logger_) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    DFSNODE_LOG_INFO(logger_) << "TCP server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection gets its own io_context so its worker can block on it
  auto connection = std::make_shared<Connection>(transfer_timeout_);

  acceptor_->async_accept(connection->get_socket(),
    [this, connection](const boost::system::error_code& error) {
      if (error == boost::asio::error::operation_aborted) {
        return;  // Acceptor closed during shutdown
      }

      if (!error) {
        spawn_session(connection);
      } else {
        DFSNODE_LOG_ERROR(logger_) << "TCP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  DFSNODE_LOG_INFO(logger_) << "TCP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      DFSNODE_LOG_ERROR(logger_) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context and wait for io_thread to finish
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  // Interrupt live connections and wait for their workers
  std::map<uint64_t, Session> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& entry : sessions) {
    entry.second.connection->stop();
  }
  for (auto& entry : sessions) {
    if (entry.second.worker.joinable()) {
      entry.second.worker.join();
    }
  }

  DFSNODE_LOG_INFO(logger_) << "TCP server: Server shutdown complete";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void TCP_Server::spawn_session(std::shared_ptr<Connection> connection) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  reap_finished_sessions();

  uint64_t session_id = next_session_id_++;
  DFSNODE_LOG_DEBUG(logger_) << "TCP server: Accepted connection " << session_id << " from "
                             << connection->remote_endpoint();

  Session& session = sessions_[session_id];
  session.connection = connection;
  session.worker = std::thread(&TCP_Server::run_session, this, session_id, connection);
}

void TCP_Server::run_session(uint64_t session_id, std::shared_ptr<Connection> connection) {
  // A failure here must never reach the accept loop or other connections
  try {
    dispatcher_.handle(*connection);
  } catch (const std::exception& e) {
    DFSNODE_LOG_ERROR(logger_) << "TCP server: Connection " << session_id << " failed: " << e.what();
  }
  connection->close();

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.finished = true;
  }
}

void TCP_Server::reap_finished_sessions() {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.finished) {
      if (it->second.worker.joinable()) {
        it->second.worker.join();
      }
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t TCP_Server::active_connections() {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  std::size_t active = 0;
  for (const auto& entry : sessions_) {
    if (!entry.second.finished) {
      ++active;
    }
  }
  return active;
}

} // namespace network
} // namespace dfsnode
