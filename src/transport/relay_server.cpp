#include "transport/relay_server.hpp"
#include "protocol/codec.hpp"
#include <vector>

namespace blobdvm {
namespace transport {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RelayServer::RelayServer(const std::string& address, uint16_t port)
  : address_(address)
  , port_(port) {
  BOOST_LOG_TRIVIAL(info) << "Relay server: Initializing relay on " << address << ":" << port;
}

RelayServer::~RelayServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool RelayServer::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Relay server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "Relay server: Starting to accept connections";
    start_accept();

    // Run io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Relay server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Relay server: Listening on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Relay server: Failed to start server: " << e.what();
    is_running_ = false;
    return false;
  }
}

void RelayServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Relay server: Initiating shutdown";

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Relay server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, connection] : connections_) {
    boost::system::error_code ec;
    connection->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    connection->socket.close(ec);
  }
  connections_.clear();

  BOOST_LOG_TRIVIAL(info) << "Relay server: Shutdown complete";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void RelayServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  std::shared_ptr<Connection> connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection = std::make_shared<Connection>(io_context_, next_connection_id_++);
  }

  acceptor_->async_accept(connection->socket,
    [this, connection](const boost::system::error_code& error) {
      if (!error) {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          connections_[connection->id] = connection;
        }
        BOOST_LOG_TRIVIAL(info) << "Relay server: Accepted connection " << connection->id;
        replay_retained(connection);
        async_read_header(connection);
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "Relay server: Accept error: " << error.message();
      }
      start_accept();
    });
}

void RelayServer::replay_retained(const std::shared_ptr<Connection>& connection) {
  std::vector<std::string> frames;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [author, frame] : retained_) {
      frames.push_back(frame.bytes);
    }
  }

  for (const auto& bytes : frames) {
    try {
      write_frame(connection->socket, bytes);
    } catch (const boost::system::system_error& e) {
      BOOST_LOG_TRIVIAL(warning) << "Relay server: Replay to connection " << connection->id
                                 << " failed: " << e.what();
      drop(connection);
      return;
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Relay server: Replayed " << frames.size()
                           << " announcement(s) to connection " << connection->id;
}

void RelayServer::drop(const std::shared_ptr<Connection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(connection->id) == 0) {
    return;
  }
  boost::system::error_code ec;
  connection->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  connection->socket.close(ec);
  BOOST_LOG_TRIVIAL(info) << "Relay server: Dropped connection " << connection->id;
}


//==============================================
// FRAME PROCESSING
//==============================================

void RelayServer::async_read_header(const std::shared_ptr<Connection>& connection) {
  boost::asio::async_read(
    connection->socket,
    boost::asio::buffer(connection->header),
    [this, connection](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
          BOOST_LOG_TRIVIAL(debug) << "Relay server: Connection " << connection->id
                                   << " closed: " << ec.message();
          drop(connection);
        }
        return;
      }
      async_read_body(connection);
    });
}

void RelayServer::async_read_body(const std::shared_ptr<Connection>& connection) {
  uint64_t size = decode_frame_header(connection->header);
  if (size > protocol::Codec::MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Relay server: Connection " << connection->id
                               << " sent oversized frame of " << size << " bytes";
    drop(connection);
    return;
  }

  connection->body.assign(static_cast<std::size_t>(size), '\0');
  boost::asio::async_read(
    connection->socket,
    boost::asio::buffer(connection->body),
    [this, connection](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
          BOOST_LOG_TRIVIAL(error) << "Relay server: Read error on connection " << connection->id
                                   << ": " << ec.message();
          drop(connection);
        }
        return;
      }
      handle_frame(connection);
      async_read_header(connection);
    });
}

void RelayServer::handle_frame(const std::shared_ptr<Connection>& connection) {
  protocol::Envelope envelope;
  try {
    envelope = protocol::Codec::decode(connection->body);
  } catch (const protocol::ProtocolError& e) {
    // Frame boundaries are intact, so only this frame is discarded
    BOOST_LOG_TRIVIAL(warning) << "Relay server: Discarding malformed frame from connection "
                               << connection->id << ": " << e.what();
    return;
  }

  if (envelope.kind == protocol::MessageKind::ANNOUNCEMENT) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retained_.find(envelope.author);
    if (it == retained_.end() || it->second.created_at <= envelope.created_at) {
      retained_[envelope.author] = RetainedFrame{envelope.created_at, connection->body};
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Relay server: Relaying " << protocol::to_string(envelope.kind)
                           << " " << envelope.id << " from connection " << connection->id;
  broadcast(connection->body);
}

void RelayServer::broadcast(const std::string& payload) {
  std::vector<std::shared_ptr<Connection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, connection] : connections_) {
      targets.push_back(connection);
    }
  }

  for (const auto& connection : targets) {
    try {
      write_frame(connection->socket, payload);
    } catch (const boost::system::system_error& e) {
      BOOST_LOG_TRIVIAL(warning) << "Relay server: Write to connection " << connection->id
                                 << " failed: " << e.what();
      drop(connection);
    }
  }
}


//==============================================
// GETTERS
//==============================================

std::size_t RelayServer::connection_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t RelayServer::retained_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retained_.size();
}

} // namespace transport
} // namespace blobdvm
