#include "transport/relay_transport.hpp"
#include "protocol/codec.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace transport {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RelayTransport::RelayTransport(const std::string& host, uint16_t port)
  : host_(host),
  port_(port),
  socket_(io_context_) {
  BOOST_LOG_TRIVIAL(debug) << "Relay transport: Created for " << host << ":" << port;
}

RelayTransport::~RelayTransport() {
  close();
}


//==============================================
// CONNECTION CONTROL
//==============================================

void RelayTransport::connect() {
  if (connected_) {
    BOOST_LOG_TRIVIAL(debug) << "Relay transport: Already connected";
    return;
  }

  try {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_));
    boost::asio::connect(socket_, endpoints);
    socket_.set_option(boost::asio::ip::tcp::no_delay(true));
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Relay transport: Failed to connect to " << host_ << ":" << port_
                             << ": " << e.what();
    throw TransportError("Cannot connect to relay " + host_ + ":" + std::to_string(port_) + ": " + e.what());
  }

  connected_ = true;
  async_read_header();

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      auto work_guard = boost::asio::make_work_guard(io_context_);
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Relay transport: IO context error: " << e.what();
      connected_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Relay transport: Connected to " << host_ << ":" << port_;
}

void RelayTransport::close() {
  bool was_connected = connected_.exchange(false);

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
    io_thread_.reset();
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "Relay transport: Socket shutdown error: " << ec.message();
    }
    socket_.close(ec);
  }

  if (was_connected) {
    BOOST_LOG_TRIVIAL(info) << "Relay transport: Disconnected from " << host_ << ":" << port_;
  }
}


//==============================================
// TRANSPORT INTERFACE
//==============================================

void RelayTransport::publish(const protocol::Envelope& envelope) {
  if (!connected_) {
    throw TransportError("Not connected to relay");
  }

  std::string payload = protocol::Codec::encode(envelope);

  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    write_frame(socket_, payload);
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Relay transport: Failed to publish " << envelope.id << ": " << e.what();
    throw TransportError(std::string("Publish failed: ") + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Relay transport: Published " << protocol::to_string(envelope.kind)
                           << " " << envelope.id << " (" << payload.size() << " bytes)";
}

RelayTransport::SubscriptionId RelayTransport::subscribe(const protocol::Filter& filter, Handler handler) {
  SubscriptionId id = registry_.add(filter, std::move(handler));

  // Replay on the io thread so handlers always run there
  auto retained = registry_.retained_matching(filter);
  if (!retained.empty()) {
    boost::asio::post(io_context_, [this, id, retained = std::move(retained)]() {
      for (const auto& envelope : retained) {
        registry_.dispatch_to(id, envelope);
      }
    });
  }
  return id;
}

void RelayTransport::unsubscribe(SubscriptionId id) {
  registry_.remove(id);
}


//==============================================
// INCOMING FRAME PROCESSING
//==============================================

void RelayTransport::async_read_header() {
  boost::asio::async_read(
    socket_,
    boost::asio::buffer(header_),
    [this](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
          BOOST_LOG_TRIVIAL(warning) << "Relay transport: Connection lost: " << ec.message();
          connected_ = false;
        }
        return;
      }
      async_read_body();
    });
}

void RelayTransport::async_read_body() {
  uint64_t size = decode_frame_header(header_);
  if (size > protocol::Codec::MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Relay transport: Oversized frame of " << size << " bytes, closing";
    connected_ = false;
    boost::system::error_code ec;
    socket_.close(ec);
    return;
  }

  body_.assign(static_cast<std::size_t>(size), '\0');
  boost::asio::async_read(
    socket_,
    boost::asio::buffer(body_),
    [this](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
          BOOST_LOG_TRIVIAL(warning) << "Relay transport: Read error: " << ec.message();
          connected_ = false;
        }
        return;
      }
      handle_frame();
      async_read_header();
    });
}

void RelayTransport::handle_frame() {
  protocol::Envelope envelope;
  try {
    envelope = protocol::Codec::decode(body_);
  } catch (const protocol::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Relay transport: Discarding malformed frame: " << e.what();
    return;
  }

  registry_.retain(envelope);
  registry_.dispatch(envelope);
}

} // namespace transport
} // namespace blobdvm
