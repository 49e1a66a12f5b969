#include "server/blob_server.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobServer::BlobServer(transport::Transport& transport,
                       const config::StorageConfig& storage_config,
                       const config::ServerConfig& server_config,
                       StorageManager::ClockFn clock)
  : transport_(transport)
  , storage_(storage_config, std::move(clock))
  , server_config_(server_config)
  , identity_(server_config.identity.empty() ? crypto::random_hex_id() : server_config.identity) {
  BOOST_LOG_TRIVIAL(info) << "Blob server: Created with identity " << identity_;
}

BlobServer::~BlobServer() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

void BlobServer::start() {
  if (running_.exchange(true)) {
    BOOST_LOG_TRIVIAL(warning) << "Blob server: Already running";
    return;
  }

  worker_thread_ = std::make_unique<std::thread>(&BlobServer::worker_loop, this);

  protocol::Filter filter;
  filter.kinds = {protocol::MessageKind::REQUEST};
  filter.tags = {protocol::Tag{protocol::TAG_CAPABILITY, capability_address()}};
  subscription_ = transport_.subscribe(filter, [this](const protocol::Envelope& envelope) {
    on_request(envelope);
  });

  transport_.publish(protocol::encode_announcement(announcement()));
  BOOST_LOG_TRIVIAL(info) << "Blob server: Started, listening on " << capability_address();
}

void BlobServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Blob server: Stopping";
  transport_.unsubscribe(subscription_);
  job_queue_.close();

  if (worker_thread_ && worker_thread_->joinable()) {
    worker_thread_->join();
  }
  BOOST_LOG_TRIVIAL(info) << "Blob server: Stopped after " << processed_count_ << " request(s)";
}


//==============================================
// GETTERS
//==============================================

std::string BlobServer::capability_address() const {
  return protocol::capability_address(identity_);
}

protocol::ServerAnnouncement BlobServer::announcement() const {
  protocol::ServerAnnouncement announcement;
  announcement.identity = identity_;
  announcement.accepted_actions = {protocol::Action::STORE, protocol::Action::RETRIEVE,
                                   protocol::Action::DELETE};
  announcement.max_file_size = storage_.config().max_file_size;
  announcement.chunk_size = storage_.config().chunk_size;
  announcement.retention_seconds = storage_.config().retention_seconds;
  announcement.name = server_config_.name;
  announcement.about = server_config_.about;
  return announcement;
}


//==============================================
// TRANSPORT CALLBACK
//==============================================

void BlobServer::on_request(const protocol::Envelope& envelope) {
  // Transports may deliver more than the filter asked for
  if (!envelope.has_tag(protocol::TAG_CAPABILITY, capability_address())) {
    return;
  }
  if (!job_queue_.produce(envelope)) {
    BOOST_LOG_TRIVIAL(debug) << "Blob server: Dropping request " << envelope.id << ", shutting down";
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "Blob server: Queued request " << envelope.id;
}


//==============================================
// WORKER
//==============================================

void BlobServer::worker_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Blob server: Worker running";
  const auto poll_interval = std::chrono::milliseconds(server_config_.poll_interval_ms);

  // Expired records left from before start are removed right away
  sweep();

  // Runs until stop() closes the queue and every request accepted before
  // that has been answered
  protocol::Envelope envelope;
  while (true) {
    if (job_queue_.consume_for(envelope, poll_interval)) {
      process(envelope);
      ++processed_count_;
      record_count_ = storage_.record_count();
    } else if (job_queue_.closed()) {
      break;
    }
    if (running_) {
      sweep_if_due();
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Blob server: Worker stopped";
}

void BlobServer::sweep_if_due() {
  if (std::chrono::steady_clock::now() - last_sweep_ <
      std::chrono::milliseconds(server_config_.sweep_interval_ms)) {
    return;
  }
  sweep();
}

void BlobServer::sweep() {
  last_sweep_ = std::chrono::steady_clock::now();
  try {
    storage_.sweep();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob server: Expiry sweep failed: " << e.what();
  }
  record_count_ = storage_.record_count();
}

void BlobServer::process(const protocol::Envelope& envelope) {
  try {
    protocol::Request request = protocol::decode_request(envelope);
    BOOST_LOG_TRIVIAL(info) << "Blob server: Handling " << protocol::to_string(request.action())
                            << " request " << request.id << " from " << request.author;

    if (const auto* store = std::get_if<protocol::StoreRequest>(&request.payload)) {
      handle_store(request, *store);
    } else if (const auto* retrieve = std::get_if<protocol::RetrieveRequest>(&request.payload)) {
      handle_retrieve(request, *retrieve);
    } else {
      handle_delete(request, std::get<protocol::DeleteRequest>(request.payload));
    }
  } catch (const SizeExceeded& e) {
    send_error(envelope.id, envelope.author, protocol::ErrorCode::FILE_TOO_LARGE, e.what());
  } catch (const NotFound&) {
    send_error(envelope.id, envelope.author, protocol::ErrorCode::FILE_NOT_FOUND,
               protocol::default_error_message(protocol::ErrorCode::FILE_NOT_FOUND));
  } catch (const StorageFull& e) {
    send_error(envelope.id, envelope.author, protocol::ErrorCode::STORAGE_FULL, e.what());
  } catch (const protocol::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Blob server: Rejecting request " << envelope.id << ": " << e.what();
    send_error(envelope.id, envelope.author, e.code(), e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob server: Internal error on request " << envelope.id << ": " << e.what();
    send_error(envelope.id, envelope.author, protocol::ErrorCode::INTERNAL_ERROR, e.what());
  }
}


//==============================================
// REQUEST HANDLERS
//==============================================

void BlobServer::handle_store(const protocol::Request& request, const protocol::StoreRequest& store) {
  auto record = storage_.store(store.data, store.filename);
  publish_chunks(*record);
  send_success(request.id, request.author, "stored", record.get(), record->content_hash);
}

void BlobServer::handle_retrieve(const protocol::Request& request, const protocol::RetrieveRequest& retrieve) {
  auto record = storage_.retrieve(retrieve.hash);
  publish_chunks(*record);
  send_success(request.id, request.author, "available", record.get(), record->content_hash);
}

void BlobServer::handle_delete(const protocol::Request& request, const protocol::DeleteRequest& remove) {
  storage_.remove(remove.hash);
  send_success(request.id, request.author, "deleted", nullptr, remove.hash);
}


//==============================================
// OUTGOING MESSAGES
//==============================================

void BlobServer::publish_chunks(const FileRecord& record) {
  for (const auto& chunk : record.chunks) {
    protocol::ChunkMessage message;
    message.file_hash = record.content_hash;
    message.index = chunk.index;
    message.total = record.chunks.size();
    message.chunk_hash = chunk.hash;
    message.expires_at = record.expires_at_unix();
    message.data = chunk.data;
    transport_.publish(protocol::encode_chunk(message, identity_));
  }
  BOOST_LOG_TRIVIAL(debug) << "Blob server: Published " << record.chunks.size()
                           << " chunk(s) for " << crypto::to_hex(record.content_hash);
}

void BlobServer::send_success(const std::string& request_id, const std::string& request_author,
                              const std::string& status, const FileRecord* record,
                              const crypto::Digest& hash) {
  protocol::SuccessResponse success;
  success.status = status;
  success.hash = hash;
  if (record) {
    success.size = record->total_size;
    success.chunk_count = record->chunks.size();
    success.expires_at = record->expires_at_unix();
  }

  protocol::Response response;
  response.request_id = request_id;
  response.request_author = request_author;
  response.body = std::move(success);
  transport_.publish(protocol::encode_response(response, identity_));
  BOOST_LOG_TRIVIAL(info) << "Blob server: Request " << request_id << " " << status
                          << " " << crypto::to_hex(hash);
}

void BlobServer::send_error(const std::string& request_id, const std::string& request_author,
                            protocol::ErrorCode code, const std::string& message) {
  protocol::Response response;
  response.request_id = request_id;
  response.request_author = request_author;
  response.body = protocol::ErrorResponse{code, message};

  try {
    transport_.publish(protocol::encode_response(response, identity_));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob server: Failed to send error response for " << request_id
                             << ": " << e.what();
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Blob server: Request " << request_id << " failed with "
                          << protocol::error_code_to_string(code) << ": " << message;
}

} // namespace server
} // namespace blobdvm
