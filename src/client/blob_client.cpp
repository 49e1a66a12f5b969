#include "client/blob_client.hpp"
#include <boost/log/trivial.hpp>
#include <map>
#include <mutex>
#include <thread>

namespace blobdvm {
namespace client {

//==============================================
// CONSTRUCTOR
//==============================================

BlobClient::BlobClient(transport::Transport& transport, const config::ClientConfig& config,
                       std::string identity)
    : transport_(transport),
      config_(config),
      identity_(identity.empty() ? crypto::random_hex_id() : std::move(identity)),
      correlator_(transport),
      collector_(transport) {
    BOOST_LOG_TRIVIAL(debug) << "Blob client: Created with identity " << identity_;
}


//==============================================
// DISCOVERY
//==============================================

std::vector<protocol::ServerAnnouncement> BlobClient::discover_servers() {
    return discover_servers(std::chrono::milliseconds(config_.discovery_window_ms));
}

std::vector<protocol::ServerAnnouncement> BlobClient::discover_servers(std::chrono::milliseconds window) {
    std::mutex mutex;
    std::map<std::string, protocol::ServerAnnouncement> found;

    protocol::Filter filter;
    filter.kinds = {protocol::MessageKind::ANNOUNCEMENT};
    filter.tags = {protocol::Tag{protocol::TAG_SERVICE, protocol::SERVICE_ID}};

    auto subscription = transport_.subscribe(filter, [&](const protocol::Envelope& envelope) {
        try {
            auto announcement = protocol::decode_announcement(envelope);
            std::lock_guard<std::mutex> lock(mutex);
            found[announcement.identity] = std::move(announcement);
        } catch (const protocol::ProtocolError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Blob client: Ignoring bad announcement " << envelope.id << ": " << e.what();
        }
    });

    BOOST_LOG_TRIVIAL(info) << "Blob client: Discovering servers for " << window.count() << " ms";
    std::this_thread::sleep_for(window);
    transport_.unsubscribe(subscription);

    std::vector<protocol::ServerAnnouncement> servers;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& [identity, announcement] : found) {
            servers.push_back(std::move(announcement));
        }
    }
    BOOST_LOG_TRIVIAL(info) << "Blob client: Found " << servers.size() << " server(s)";
    return servers;
}


//==============================================
// BLOB OPERATIONS
//==============================================

StoreReceipt BlobClient::store(const std::string& bytes, std::optional<std::string> filename,
                               std::optional<std::string> server) {
    std::string target = resolve_server(server);
    crypto::Digest local_hash = crypto::sha256(bytes);

    protocol::StoreRequest request;
    request.data = bytes;
    request.filename = std::move(filename);
    protocol::SuccessResponse success = round_trip(request, target);

    if (success.hash != local_hash) {
        BOOST_LOG_TRIVIAL(error) << "Blob client: Server reported hash " << crypto::to_hex(success.hash)
                                 << " for content hashing to " << crypto::to_hex(local_hash);
        throw chunker::IntegrityError("server reported a different content hash");
    }

    StoreReceipt receipt;
    receipt.hash = success.hash;
    receipt.size = success.size.value_or(bytes.size());
    receipt.chunk_count = static_cast<std::size_t>(success.chunk_count.value_or(0));
    receipt.expires_at = success.expires_at.value_or(0);
    receipt.server = target;

    BOOST_LOG_TRIVIAL(info) << "Blob client: Stored " << crypto::to_hex(receipt.hash) << " ("
                            << receipt.size << " bytes, " << receipt.chunk_count << " chunks) on " << target;
    return receipt;
}

std::string BlobClient::retrieve(const crypto::Digest& hash, std::optional<std::string> server) {
    std::string target = resolve_server(server);
    const std::string hash_hex = crypto::to_hex(hash);

    // Open the collection first: chunks may arrive before the response
    collector_.begin(hash);

    protocol::SuccessResponse success;
    try {
        success = round_trip(protocol::RetrieveRequest{hash}, target);
    } catch (...) {
        collector_.abandon(hash);
        throw;
    }

    if (!success.chunk_count) {
        collector_.abandon(hash);
        throw protocol::ProtocolError(protocol::ErrorCode::INVALID_REQUEST_FORMAT,
                                      "Retrieve response without chunk count");
    }

    auto chunks = collector_.collect(hash, static_cast<std::size_t>(*success.chunk_count),
                                     std::chrono::milliseconds(config_.collection_timeout_ms));
    std::string bytes = chunker::Chunker::reassemble(std::move(chunks));

    if (crypto::sha256(bytes) != hash) {
        BOOST_LOG_TRIVIAL(error) << "Blob client: Reassembled content does not hash to " << hash_hex;
        throw chunker::IntegrityError("whole-file digest mismatch for " + hash_hex);
    }
    if (success.size && *success.size != bytes.size()) {
        throw chunker::IntegrityError("size mismatch for " + hash_hex);
    }

    BOOST_LOG_TRIVIAL(info) << "Blob client: Retrieved " << hash_hex << " (" << bytes.size() << " bytes)";
    return bytes;
}

std::string BlobClient::retrieve(const std::string& hash_hex, std::optional<std::string> server) {
    return retrieve(parse_hash(hash_hex), std::move(server));
}

void BlobClient::remove(const crypto::Digest& hash, std::optional<std::string> server) {
    std::string target = resolve_server(server);
    round_trip(protocol::DeleteRequest{hash}, target);
    BOOST_LOG_TRIVIAL(info) << "Blob client: Deleted " << crypto::to_hex(hash) << " on " << target;
}

void BlobClient::remove(const std::string& hash_hex, std::optional<std::string> server) {
    remove(parse_hash(hash_hex), std::move(server));
}


//==============================================
// HELPERS
//==============================================

std::string BlobClient::resolve_server(const std::optional<std::string>& server) {
    if (server && !server->empty()) {
        return *server;
    }

    auto servers = discover_servers();
    if (servers.empty()) {
        throw DiscoveryError("no blob storage server announced itself");
    }
    BOOST_LOG_TRIVIAL(info) << "Blob client: Using server " << servers.front().identity;
    return servers.front().identity;
}

protocol::SuccessResponse BlobClient::round_trip(const protocol::RequestPayload& payload,
                                                 const std::string& server) {
    protocol::Envelope request = protocol::encode_request(payload, identity_,
                                                          protocol::capability_address(server));
    protocol::Envelope reply = correlator_.send(request, std::chrono::milliseconds(config_.response_timeout_ms));
    protocol::Response response = protocol::decode_response(reply);

    if (!response.ok()) {
        const auto& error = response.error();
        BOOST_LOG_TRIVIAL(warning) << "Blob client: Server error " << protocol::error_code_to_string(error.code)
                                   << ": " << error.message;
        throw RemoteError(error.code, error.message);
    }
    return response.success();
}

crypto::Digest BlobClient::parse_hash(const std::string& hash_hex) {
    if (!crypto::is_valid_hex_digest(hash_hex)) {
        throw protocol::ProtocolError(protocol::ErrorCode::INVALID_HASH,
                                      "Invalid SHA256 hash: '" + hash_hex + "'");
    }
    return crypto::digest_from_hex(hash_hex);
}

} // namespace client
} // namespace blobdvm
