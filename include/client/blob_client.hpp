#ifndef BLOBDVM_CLIENT_BLOB_CLIENT_HPP
#define BLOBDVM_CLIENT_BLOB_CLIENT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "client/chunk_collector.hpp"
#include "client/client_error.hpp"
#include "client/correlator.hpp"
#include "config/config.hpp"
#include "protocol/messages.hpp"
#include "transport/transport.hpp"

namespace blobdvm {
namespace client {

// What the server reported after a successful store
struct StoreReceipt {
    crypto::Digest hash{};
    uint64_t size{0};
    std::size_t chunk_count{0};
    uint64_t expires_at{0};
    std::string server;
};

class BlobClient {
public:
    // ---- CONSTRUCTOR ----
    // An empty identity is replaced with a random one
    BlobClient(transport::Transport& transport, const config::ClientConfig& config,
               std::string identity = "");


    // ---- DISCOVERY ----
    // Listens for server announcements for the configured discovery window
    std::vector<protocol::ServerAnnouncement> discover_servers();
    std::vector<protocol::ServerAnnouncement> discover_servers(std::chrono::milliseconds window);


    // ---- BLOB OPERATIONS ----
    // Without a server identity the first discovered server is used.
    StoreReceipt store(const std::string& bytes,
                       std::optional<std::string> filename = std::nullopt,
                       std::optional<std::string> server = std::nullopt);
    // Collects, reassembles and verifies the blob against its hash
    std::string retrieve(const crypto::Digest& hash, std::optional<std::string> server = std::nullopt);
    // Validates the hex hash locally first (ProtocolError INVALID_HASH)
    std::string retrieve(const std::string& hash_hex, std::optional<std::string> server = std::nullopt);
    void remove(const crypto::Digest& hash, std::optional<std::string> server = std::nullopt);
    void remove(const std::string& hash_hex, std::optional<std::string> server = std::nullopt);


    // ---- GETTERS ----
    const std::string& identity() const { return identity_; }

private:
    // ---- PARAMETERS ----
    transport::Transport& transport_;
    config::ClientConfig config_;
    std::string identity_;
    Correlator correlator_;
    ChunkCollector collector_;


    // ---- HELPERS ----
    std::string resolve_server(const std::optional<std::string>& server);
    // Sends a request and returns the decoded success body, throws RemoteError
    protocol::SuccessResponse round_trip(const protocol::RequestPayload& payload, const std::string& server);
    static crypto::Digest parse_hash(const std::string& hash_hex);
};

} // namespace client
} // namespace blobdvm

#endif // BLOBDVM_CLIENT_BLOB_CLIENT_HPP
