#ifndef BLOBDVM_CONFIG_HPP
#define BLOBDVM_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace blobdvm {
namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

struct LoggingConfig {
    std::string file = "blobdvm.log";   // empty disables the file sink
    std::string level = "info";
    bool console = false;
};

struct TransportConfig {
    std::string relay_host = "127.0.0.1";
    uint16_t relay_port = 7447;
};

struct StorageConfig {
    uint64_t max_file_size = 10ull * 1024 * 1024;
    std::size_t chunk_size = 32768;
    uint64_t retention_seconds = 86400;
    uint64_t max_storage_bytes = 0;     // 0 = unlimited
};

struct ServerConfig {
    std::string identity;               // empty = random at start-up
    std::string name = "BlobDVM Storage";
    std::string about = "Content-addressed file storage";
    uint64_t poll_interval_ms = 1000;
    uint64_t sweep_interval_ms = 300000;
};

struct ClientConfig {
    uint64_t response_timeout_ms = 30000;
    uint64_t collection_timeout_ms = 60000;
    uint64_t discovery_window_ms = 2000;
};

struct Config {
    LoggingConfig logging;
    TransportConfig transport;
    StorageConfig storage;
    ServerConfig server;
    ClientConfig client;

    // Throws ConfigError describing the first invalid setting
    void validate() const;
};


// ---- LOADING ----
// Reads a YAML file; missing keys keep their defaults. Throws ConfigError.
Config load_config(const std::string& path);
// Same as load_config for YAML text already in memory
Config parse_config(const std::string& yaml_text);

} // namespace config
} // namespace blobdvm

#endif // BLOBDVM_CONFIG_HPP
