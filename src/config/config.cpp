#include "config/config.hpp"
#include "logger/logger.hpp"
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace blobdvm {
namespace config {

namespace {

// Overwrites target with node[key] when the key is present
template <typename T>
void read_value(const YAML::Node& section, const char* section_name, const char* key, T& target) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        target = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value for ") + section_name + "." + key + ": " + e.what());
    }
}

YAML::Node section_of(const YAML::Node& root, const char* name) {
    YAML::Node section = root[name];
    if (section && !section.IsMap()) {
        throw ConfigError(std::string("Section '") + name + "' must be a mapping");
    }
    return section;
}

Config from_yaml(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Top level of configuration must be a mapping");
    }

    if (auto logging = section_of(root, "logging")) {
        read_value(logging, "logging", "file", config.logging.file);
        read_value(logging, "logging", "level", config.logging.level);
        read_value(logging, "logging", "console", config.logging.console);
    }

    if (auto transport = section_of(root, "transport")) {
        read_value(transport, "transport", "relay_host", config.transport.relay_host);
        read_value(transport, "transport", "relay_port", config.transport.relay_port);
    }

    if (auto storage = section_of(root, "storage")) {
        read_value(storage, "storage", "max_file_size", config.storage.max_file_size);
        read_value(storage, "storage", "chunk_size", config.storage.chunk_size);
        read_value(storage, "storage", "retention_seconds", config.storage.retention_seconds);
        read_value(storage, "storage", "max_storage_bytes", config.storage.max_storage_bytes);
    }

    if (auto server = section_of(root, "server")) {
        read_value(server, "server", "identity", config.server.identity);
        read_value(server, "server", "name", config.server.name);
        read_value(server, "server", "about", config.server.about);
        read_value(server, "server", "poll_interval_ms", config.server.poll_interval_ms);
        read_value(server, "server", "sweep_interval_ms", config.server.sweep_interval_ms);
    }

    if (auto client = section_of(root, "client")) {
        read_value(client, "client", "response_timeout_ms", config.client.response_timeout_ms);
        read_value(client, "client", "collection_timeout_ms", config.client.collection_timeout_ms);
        read_value(client, "client", "discovery_window_ms", config.client.discovery_window_ms);
    }

    config.validate();
    return config;
}

} // namespace


//==============================================
// VALIDATION
//==============================================

void Config::validate() const {
    try {
        logger::parse_severity(logging.level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    if (transport.relay_host.empty()) {
        throw ConfigError("transport.relay_host must not be empty");
    }
    if (transport.relay_port == 0) {
        throw ConfigError("transport.relay_port must be non-zero");
    }
    if (storage.chunk_size == 0) {
        throw ConfigError("storage.chunk_size must be non-zero");
    }
    if (storage.max_file_size == 0) {
        throw ConfigError("storage.max_file_size must be non-zero");
    }
    if (storage.chunk_size > storage.max_file_size) {
        throw ConfigError("storage.chunk_size (" + std::to_string(storage.chunk_size) +
                          ") exceeds storage.max_file_size (" + std::to_string(storage.max_file_size) + ")");
    }
    if (storage.retention_seconds == 0) {
        throw ConfigError("storage.retention_seconds must be non-zero");
    }
    if (storage.max_storage_bytes != 0 && storage.max_storage_bytes < storage.max_file_size) {
        throw ConfigError("storage.max_storage_bytes is smaller than storage.max_file_size");
    }
    if (server.poll_interval_ms == 0) {
        throw ConfigError("server.poll_interval_ms must be non-zero");
    }
    if (server.sweep_interval_ms == 0) {
        throw ConfigError("server.sweep_interval_ms must be non-zero");
    }
    if (client.response_timeout_ms == 0 || client.collection_timeout_ms == 0) {
        throw ConfigError("client timeouts must be non-zero");
    }
}


//==============================================
// LOADING
//==============================================

Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        BOOST_LOG_TRIVIAL(error) << "Config: Cannot open config file: " << path;
        throw ConfigError("Cannot open config file: " + path);
    }
    file.close();

    try {
        Config config = from_yaml(YAML::LoadFile(path));
        BOOST_LOG_TRIVIAL(info) << "Config: Loaded configuration from " << path;
        return config;
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Config: YAML parsing error in " << path << ": " << e.what();
        throw ConfigError("YAML parsing error in " + path + ": " + e.what());
    }
}

Config parse_config(const std::string& yaml_text) {
    try {
        return from_yaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML parsing error: ") + e.what());
    }
}

} // namespace config
} // namespace blobdvm
