#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace blobdvm::config;

class ConfigTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        init_logging();
    }

    void TearDown() override {
        if (!temp_path.empty()) {
            std::filesystem::remove(temp_path);
        }
    }

    std::string write_temp(const std::string& contents) {
        temp_path = (std::filesystem::temp_directory_path() /
                     ("blobdvm_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                      ".yaml")).string();
        std::ofstream file(temp_path);
        file << contents;
        return temp_path;
    }

    std::string temp_path;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.storage.max_file_size, 10u * 1024 * 1024);
    EXPECT_EQ(config.storage.chunk_size, 32768u);
    EXPECT_EQ(config.storage.retention_seconds, 86400u);
    EXPECT_EQ(config.server.poll_interval_ms, 1000u);
    EXPECT_EQ(config.server.sweep_interval_ms, 300000u);
    EXPECT_EQ(config.client.response_timeout_ms, 30000u);
    EXPECT_EQ(config.client.collection_timeout_ms, 60000u);
    EXPECT_TRUE(config.server.identity.empty());
}

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
    Config config = parse_config("");
    EXPECT_EQ(config.transport.relay_port, 7447);
    EXPECT_EQ(config.logging.level, "info");
}

// Keys that are present override defaults, the rest are kept
TEST_F(ConfigTest, PartialOverride) {
    Config config = parse_config(
        "storage:\n"
        "  chunk_size: 1024\n"
        "  retention_seconds: 60\n"
        "server:\n"
        "  identity: my-server\n"
        "logging:\n"
        "  level: debug\n"
        "  console: true\n");

    EXPECT_EQ(config.storage.chunk_size, 1024u);
    EXPECT_EQ(config.storage.retention_seconds, 60u);
    EXPECT_EQ(config.storage.max_file_size, 10u * 1024 * 1024);
    EXPECT_EQ(config.server.identity, "my-server");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.logging.console);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::string path = write_temp(
        "transport:\n"
        "  relay_host: 10.0.0.5\n"
        "  relay_port: 9000\n"
        "client:\n"
        "  response_timeout_ms: 500\n");

    Config config = load_config(path);
    EXPECT_EQ(config.transport.relay_host, "10.0.0.5");
    EXPECT_EQ(config.transport.relay_port, 9000);
    EXPECT_EQ(config.client.response_timeout_ms, 500u);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config("/nonexistent/blobdvm/config.yaml"), ConfigError);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    EXPECT_THROW(parse_config("storage: [unterminated"), ConfigError);
}

TEST_F(ConfigTest, WrongValueTypeThrows) {
    EXPECT_THROW(parse_config("storage:\n  chunk_size: lots\n"), ConfigError);
    EXPECT_THROW(parse_config("transport:\n  relay_port: 70000\n"), ConfigError);
}

TEST_F(ConfigTest, NonMappingSectionThrows) {
    EXPECT_THROW(parse_config("storage: 5\n"), ConfigError);
    EXPECT_THROW(parse_config("- just\n- a list\n"), ConfigError);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    EXPECT_THROW(parse_config("logging:\n  level: chatty\n"), ConfigError);
    EXPECT_THROW(parse_config("transport:\n  relay_port: 0\n"), ConfigError);
    EXPECT_THROW(parse_config("storage:\n  chunk_size: 0\n"), ConfigError);
    EXPECT_THROW(parse_config("storage:\n  retention_seconds: 0\n"), ConfigError);
    EXPECT_THROW(parse_config("storage:\n  max_file_size: 100\n  chunk_size: 200\n"), ConfigError);
    EXPECT_THROW(parse_config("storage:\n  max_storage_bytes: 10\n"), ConfigError);
    EXPECT_THROW(parse_config("server:\n  poll_interval_ms: 0\n"), ConfigError);
    EXPECT_THROW(parse_config("client:\n  collection_timeout_ms: 0\n"), ConfigError);
}

TEST_F(ConfigTest, ErrorMessageNamesSetting) {
    try {
        parse_config("storage:\n  chunk_size: 0\n");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("storage.chunk_size"), std::string::npos);
    }
}
