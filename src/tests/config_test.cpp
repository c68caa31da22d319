#include <gtest/gtest.h>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace peerchunks::config;

class ConfigTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() {
    init_logging();
  }

  static std::string minimal_document(const std::string& extra = "") {
    return "{\"peer_port\": 4000, \"storage_path\": \"/tmp/peerchunks\", \"encryption_key\": \"" +
           TEST_KEY + "\"" + extra + "}";
  }

  static void expect_rejected(const std::string& document, const std::string& fragment) {
    try {
      parse_config(document);
      FAIL() << "Expected ConfigError for: " << document;
    } catch (const ConfigError& e) {
      EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos) << e.what();
    }
  }
};

TEST_F(ConfigTest, MinimalDocumentGetsDefaults) {
  NodeConfig config = parse_config(minimal_document());

  EXPECT_EQ(config.peer_port, 4000);
  EXPECT_EQ(config.storage_path, std::filesystem::path("/tmp/peerchunks"));
  EXPECT_EQ(config.encryption_key, TEST_KEY);
  EXPECT_TRUE(config.bootstrap_peers.empty());
  EXPECT_EQ(config.listen_address, "0.0.0.0");
  EXPECT_EQ(config.advertise_address, "127.0.0.1:4000");
  EXPECT_EQ(config.chunk_size, 1024u);
  EXPECT_EQ(config.request_timeout.count(), 0);
  EXPECT_EQ(config.fetch_timeout.count(), 5000);
  EXPECT_EQ(config.log_file, "peerchunks.log");
  EXPECT_EQ(config.log_level, boost::log::trivial::info);
}

TEST_F(ConfigTest, OptionalKeysAreRead) {
  NodeConfig config = parse_config(minimal_document(
    ", \"bootstrap_peers\": [\"127.0.0.1:4001\", \"node2.local:4002\"]"
    ", \"listen_address\": \"127.0.0.1\""
    ", \"advertise_address\": \"10.0.0.5:4000\""
    ", \"chunk_size\": 4096"
    ", \"request_timeout_ms\": 1500"
    ", \"fetch_timeout_ms\": 250"
    ", \"log_file\": \"node.log\""
    ", \"log_level\": \"debug\""));

  EXPECT_EQ(config.bootstrap_peers, (std::vector<std::string>{"127.0.0.1:4001", "node2.local:4002"}));
  EXPECT_EQ(config.listen_address, "127.0.0.1");
  EXPECT_EQ(config.advertise_address, "10.0.0.5:4000");
  EXPECT_EQ(config.chunk_size, 4096u);
  EXPECT_EQ(config.request_timeout.count(), 1500);
  EXPECT_EQ(config.fetch_timeout.count(), 250);
  EXPECT_EQ(config.log_file, "node.log");
  EXPECT_EQ(config.log_level, boost::log::trivial::debug);
}

TEST_F(ConfigTest, MissingRequiredKeys) {
  expect_rejected("{\"storage_path\": \"/tmp/x\", \"encryption_key\": \"" + TEST_KEY + "\"}", "peer_port");
  expect_rejected("{\"peer_port\": 4000, \"encryption_key\": \"" + TEST_KEY + "\"}", "storage_path");
  expect_rejected("{\"peer_port\": 4000, \"storage_path\": \"/tmp/x\"}", "encryption_key");
}

TEST_F(ConfigTest, InvalidPort) {
  expect_rejected("{\"peer_port\": 0, \"storage_path\": \"/tmp/x\", \"encryption_key\": \"" + TEST_KEY + "\"}",
                  "peer_port");
  expect_rejected("{\"peer_port\": 70000, \"storage_path\": \"/tmp/x\", \"encryption_key\": \"" + TEST_KEY + "\"}",
                  "peer_port");
  expect_rejected("{\"peer_port\": \"4000\", \"storage_path\": \"/tmp/x\", \"encryption_key\": \"" + TEST_KEY + "\"}",
                  "peer_port");
}

TEST_F(ConfigTest, InvalidEncryptionKey) {
  expect_rejected("{\"peer_port\": 4000, \"storage_path\": \"/tmp/x\", \"encryption_key\": \"0011\"}",
                  "encryption_key");
  expect_rejected("{\"peer_port\": 4000, \"storage_path\": \"/tmp/x\", \"encryption_key\": \"" +
                  std::string(64, 'q') + "\"}", "encryption_key");
}

TEST_F(ConfigTest, InvalidOptionalValues) {
  expect_rejected(minimal_document(", \"chunk_size\": 0"), "chunk_size");
  expect_rejected(minimal_document(", \"fetch_timeout_ms\": -1"), "timeouts");
  expect_rejected(minimal_document(", \"log_level\": \"loud\""), "log_level");
  expect_rejected(minimal_document(", \"bootstrap_peers\": [\"no-port\"]"), "bootstrap_peers");
  expect_rejected(minimal_document(", \"bootstrap_peers\": \"127.0.0.1:4001\""), "bootstrap_peers");
  expect_rejected(minimal_document(", \"advertise_address\": \"10.0.0.5\""), "advertise_address");
}

TEST_F(ConfigTest, MalformedDocuments) {
  expect_rejected("{not json", "parse error");
  expect_rejected("[1, 2, 3]", "object");
}

TEST_F(ConfigTest, LoadFromFile) {
  std::filesystem::path dir = make_temp_dir("config_test");
  std::filesystem::path path = dir / "node.json";
  write_file(path, minimal_document(", \"chunk_size\": 64"));

  NodeConfig config = load_config(path);
  EXPECT_EQ(config.chunk_size, 64u);

  EXPECT_THROW(load_config(dir / "missing.json"), ConfigError);
  std::filesystem::remove_all(dir);
}
