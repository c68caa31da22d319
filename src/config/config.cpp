#include "config/config.hpp"
#include "crypto/message_cipher.hpp"
#include "network/types.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace peerchunks {
namespace config {

namespace {

// Typed read of an optional key, ConfigError on a type mismatch
template <typename T>
T get_or(const json& document, const char* key, const T& fallback) {
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
  }
}

template <typename T>
T get_required(const json& document, const char* key) {
  if (!document.contains(key) || document.at(key).is_null()) {
    throw ConfigError(std::string("missing required key '") + key + "'");
  }
  return get_or<T>(document, key, T());
}

void check_address(const std::string& address, const char* key) {
  if (!network::split_address(address)) {
    throw ConfigError(std::string("'") + key + "' entry is not host:port: " + address);
  }
}

} // namespace

NodeConfig load_config(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open " + path.string());
  }

  std::stringstream contents;
  contents << file.rdbuf();
  return parse_config(contents.str());
}

NodeConfig parse_config(const std::string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("parse error: ") + e.what());
  }

  if (!document.is_object()) {
    throw ConfigError("top level value must be an object");
  }

  NodeConfig config;

  // Required keys
  int64_t port = get_required<int64_t>(document, "peer_port");
  if (port <= 0 || port > 65535) {
    throw ConfigError("'peer_port' out of range: " + std::to_string(port));
  }
  config.peer_port = static_cast<uint16_t>(port);

  config.storage_path = get_required<std::string>(document, "storage_path");
  if (config.storage_path.empty()) {
    throw ConfigError("'storage_path' must not be empty");
  }

  config.encryption_key = get_required<std::string>(document, "encryption_key");
  try {
    if (crypto::MessageCipher::from_hex(config.encryption_key).size() != crypto::MessageCipher::KEY_SIZE) {
      throw ConfigError("'encryption_key' must be 64 hex characters");
    }
  } catch (const crypto::CryptoError& e) {
    throw ConfigError(std::string("'encryption_key' is not valid hex: ") + e.what());
  }

  // Optional keys
  config.bootstrap_peers = get_or<std::vector<std::string>>(document, "bootstrap_peers", {});
  for (const auto& peer : config.bootstrap_peers) {
    check_address(peer, "bootstrap_peers");
  }

  config.listen_address = get_or<std::string>(document, "listen_address", config.listen_address);

  config.advertise_address = get_or<std::string>(document, "advertise_address",
                                                 "127.0.0.1:" + std::to_string(config.peer_port));
  check_address(config.advertise_address, "advertise_address");

  int64_t chunk_size = get_or<int64_t>(document, "chunk_size", static_cast<int64_t>(config.chunk_size));
  if (chunk_size <= 0) {
    throw ConfigError("'chunk_size' must be positive");
  }
  config.chunk_size = static_cast<std::size_t>(chunk_size);

  int64_t request_timeout = get_or<int64_t>(document, "request_timeout_ms", 0);
  int64_t fetch_timeout = get_or<int64_t>(document, "fetch_timeout_ms", config.fetch_timeout.count());
  if (request_timeout < 0 || fetch_timeout < 0) {
    throw ConfigError("timeouts must not be negative");
  }
  config.request_timeout = std::chrono::milliseconds(request_timeout);
  config.fetch_timeout = std::chrono::milliseconds(fetch_timeout);

  config.log_file = get_or<std::string>(document, "log_file", config.log_file);

  std::string level = get_or<std::string>(document, "log_level", "info");
  if (!boost::log::trivial::from_string(level.c_str(), level.size(), config.log_level)) {
    throw ConfigError("unknown 'log_level': " + level);
  }

  return config;
}

} // namespace config
} // namespace peerchunks
