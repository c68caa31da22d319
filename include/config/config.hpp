#ifndef PEERCHUNKS_CONFIG_CONFIG_HPP
#define PEERCHUNKS_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace config {

// Settings of one node, every field validated
struct NodeConfig {
  uint16_t peer_port = 0;
  std::vector<std::string> bootstrap_peers;
  std::filesystem::path storage_path;
  std::string encryption_key;

  std::string listen_address = "0.0.0.0";
  // Address this node registers itself under, "127.0.0.1:<peer_port>" when unset
  std::string advertise_address;
  std::size_t chunk_size = 1024;
  // Client connect/write/acknowledgment bound, 0 waits indefinitely
  std::chrono::milliseconds request_timeout{0};
  // Bound on each read while waiting for a fetched chunk
  std::chrono::milliseconds fetch_timeout{5000};

  std::string log_file = "peerchunks.log";
  boost::log::trivial::severity_level log_level = boost::log::trivial::info;
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

// Reads and validates a JSON configuration file
NodeConfig load_config(const std::filesystem::path& path);

// Validates a JSON document already in memory
NodeConfig parse_config(const std::string& text);

} // namespace config
} // namespace peerchunks

#endif // PEERCHUNKS_CONFIG_CONFIG_HPP
