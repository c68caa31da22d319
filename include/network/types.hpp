#ifndef PEERCHUNKS_NETWORK_TYPES_HPP
#define PEERCHUNKS_NETWORK_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace peerchunks::network {

// A remote node, identified only by its "host:port" address
struct PeerRecord {
    std::string address;
};

inline bool operator==(const PeerRecord& lhs, const PeerRecord& rhs) {
    return lhs.address == rhs.address;
}

inline bool operator!=(const PeerRecord& lhs, const PeerRecord& rhs) {
    return !(lhs == rhs);
}

// Splits "host:port" at the last ':', nullopt if the port is missing or out of range
std::optional<std::pair<std::string, uint16_t>> split_address(const std::string& address);

// Removes duplicate addresses, keeping the first occurrence
std::vector<PeerRecord> unique_peers(const std::vector<PeerRecord>& peers);

} // namespace peerchunks::network

#endif // PEERCHUNKS_NETWORK_TYPES_HPP
