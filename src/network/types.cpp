#include "network/types.hpp"
#include <algorithm>
#include <unordered_set>

namespace peerchunks::network {

std::optional<std::pair<std::string, uint16_t>> split_address(const std::string& address) {
    size_t colon_pos = address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 >= address.size()) {
        return std::nullopt;
    }

    std::string host = address.substr(0, colon_pos);
    std::string port_text = address.substr(colon_pos + 1);
    if (!std::all_of(port_text.begin(), port_text.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
        port_text.size() > 5) {
        return std::nullopt;
    }

    unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }

    return std::make_pair(host, static_cast<uint16_t>(port));
}

std::vector<PeerRecord> unique_peers(const std::vector<PeerRecord>& peers) {
    std::vector<PeerRecord> result;
    std::unordered_set<std::string> seen;
    for (const auto& peer : peers) {
        if (seen.insert(peer.address).second) {
            result.push_back(peer);
        }
    }
    return result;
}

} // namespace peerchunks::network
