#ifndef PEERCHUNKS_NETWORK_ERROR_HPP
#define PEERCHUNKS_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerchunks {
namespace network {

enum class NetworkErrc {
    CONNECTION_FAILED,
    CONNECTION_LOST,
    TIMEOUT,
    TRANSFER_FAILED
};

inline const char* network_error_to_string(NetworkErrc error) {
    switch (error) {
        case NetworkErrc::CONNECTION_FAILED: return "Connection failed";
        case NetworkErrc::CONNECTION_LOST: return "Connection lost";
        case NetworkErrc::TIMEOUT: return "Timeout";
        case NetworkErrc::TRANSFER_FAILED: return "Transfer failed";
        default: return "Undefined error";
    }
}

// I/O failure of the client role, carries the failure category
class NetworkError : public std::runtime_error {
public:
    NetworkError(NetworkErrc code, const std::string& message)
        : std::runtime_error(std::string(network_error_to_string(code)) + ": " + message)
        , code_(code) {}

    NetworkErrc code() const { return code_; }

private:
    NetworkErrc code_;
};

// Frame text that does not follow the wire grammar
class ProtocolParseError : public std::runtime_error {
public:
    explicit ProtocolParseError(const std::string& message)
        : std::runtime_error("Protocol parse error: " + message) {}
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_ERROR_HPP
