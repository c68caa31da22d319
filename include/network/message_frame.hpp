#ifndef PEERCHUNKS_NETWORK_MESSAGE_FRAME_HPP
#define PEERCHUNKS_NETWORK_MESSAGE_FRAME_HPP

#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "store/chunk_metadata.hpp"
#include "index/location_index.hpp"

namespace peerchunks {
namespace network {

// Largest payload accepted in a binary frame
constexpr std::size_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

// DHT_REQUEST
struct DhtRequest {};

// DHT_RESPONSE:<N> followed by N "<file-id>:<address>" lines
struct DhtResponse {
    std::vector<index::IndexEntry> entries;
};

// CHUNK_REQUEST:<file-id>:<index>
struct ChunkRequest {
    store::FileId file_id;
    std::size_t chunk_index;
};

// CHUNK_RESPONSE:<file-id>:<index>:<size>: followed by size raw bytes
struct ChunkResponse {
    store::FileId file_id;
    std::size_t chunk_index;
    std::string data;
};

// <file-id>:<index>:<size>: followed by size raw bytes, acknowledged with OK
struct ChunkPush {
    store::FileId file_id;
    std::size_t chunk_index;
    std::string data;
};

// <nonce-hex>:<ciphertext-hex>
struct EncryptedText {
    std::string nonce_hex;
    std::string ciphertext_hex;
};

// Any input that does not follow the grammar, already removed from the buffer
struct Malformed {
    std::string text;
};

using MessageFrame = std::variant<DhtRequest, DhtResponse, ChunkRequest, ChunkResponse,
                                  ChunkPush, EncryptedText, Malformed>;

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_MESSAGE_FRAME_HPP
