#ifndef PEERCHUNKS_STORE_CHUNK_METADATA_HPP
#define PEERCHUNKS_STORE_CHUNK_METADATA_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <boost/uuid/uuid.hpp>

namespace peerchunks {
namespace store {

// 128-bit network-wide file identifier
using FileId = boost::uuids::uuid;

// Generates a fresh random (v4) identifier
FileId generate_file_id();
// Canonical lowercase hyphenated form used on disk and on the wire
std::string to_string(const FileId& file_id);
// Parses the canonical form, returns nullopt for anything else
std::optional<FileId> parse_file_id(const std::string& text);

struct ChunkMetadata {
  FileId file_id;
  std::size_t chunk_index;
  std::size_t chunk_size;
  // Informational only, 0 when reconstructed from the wire
  std::size_t total_chunks;
};

} // namespace store
} // namespace peerchunks

#endif // PEERCHUNKS_STORE_CHUNK_METADATA_HPP
