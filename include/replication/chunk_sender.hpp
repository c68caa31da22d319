#ifndef PEERCHUNKS_REPLICATION_CHUNK_SENDER_HPP
#define PEERCHUNKS_REPLICATION_CHUNK_SENDER_HPP

#include <cstddef>
#include <filesystem>
#include "network/types.hpp"
#include "store/chunk_metadata.hpp"

namespace peerchunks {
namespace replication {

// Transport used by the replicator to hand one stored chunk to one peer
class ChunkSender {
public:
  virtual ~ChunkSender() = default;

  // Sends directory/chunk_<chunk_index>.bin and returns once the peer acknowledged it.
  // Throws on any failure.
  virtual void push_chunk(const network::PeerRecord& peer, const std::filesystem::path& directory,
                          const store::FileId& file_id, std::size_t chunk_index) = 0;
};

} // namespace replication
} // namespace peerchunks

#endif // PEERCHUNKS_REPLICATION_CHUNK_SENDER_HPP
