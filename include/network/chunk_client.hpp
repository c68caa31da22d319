#ifndef PEERCHUNKS_NETWORK_CHUNK_CLIENT_HPP
#define PEERCHUNKS_NETWORK_CHUNK_CLIENT_HPP

#include <chrono>
#include <string>
#include "replication/chunk_sender.hpp"
#include "store/chunk_store.hpp"
#include "network/tcp_client.hpp"

namespace peerchunks {
namespace network {

// Client role of the protocol: one short-lived connection per chunk pushed or fetched
class ChunkClient : public replication::ChunkSender {
public:
  // Longest run of bytes without a newline tolerated before the acknowledgment
  static constexpr std::size_t MAX_ACK_WAIT_BYTES = 4096;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // request_timeout bounds connect, write and the acknowledgment wait (0 waits forever).
  // fetch_timeout bounds each read while waiting for a CHUNK_RESPONSE.
  ChunkClient(const store::ChunkStore& store, std::chrono::milliseconds request_timeout,
              std::chrono::milliseconds fetch_timeout);


  // ---- CHUNK TRANSFER ----
  // Sends the stored chunk as a push frame and waits for the literal OK
  void push_chunk(const PeerRecord& peer, const std::filesystem::path& directory,
                  const store::FileId& file_id, std::size_t chunk_index) override;

  // Requests one chunk and returns its bytes
  std::string fetch_chunk(const PeerRecord& peer, const store::FileId& file_id, std::size_t chunk_index);

private:
  // ---- PARAMETERS ----
  const store::ChunkStore& store_;
  std::chrono::milliseconds request_timeout_;
  std::chrono::milliseconds fetch_timeout_;

  // Skips the remote's handshake lines until OK arrives
  void wait_for_ack(TCP_Client& client);
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_CHUNK_CLIENT_HPP
