#include "network/chunk_client.hpp"
#include "network/codec.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace network {

ChunkClient::ChunkClient(const store::ChunkStore& store, std::chrono::milliseconds request_timeout,
                         std::chrono::milliseconds fetch_timeout)
  : store_(store)
  , request_timeout_(request_timeout)
  , fetch_timeout_(fetch_timeout) {
}

//==============================================
// PUSH
//==============================================

void ChunkClient::push_chunk(const PeerRecord& peer, const std::filesystem::path& directory,
                             const store::FileId& file_id, std::size_t chunk_index) {
  std::string data = store_.get_chunk(directory, chunk_index);

  BOOST_LOG_TRIVIAL(debug) << "Chunk client: Pushing chunk " << chunk_index << " of file "
                           << store::to_string(file_id) << " (" << data.size() << " bytes) to " << peer.address;

  TCP_Client client(request_timeout_);
  client.connect(peer.address);
  client.write(Codec::encode(ChunkPush{file_id, chunk_index, std::move(data)}));
  wait_for_ack(client);

  BOOST_LOG_TRIVIAL(debug) << "Chunk client: " << peer.address << " acknowledged chunk " << chunk_index;
}

void ChunkClient::wait_for_ack(TCP_Client& client) {
  const std::size_t ack_length = std::strlen(Codec::ACK);
  std::string buffer;

  while (true) {
    // Welcome text and DHT_REQUEST are sent by the remote before it reads the push
    while (buffer.compare(0, ack_length, Codec::ACK) != 0) {
      std::size_t line_end = buffer.find('\n');
      if (line_end == std::string::npos) {
        break;
      }
      buffer.erase(0, line_end + 1);
    }

    if (buffer.size() >= ack_length && buffer.compare(0, ack_length, Codec::ACK) == 0) {
      return;
    }

    if (buffer.size() > MAX_ACK_WAIT_BYTES) {
      BOOST_LOG_TRIVIAL(error) << "Chunk client: Unexpected reply from " << client.remote_address();
      throw NetworkError(NetworkErrc::TRANSFER_FAILED, "unexpected reply from " + client.remote_address());
    }

    if (!client.read_some(buffer)) {
      BOOST_LOG_TRIVIAL(error) << "Chunk client: " << client.remote_address() << " closed before acknowledging";
      throw NetworkError(NetworkErrc::CONNECTION_LOST,
                         client.remote_address() + " closed the connection before acknowledging");
    }
  }
}


//==============================================
// FETCH
//==============================================

std::string ChunkClient::fetch_chunk(const PeerRecord& peer, const store::FileId& file_id, std::size_t chunk_index) {
  BOOST_LOG_TRIVIAL(debug) << "Chunk client: Requesting chunk " << chunk_index << " of file "
                           << store::to_string(file_id) << " from " << peer.address;

  TCP_Client client(request_timeout_);
  client.connect(peer.address);
  client.write(Codec::encode(ChunkRequest{file_id, chunk_index}));

  // A peer without the chunk stays silent, so every read is bounded
  client.set_timeout(fetch_timeout_);

  std::string buffer;
  while (true) {
    while (auto frame = Codec::decode(buffer)) {
      auto* response = std::get_if<ChunkResponse>(&*frame);
      if (response && response->file_id == file_id && response->chunk_index == chunk_index) {
        BOOST_LOG_TRIVIAL(info) << "Chunk client: Fetched chunk " << chunk_index << " of file "
                                << store::to_string(file_id) << " from " << peer.address;
        return std::move(response->data);
      }
    }

    if (!client.read_some(buffer)) {
      throw NetworkError(NetworkErrc::CONNECTION_LOST,
                         peer.address + " closed the connection before sending chunk " +
                         std::to_string(chunk_index));
    }
  }
}

} // namespace network
} // namespace peerchunks
