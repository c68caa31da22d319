#ifndef PEERCHUNKS_FILE_SERVER_HPP
#define PEERCHUNKS_FILE_SERVER_HPP

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "store/chunk_store.hpp"
#include "index/location_index.hpp"
#include "replication/replicator.hpp"
#include "network/chunk_client.hpp"
#include "network/peer_manager.hpp"

namespace peerchunks {
namespace file_server {

struct UploadResult {
  store::FileId file_id;
  std::size_t chunk_count = 0;
  // False when replication was skipped or a push failed, the file is stored locally either way
  bool replicated = false;
  std::string replication_error;
};

class InvalidFileIdError : public std::runtime_error {
public:
  explicit InvalidFileIdError(const std::string& text)
    : std::runtime_error("Invalid file identifier: " + text) {}
};

class IncompleteFileError : public std::runtime_error {
public:
  explicit IncompleteFileError(const std::string& message)
    : std::runtime_error("Incomplete file: " + message) {}
};

class FileServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileServer(store::ChunkStore& store, index::LocationIndex& index, replication::Replicator& replicator,
             network::ChunkClient& client, network::PeerManager& peer_manager,
             const network::PeerRecord& self, std::size_t chunk_size);


  // ---- PROCESSING OF USER REQUESTS ----
  // Splits and stores the file, registers this node as holder, then replicates to the known peers
  UploadResult upload(const std::filesystem::path& file_path);
  // Reassembles the file into destination, fetching missing chunks from known holders
  void download(const std::string& file_id_text, const std::filesystem::path& destination);
  // Addresses known to hold the file
  std::vector<std::string> search(const std::string& query) const;


  // ---- GETTERS ----
  store::ChunkStore& get_store() { return store_; }

private:
  // ---- PARAMETERS ----
  store::ChunkStore& store_;
  index::LocationIndex& index_;
  replication::Replicator& replicator_;
  network::ChunkClient& client_;
  network::PeerManager& peer_manager_;
  network::PeerRecord self_;
  std::size_t chunk_size_;


  // ---- RETRIEVAL FROM NETWORK ----
  // Holders of the file other than this node
  std::vector<network::PeerRecord> remote_holders(const store::FileId& file_id) const;
  // Tries each holder in turn, true once one of them supplied the chunk
  bool fetch_from_holders(const std::vector<network::PeerRecord>& holders, const store::FileId& file_id,
                          std::size_t chunk_index);
  // Stored indices, empty when nothing of the file is local
  std::vector<std::size_t> local_chunks(const store::FileId& file_id) const;
};

} // namespace file_server
} // namespace peerchunks

#endif // PEERCHUNKS_FILE_SERVER_HPP
