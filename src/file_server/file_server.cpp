#include "file_server/file_server.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace file_server {

FileServer::FileServer(store::ChunkStore& store, index::LocationIndex& index, replication::Replicator& replicator,
                       network::ChunkClient& client, network::PeerManager& peer_manager,
                       const network::PeerRecord& self, std::size_t chunk_size)
  : store_(store)
  , index_(index)
  , replicator_(replicator)
  , client_(client)
  , peer_manager_(peer_manager)
  , self_(self)
  , chunk_size_(chunk_size) {
  BOOST_LOG_TRIVIAL(info) << "File server: Initialized for " << self_.address << " with chunk size " << chunk_size_;
}

//==============================================
// UPLOAD
//==============================================

UploadResult FileServer::upload(const std::filesystem::path& file_path) {
  BOOST_LOG_TRIVIAL(info) << "File server: Uploading " << file_path.string();

  UploadResult result;
  std::filesystem::path directory;

  // Chunks go to disk as they are read, the file is never held in memory
  result.file_id = store::ChunkStore::split(file_path, chunk_size_,
    [this, &directory, &result](const store::ChunkMetadata& metadata, const std::string& data) {
      if (directory.empty()) {
        directory = store_.initialize_storage(metadata.file_id);
      }
      store_.save_chunk(directory, metadata, data);
      ++result.chunk_count;
    });

  // An empty file still gets its directory
  store_.initialize_storage(result.file_id);
  index_.register_location(result.file_id, self_);

  std::string file_text = store::to_string(result.file_id);
  BOOST_LOG_TRIVIAL(info) << "File server: Stored " << result.chunk_count << " chunks of " << file_path.string()
                          << " as " << file_text;

  try {
    replication::ReplicationReport report = replicator_.replicate(result.file_id, peer_manager_.known_peers());
    result.replicated = report.failed == 0;
    if (report.failed > 0) {
      result.replication_error = std::to_string(report.failed) + " chunk pushes failed";
    }
  } catch (const replication::InsufficientPeersError& e) {
    BOOST_LOG_TRIVIAL(warning) << "File server: File " << file_text << " not replicated: " << e.what();
    result.replication_error = e.what();
  }

  return result;
}


//==============================================
// DOWNLOAD
//==============================================

void FileServer::download(const std::string& file_id_text, const std::filesystem::path& destination) {
  auto file_id = store::parse_file_id(file_id_text);
  if (!file_id) {
    BOOST_LOG_TRIVIAL(error) << "File server: Invalid file identifier: " << file_id_text;
    throw InvalidFileIdError(file_id_text);
  }

  BOOST_LOG_TRIVIAL(info) << "File server: Downloading " << file_id_text << " to " << destination.string();

  std::vector<std::size_t> indices = local_chunks(*file_id);

  if (indices.empty()) {
    // Nothing local: pull 0, 1, 2, ... until no holder has the next index
    std::vector<network::PeerRecord> holders = remote_holders(*file_id);
    std::size_t chunk_index = 0;
    while (fetch_from_holders(holders, *file_id, chunk_index)) {
      ++chunk_index;
    }
    BOOST_LOG_TRIVIAL(info) << "File server: Retrieved " << chunk_index << " chunks of " << file_id_text
                            << " from the network";
  } else if (indices.back() + 1 != indices.size()) {
    // Fill the gaps below the highest local index
    auto holders = index_.lookup(*file_id) ? remote_holders(*file_id) : std::vector<network::PeerRecord>();
    std::size_t next = 0;
    for (std::size_t chunk_index = 0; chunk_index < indices.back(); ++chunk_index) {
      if (next < indices.size() && indices[next] == chunk_index) {
        ++next;
        continue;
      }
      if (!fetch_from_holders(holders, *file_id, chunk_index)) {
        BOOST_LOG_TRIVIAL(warning) << "File server: No holder supplied chunk " << chunk_index << " of " << file_id_text;
      }
    }
  }

  indices = local_chunks(*file_id);
  if (indices.empty()) {
    BOOST_LOG_TRIVIAL(error) << "File server: No chunks of " << file_id_text << " found locally or remotely";
    throw IncompleteFileError("no chunks of " + file_id_text + " found locally or remotely");
  }

  for (std::size_t i = 0; i < indices.size(); ++i) {
    if (indices[i] != i) {
      BOOST_LOG_TRIVIAL(error) << "File server: Chunk " << i << " of " << file_id_text << " is missing";
      throw IncompleteFileError("chunk " + std::to_string(i) + " of " + file_id_text + " is missing");
    }
  }

  std::ofstream output(destination, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw store::StoreError("File server: Failed to create file: " + destination.string());
  }

  std::filesystem::path directory = store_.file_directory(*file_id);
  std::size_t total_bytes = 0;
  for (std::size_t chunk_index = 0; chunk_index < indices.size(); ++chunk_index) {
    std::string data = store_.get_chunk(directory, chunk_index);
    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    total_bytes += data.size();
  }

  output.close();
  if (!output) {
    throw store::StoreError("File server: Failed to write file: " + destination.string());
  }

  BOOST_LOG_TRIVIAL(info) << "File server: Wrote " << indices.size() << " chunks (" << total_bytes
                          << " bytes) of " << file_id_text << " to " << destination.string();
}


//==============================================
// SEARCH
//==============================================

std::vector<std::string> FileServer::search(const std::string& query) const {
  return index::search_file(index_, query);
}


//==============================================
// RETRIEVAL FROM NETWORK
//==============================================

std::vector<network::PeerRecord> FileServer::remote_holders(const store::FileId& file_id) const {
  auto holders = index_.lookup(file_id);
  if (!holders) {
    BOOST_LOG_TRIVIAL(error) << "File server: File " << store::to_string(file_id) << " not found in location index";
    throw index::NotFoundInIndexError(store::to_string(file_id));
  }

  std::vector<network::PeerRecord> remote;
  for (const auto& peer : *holders) {
    if (peer != self_) {
      remote.push_back(peer);
    }
  }
  return remote;
}

bool FileServer::fetch_from_holders(const std::vector<network::PeerRecord>& holders, const store::FileId& file_id,
                                    std::size_t chunk_index) {
  for (const auto& holder : holders) {
    try {
      std::string data = client_.fetch_chunk(holder, file_id, chunk_index);
      std::filesystem::path directory = store_.initialize_storage(file_id);
      store_.save_chunk(directory, store::ChunkMetadata{file_id, chunk_index, data.size(), 0}, data);
      return true;
    } catch (const network::NetworkError& e) {
      BOOST_LOG_TRIVIAL(debug) << "File server: " << holder.address << " did not supply chunk " << chunk_index
                               << ": " << e.what();
    }
  }
  return false;
}

std::vector<std::size_t> FileServer::local_chunks(const store::FileId& file_id) const {
  std::filesystem::path directory = store_.file_directory(file_id);
  if (!std::filesystem::is_directory(directory)) {
    return {};
  }
  return store_.list_chunks(directory);
}

} // namespace file_server
} // namespace peerchunks
