#include "replication/replicator.hpp"
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace replication {

Replicator::Replicator(const store::ChunkStore& store, ChunkSender& sender, const network::PeerRecord& self)
  : store_(store)
  , sender_(sender)
  , self_(self) {
  BOOST_LOG_TRIVIAL(info) << "Replicator: Initialized for local peer " << self_.address
                          << " with replication factor " << REPLICATION_FACTOR;
}

//==============================================
// REPLICATION
//==============================================

ReplicationReport Replicator::replicate(const store::FileId& file_id,
                                        const std::vector<network::PeerRecord>& candidates) {
  std::string file_text = store::to_string(file_id);
  std::filesystem::path directory = store_.file_directory(file_id);
  std::vector<std::size_t> indices = store_.list_chunks(directory);
  std::vector<network::PeerRecord> peers = eligible_peers(candidates);

  // All or nothing: no chunk leaves before the peer count is known to suffice
  if (peers.size() < REPLICATION_FACTOR) {
    std::size_t first_index = indices.empty() ? 0 : indices.front();
    BOOST_LOG_TRIVIAL(warning) << "Replicator: Not enough peers to replicate file " << file_text
                               << " (required " << REPLICATION_FACTOR << ", available " << peers.size() << ")";
    throw InsufficientPeersError(REPLICATION_FACTOR, peers.size(), first_index);
  }

  BOOST_LOG_TRIVIAL(info) << "Replicator: Replicating " << indices.size() << " chunks of file "
                          << file_text << " to " << REPLICATION_FACTOR << " peers";

  ReplicationReport report;
  for (std::size_t chunk_index : indices) {
    for (std::size_t i = 0; i < REPLICATION_FACTOR; ++i) {
      const network::PeerRecord& peer = peers[i];
      LedgerKey key(file_id, chunk_index, peer.address);

      if (!reserve(key)) {
        BOOST_LOG_TRIVIAL(debug) << "Replicator: Chunk " << chunk_index << " of file " << file_text
                                 << " already pushed to " << peer.address;
        ++report.skipped;
        continue;
      }

      try {
        sender_.push_chunk(peer, directory, file_id, chunk_index);
        ++report.pushed;
        BOOST_LOG_TRIVIAL(info) << "Replicator: Replicated chunk " << chunk_index << " of file "
                                << file_text << " to " << peer.address;
      } catch (const std::exception& e) {
        release(key);
        ++report.failed;
        BOOST_LOG_TRIVIAL(error) << "Replicator: Failed to push chunk " << chunk_index << " of file "
                                 << file_text << " to " << peer.address << ": " << e.what();
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Replicator: File " << file_text << " done, " << report.pushed << " pushed, "
                          << report.skipped << " skipped, " << report.failed << " failed";
  return report;
}

std::vector<network::PeerRecord> Replicator::eligible_peers(const std::vector<network::PeerRecord>& candidates) const {
  std::vector<network::PeerRecord> peers;
  for (const auto& peer : network::unique_peers(candidates)) {
    if (peer != self_) {
      peers.push_back(peer);
    }
  }
  return peers;
}


//==============================================
// PUSH LEDGER
//==============================================

bool Replicator::reserve(const LedgerKey& key) {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  return ledger_.insert(key).second;
}

void Replicator::release(const LedgerKey& key) {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  ledger_.erase(key);
}

} // namespace replication
} // namespace peerchunks
