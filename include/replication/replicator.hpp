#ifndef PEERCHUNKS_REPLICATION_REPLICATOR_HPP
#define PEERCHUNKS_REPLICATION_REPLICATOR_HPP

#include <cstddef>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include "replication/chunk_sender.hpp"
#include "store/chunk_store.hpp"

namespace peerchunks {
namespace replication {

// Number of distinct peers every chunk is pushed to
constexpr std::size_t REPLICATION_FACTOR = 2;

class InsufficientPeersError : public std::runtime_error {
public:
  InsufficientPeersError(std::size_t required, std::size_t available, std::size_t chunk_index)
    : std::runtime_error("Insufficient peers for replication of chunk " + std::to_string(chunk_index) +
                         ": required " + std::to_string(required) + ", available " +
                         std::to_string(available))
    , required_(required)
    , available_(available)
    , chunk_index_(chunk_index) {}

  std::size_t required() const { return required_; }
  std::size_t available() const { return available_; }
  std::size_t chunk_index() const { return chunk_index_; }

private:
  std::size_t required_;
  std::size_t available_;
  std::size_t chunk_index_;
};

struct ReplicationReport {
  std::size_t pushed = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
};

class Replicator {
public:
  // Delete copy operations, the ledger is shared by every caller
  Replicator(const Replicator&) = delete;
  Replicator& operator=(const Replicator&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // self is excluded from every candidate list
  Replicator(const store::ChunkStore& store, ChunkSender& sender, const network::PeerRecord& self);


  // ---- REPLICATION ----
  // Pushes every locally stored chunk of file_id to the first REPLICATION_FACTOR eligible peers.
  // Throws InsufficientPeersError before any push when too few peers are eligible.
  ReplicationReport replicate(const store::FileId& file_id, const std::vector<network::PeerRecord>& candidates);

  // Candidates without duplicates and without the local node, in candidate order
  std::vector<network::PeerRecord> eligible_peers(const std::vector<network::PeerRecord>& candidates) const;

private:
  using LedgerKey = std::tuple<store::FileId, std::size_t, std::string>;

  // ---- PARAMETERS ----
  const store::ChunkStore& store_;
  ChunkSender& sender_;
  network::PeerRecord self_;

  // Pushes acknowledged or in flight in this process
  std::set<LedgerKey> ledger_;
  std::mutex ledger_mutex_;

  // Claims a push, false if it was already made or is in progress
  bool reserve(const LedgerKey& key);
  // Drops the claim of a failed push so a later call can retry it
  void release(const LedgerKey& key);
};

} // namespace replication
} // namespace peerchunks

#endif // PEERCHUNKS_REPLICATION_REPLICATOR_HPP
