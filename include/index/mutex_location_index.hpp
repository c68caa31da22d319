#pragma once

#include <mutex>
#include <unordered_map>
#include <boost/functional/hash.hpp>
#include "index/location_index.hpp"

namespace peerchunks {
namespace index {

// LocationIndex guarded by a single mutex, held for one map operation at a time
class MutexLocationIndex : public LocationIndex {
public:
  MutexLocationIndex() = default;

  // Delete copy operations, the mutex is not copyable
  MutexLocationIndex(const MutexLocationIndex&) = delete;
  MutexLocationIndex& operator=(const MutexLocationIndex&) = delete;


  // ---- LOCATION INDEX INTERFACE ----
  void register_location(const store::FileId& file_id, const network::PeerRecord& peer) override;
  std::optional<std::vector<network::PeerRecord>> lookup(const store::FileId& file_id) const override;
  std::vector<IndexEntry> export_all() const override;
  void merge_all(const std::vector<IndexEntry>& entries) override;
  std::size_t size() const override;

private:
  // ---- PARAMETERS ----
  std::unordered_map<store::FileId, std::vector<network::PeerRecord>, boost::hash<store::FileId>> entries_;
  mutable std::mutex mutex_;

  // Caller must hold mutex_
  bool insert_locked(const store::FileId& file_id, const network::PeerRecord& peer);
};

} // namespace index
} // namespace peerchunks
