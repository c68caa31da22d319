#include "index/mutex_location_index.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace index {

//==============================================
// REGISTRATION
//==============================================

void MutexLocationIndex::register_location(const store::FileId& file_id, const network::PeerRecord& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (insert_locked(file_id, peer)) {
    BOOST_LOG_TRIVIAL(info) << "Location index: Registered " << peer.address << " for file "
                            << store::to_string(file_id);
  }
}

void MutexLocationIndex::merge_all(const std::vector<IndexEntry>& entries) {
  std::size_t added = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries) {
      if (insert_locked(entry.file_id, network::PeerRecord{entry.address})) {
        ++added;
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Location index: Merged " << entries.size() << " entries ("
                          << added << " new)";
}

bool MutexLocationIndex::insert_locked(const store::FileId& file_id, const network::PeerRecord& peer) {
  auto& holders = entries_[file_id];
  if (std::find(holders.begin(), holders.end(), peer) != holders.end()) {
    return false;
  }
  holders.push_back(peer);
  return true;
}


//==============================================
// QUERIES
//==============================================

std::optional<std::vector<network::PeerRecord>> MutexLocationIndex::lookup(const store::FileId& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(file_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<IndexEntry> MutexLocationIndex::export_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<IndexEntry> result;
  for (const auto& file_pair : entries_) {
    for (const auto& peer : file_pair.second) {
      result.push_back(IndexEntry{file_pair.first, peer.address});
    }
  }
  return result;
}

std::size_t MutexLocationIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace index
} // namespace peerchunks
