#ifndef PEERCHUNKS_INDEX_LOCATION_INDEX_HPP
#define PEERCHUNKS_INDEX_LOCATION_INDEX_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "store/chunk_metadata.hpp"
#include "network/types.hpp"

namespace peerchunks {
namespace index {

// One exported (file, holder) pair as carried in a DHT_RESPONSE line
struct IndexEntry {
    store::FileId file_id;
    std::string address;
};

/**
 * Concurrent map from file identifier to the peers known to hold the file.
 * Implementations make every call atomic. Entries are never removed.
 */
class LocationIndex {
public:
    virtual ~LocationIndex() = default;

    // Adds peer to the holders of file_id, no-op if already present
    virtual void register_location(const store::FileId& file_id, const network::PeerRecord& peer) = 0;

    // Holders in insertion order, nullopt for an unknown file
    virtual std::optional<std::vector<network::PeerRecord>> lookup(const store::FileId& file_id) const = 0;

    // Flattened copy of every (file, address) pair
    virtual std::vector<IndexEntry> export_all() const = 0;

    // Registers every entry as one atomic operation
    virtual void merge_all(const std::vector<IndexEntry>& entries) = 0;

    // Number of known files
    virtual std::size_t size() const = 0;
};

class NotFoundInIndexError : public std::runtime_error {
public:
    explicit NotFoundInIndexError(const std::string& file_id)
        : std::runtime_error("File not found in location index: " + file_id) {}
};

// Looks up a textual identifier; unparsable or unknown identifiers give an empty result
std::vector<std::string> search_file(const LocationIndex& index, const std::string& query);

} // namespace index
} // namespace peerchunks

#endif // PEERCHUNKS_INDEX_LOCATION_INDEX_HPP
