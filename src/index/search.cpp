#include "index/location_index.hpp"
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace index {

std::vector<std::string> search_file(const LocationIndex& index, const std::string& query) {
  std::vector<std::string> addresses;

  auto file_id = store::parse_file_id(query);
  if (!file_id) {
    BOOST_LOG_TRIVIAL(warning) << "Search: Invalid file identifier: " << query;
    return addresses;
  }

  auto holders = index.lookup(*file_id);
  if (!holders) {
    BOOST_LOG_TRIVIAL(info) << "Search: File " << query << " not found in location index";
    return addresses;
  }

  for (const auto& peer : *holders) {
    addresses.push_back(peer.address);
  }

  BOOST_LOG_TRIVIAL(info) << "Search: File " << query << " held by " << addresses.size() << " peer(s)";
  return addresses;
}

} // namespace index
} // namespace peerchunks
