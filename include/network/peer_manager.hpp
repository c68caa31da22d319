#ifndef PEERCHUNKS_PEER_MANAGER_HPP
#define PEERCHUNKS_PEER_MANAGER_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "network/peer_session.hpp"
#include "network/types.hpp"

namespace peerchunks {
namespace network {

class PeerManager {
public:
  // Delete copy constructor and assignment operator
  PeerManager(const PeerManager&) = delete;
  PeerManager& operator=(const PeerManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // known_peers seeds the snapshot handed to every new session
  PeerManager(SessionContext& context, const std::vector<PeerRecord>& known_peers);
  ~PeerManager();


  // ---- SESSION MANAGEMENT ----
  // Takes ownership of a connected socket and starts a session on it
  std::shared_ptr<PeerSession> create_session(boost::asio::ip::tcp::socket socket);
  // Drops sessions whose stream has ended, returns how many were removed
  std::size_t reap_closed();


  // ---- PEER MANAGEMENT ----
  void add_known_peer(const PeerRecord& peer);
  std::vector<PeerRecord> known_peers() const;
  // Remote addresses of live sessions
  std::vector<std::string> session_addresses() const;


  // ---- UTILITY METHODS ----
  std::size_t size() const;
  void shutdown();

private:
  // ---- PARAMETERS ----
  SessionContext& context_;
  std::vector<PeerRecord> known_peers_;

  // Sessions map and access mutex
  std::map<std::size_t, std::shared_ptr<PeerSession>> sessions_;
  std::size_t next_session_id_ = 0;
  mutable std::mutex mutex_;
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_PEER_MANAGER_HPP
