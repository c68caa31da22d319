#include "network/peer_manager.hpp"
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace network {

PeerManager::PeerManager(SessionContext& context, const std::vector<PeerRecord>& known_peers)
  : context_(context)
  , known_peers_(unique_peers(known_peers)) {
  BOOST_LOG_TRIVIAL(info) << "Peer manager: Initialized with " << known_peers_.size() << " known peers";
}

PeerManager::~PeerManager() {
  shutdown();
}

std::shared_ptr<PeerSession> PeerManager::create_session(boost::asio::ip::tcp::socket socket) {
  reap_closed();

  std::shared_ptr<PeerSession> session;
  std::size_t session_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Each session gets its own immutable copy of the peer list
    session = std::make_shared<PeerSession>(std::move(socket), context_, known_peers_);
    session_id = next_session_id_++;
    sessions_[session_id] = session;
  }

  if (!session->start()) {
    BOOST_LOG_TRIVIAL(error) << "Peer manager: Failed to start session with " << session->remote_address();
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
    return nullptr;
  }

  BOOST_LOG_TRIVIAL(info) << "Peer manager: Added session " << session_id << " with " << session->remote_address();
  return session;
}

std::size_t PeerManager::reap_closed() {
  std::vector<std::shared_ptr<PeerSession>> closed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second->is_closed()) {
        closed.push_back(it->second);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Joining happens outside the lock
  for (auto& session : closed) {
    BOOST_LOG_TRIVIAL(debug) << "Peer manager: Reaping closed session with " << session->remote_address();
    session->stop();
  }
  return closed.size();
}

void PeerManager::add_known_peer(const PeerRecord& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& known : known_peers_) {
    if (known == peer) {
      return;
    }
  }
  known_peers_.push_back(peer);
  BOOST_LOG_TRIVIAL(info) << "Peer manager: Added known peer " << peer.address;
}

std::vector<PeerRecord> PeerManager::known_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return known_peers_;
}

std::vector<std::string> PeerManager::session_addresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> addresses;
  for (const auto& session_pair : sessions_) {
    if (!session_pair.second->is_closed()) {
      addresses.push_back(session_pair.second->remote_address());
    }
  }
  return addresses;
}

std::size_t PeerManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void PeerManager::shutdown() {
  std::map<std::size_t, std::shared_ptr<PeerSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
  }

  if (sessions.empty()) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Peer manager: Initiating shutdown of " << sessions.size() << " sessions";

  for (auto& session_pair : sessions) {
    try {
      session_pair.second->stop();
      BOOST_LOG_TRIVIAL(debug) << "Peer manager: Stopped session " << session_pair.first;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Peer manager: Error stopping session " << session_pair.first
                               << ": " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Peer manager: Shutdown complete";
}

} // namespace network
} // namespace peerchunks
