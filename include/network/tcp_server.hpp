#ifndef PEERCHUNKS_NETWORK_TCP_SERVER_HPP
#define PEERCHUNKS_NETWORK_TCP_SERVER_HPP

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "network/peer_manager.hpp"

namespace peerchunks {
namespace network {

// Listener for the node's peer port. Every accepted or dialed socket
// becomes a PeerSession owned by the peer manager.
class TCP_Server {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TCP_Server(const uint16_t port, const std::string& address);
  ~TCP_Server();


  // ---- LISTENER ----
  // Binds the peer port and runs the acceptor on its own io thread
  bool start_listener();
  void shutdown();


  // ---- OUTBOUND SESSIONS ----
  // Dials "host:port" and hands the connected socket to the peer manager
  bool connect(const std::string& remote_address);


  // ---- GETTERS AND SETTERS ----
  void set_peer_manager(PeerManager& peer_manager);
  bool is_running() const { return is_running_; }

private:

  // ---- PARAMETERS ----
  const uint16_t port_;
  const std::string address_;

  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Sockets of every session, accepted or dialed, belong to this context
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Receives every connected socket
  PeerManager* peer_manager_;


  // ---- LISTENER ----
  // Queues one accept, re-armed after each completion
  void start_accept();


  // ---- OUTBOUND SESSIONS ----
  bool dial(const std::string& host, uint16_t port, boost::asio::ip::tcp::socket& socket);
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_TCP_SERVER_HPP
